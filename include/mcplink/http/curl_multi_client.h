#ifndef MCPLINK_HTTP_CURL_MULTI_CLIENT_H
#define MCPLINK_HTTP_CURL_MULTI_CLIENT_H

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "mcplink/event/event_loop.h"
#include "mcplink/types.h"

/**
 * @file curl_multi_client.h
 * @brief Non-blocking HTTP client driven by the dispatcher
 */

namespace mcplink {
namespace http {

/**
 * @brief HTTP request method
 */
enum class HttpMethod { GET, POST, DELETE };

const char* toString(HttpMethod method);

/**
 * @brief HTTP response structure
 */
struct HttpResponse {
  long status_code{0};                 // 0 when no response was received
  HeaderMap headers;                   // Names lower-cased
  std::string body;                    // Empty for streamed transfers
  std::string error;                   // Transport failure, empty on success
  std::chrono::milliseconds latency{0};

  bool ok() const { return error.empty() && status_code >= 200 && status_code < 300; }

  // Header lookup by lower-case name
  optional<std::string> header(const std::string& name) const;
};

/**
 * @brief HTTP request configuration
 */
struct HttpRequest {
  std::string url;
  HttpMethod method{HttpMethod::GET};
  HeaderMap headers;
  std::string body;
  // Total transfer deadline; zero means unbounded (streams)
  std::chrono::milliseconds timeout{0};
  bool follow_redirects{true};
};

/**
 * @brief HTTP client on libcurl's multi interface
 *
 * Sockets and the curl timeout are mapped onto dispatcher file events and a
 * timer, so transfers make progress while the dispatcher runs and never
 * block it. Every method must be called on the dispatcher thread; every
 * callback is invoked there.
 *
 * A cancelled transfer never invokes any of its callbacks, including when
 * cancel() is called from inside one of them.
 */
class CurlMultiClient {
 public:
  using TransferId = uint64_t;
  using ResponseCallback = std::function<void(HttpResponse)>;

  struct StreamCallbacks {
    // Final status line and headers, before the first body chunk
    std::function<void(const HttpResponse&)> on_headers;
    std::function<void(const char* data, size_t length)> on_data;
    // Transfer ended: error set on failure, headers and status as received
    std::function<void(HttpResponse)> on_complete;
  };

  struct Config {
    std::chrono::milliseconds connect_timeout{10000};
    std::string user_agent{"mcplink/1.0"};
  };

  CurlMultiClient(event::Dispatcher& dispatcher, const Config& config);
  ~CurlMultiClient();

  /**
   * @brief Buffered request, the whole body is delivered on completion
   */
  TransferId send(const HttpRequest& request, ResponseCallback callback);

  /**
   * @brief Streaming request, body chunks are delivered as they arrive
   */
  TransferId stream(const HttpRequest& request, StreamCallbacks callbacks);

  /**
   * @brief Abort a transfer. Unknown or finished ids are ignored.
   */
  void cancel(TransferId id);

  size_t activeTransfers() const;

 private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

using CurlMultiClientPtr = std::unique_ptr<CurlMultiClient>;

}  // namespace http
}  // namespace mcplink

#endif  // MCPLINK_HTTP_CURL_MULTI_CLIENT_H
