#ifndef MCPLINK_HTTP_HTTP_SESSION_BASE_H
#define MCPLINK_HTTP_HTTP_SESSION_BASE_H

#include <chrono>
#include <functional>
#include <string>
#include <unordered_set>

#include "mcplink/event/event_loop.h"
#include "mcplink/http/curl_multi_client.h"
#include "mcplink/protocol/jsonrpc.h"
#include "mcplink/protocol/request_tracker.h"
#include "mcplink/transport/mcp_session.h"

namespace mcplink {
namespace http {

/**
 * JSON-RPC plumbing shared by the HTTP transports.
 *
 * Subclasses decide how a message reaches the server (postMessage) and
 * feed whatever comes back into handleMessage(). Correlation, request
 * deadlines, answering server pings, and the close/closed contract of
 * McpSession live here.
 */
class HttpSessionBase : public transport::McpSession {
 public:
  struct Options {
    std::string server_id;
    std::string url;
    HeaderMap headers;
    // Bounds open() and transfers without a request deadline
    std::chrono::milliseconds timeout{30000};
  };

  HttpSessionBase(event::Dispatcher& dispatcher,
                  CurlMultiClient& http,
                  const Options& options);
  ~HttpSessionBase() override;

  void request(const std::string& method,
               const json& params,
               std::chrono::milliseconds timeout,
               RequestCallback callback) override;

  void notify(const std::string& method, const json& params) override;

  void close() override;

  size_t pendingRequests() const { return tracker_.pendingCount(); }

 protected:
  enum class State { Idle, Opening, Open, Closed };

  // Delivery of one outgoing message; the callback reports only whether the
  // server accepted it
  using PostCallback = std::function<void(VoidResult)>;
  virtual void postMessage(const json& message,
                           std::chrono::milliseconds timeout,
                           PostCallback callback) = 0;

  // Transport specific teardown run by close()
  virtual void onClose() {}

  void handleMessage(const json& message);
  // Parses text as JSON first; malformed payloads are logged and dropped
  void handleMessageText(const std::string& text);

  // The channel died on its own
  void handleClosed(const std::string& cause);

  void finishOpen(VoidResult result);

  // Transfers are tracked so close() can cancel every one of them
  CurlMultiClient::TransferId startTransfer(
      const HttpRequest& request,
      std::function<void(HttpResponse)> callback);
  void cancelTransfers();

  HttpRequest makeRequest(HttpMethod method, const std::string& url) const;

  static std::string describeFailure(const HttpResponse& response);

  event::Dispatcher& dispatcher_;
  CurlMultiClient& http_;
  const Options options_;

  State state_{State::Idle};
  bool close_requested_{false};
  Callbacks callbacks_;
  OpenCallback open_callback_;

 private:
  void handleRequest(const jsonrpc::Request& request);
  void handleResponse(const jsonrpc::Response& response);

  protocol::RequestTracker tracker_;
  std::unordered_set<CurlMultiClient::TransferId> transfers_;
};

}  // namespace http
}  // namespace mcplink

#endif  // MCPLINK_HTTP_HTTP_SESSION_BASE_H
