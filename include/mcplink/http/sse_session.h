#ifndef MCPLINK_HTTP_SSE_SESSION_H
#define MCPLINK_HTTP_SSE_SESSION_H

#include <string>

#include "mcplink/http/http_session_base.h"
#include "mcplink/http/sse_parser.h"

namespace mcplink {
namespace http {

/**
 * Resolve the endpoint announced by an SSE server against the stream URL.
 *
 * Absolute URLs are returned unchanged; scheme-relative, host-relative and
 * path-relative references are resolved the way a browser would. Query and
 * fragment of the base are dropped.
 */
std::string resolveEndpointUrl(const std::string& base,
                               const std::string& reference);

/**
 * The HTTP+SSE transport (protocol revision 2024-11-05).
 *
 * open() issues GET url and waits for the "endpoint" event that names the
 * URL messages must be POSTed to. Responses and server notifications come
 * back as "message" events on the stream. When the stream ends or fails
 * the session is closed.
 */
class SseSession : public HttpSessionBase,
                   private SseParserCallbacks {
 public:
  SseSession(event::Dispatcher& dispatcher,
             CurlMultiClient& http,
             const Options& options);
  ~SseSession() override;

  void open(Callbacks callbacks, OpenCallback callback) override;

  const std::string& endpointUrl() const { return endpoint_url_; }

 protected:
  void postMessage(const json& message,
                   std::chrono::milliseconds timeout,
                   PostCallback callback) override;
  void onClose() override;

 private:
  // SseParserCallbacks
  void onSseEvent(const SseEvent& event) override;
  void onSseComment(const std::string& comment) override;

  void onStreamHeaders(const HttpResponse& response);
  void onStreamComplete(HttpResponse response);
  void onOpenTimeout();

  SseParser parser_;
  std::string endpoint_url_;
  CurlMultiClient::TransferId stream_id_{0};
  bool stream_active_{false};
  event::TimerPtr open_timer_;
};

}  // namespace http
}  // namespace mcplink

#endif  // MCPLINK_HTTP_SSE_SESSION_H
