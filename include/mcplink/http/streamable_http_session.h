#ifndef MCPLINK_HTTP_STREAMABLE_HTTP_SESSION_H
#define MCPLINK_HTTP_STREAMABLE_HTTP_SESSION_H

#include <string>
#include <vector>

#include "mcplink/http/http_session_base.h"

namespace mcplink {
namespace http {

/**
 * Split a POST response body into JSON-RPC payloads.
 *
 * application/json bodies are returned whole (one message or a batch);
 * text/event-stream bodies yield the data of every "message" event. Other
 * content types yield nothing.
 */
std::vector<std::string> extractMessagePayloads(const std::string& content_type,
                                                const std::string& body);

/**
 * The streamable HTTP transport.
 *
 * Every message is POSTed to the one endpoint URL and the reply, if any,
 * comes back in the POST response. The server may assign a session with
 * the Mcp-Session-Id header; it is echoed on every later request and a
 * 404 while it is set means the server dropped the session. close() ends
 * the session on the server with a best-effort DELETE.
 */
class StreamableHttpSession : public HttpSessionBase {
 public:
  StreamableHttpSession(event::Dispatcher& dispatcher,
                        CurlMultiClient& http,
                        const Options& options);

  // Nothing to establish before the first message
  void open(Callbacks callbacks, OpenCallback callback) override;

  const std::string& sessionId() const { return session_id_; }

 protected:
  void postMessage(const json& message,
                   std::chrono::milliseconds timeout,
                   PostCallback callback) override;
  void onClose() override;

 private:
  void onPostResponse(HttpResponse response, PostCallback callback);

  std::string session_id_;
};

}  // namespace http
}  // namespace mcplink

#endif  // MCPLINK_HTTP_STREAMABLE_HTTP_SESSION_H
