#include "mcplink/http/streamable_http_session.h"

#include "mcplink/http/sse_parser.h"

#define MCPLINK_LOG_COMPONENT "http.session"
#include "mcplink/logging/log_macros.h"

namespace mcplink {
namespace http {

namespace {

constexpr const char* kSessionIdHeader = "Mcp-Session-Id";
constexpr std::chrono::milliseconds kDeleteTimeout{5000};

class MessageCollector : public SseParserCallbacks {
 public:
  explicit MessageCollector(std::vector<std::string>& out) : out_(out) {}

  void onSseEvent(const SseEvent& event) override {
    if (event.type() == "message" && !event.data.empty()) {
      out_.push_back(event.data);
    }
  }

 private:
  std::vector<std::string>& out_;
};

}  // namespace

std::vector<std::string> extractMessagePayloads(const std::string& content_type,
                                                const std::string& body) {
  std::vector<std::string> payloads;
  if (body.empty()) {
    return payloads;
  }

  if (content_type.find("text/event-stream") != std::string::npos) {
    MessageCollector collector(payloads);
    SseParser parser(&collector);
    parser.parse(body);
    parser.flush();
    return payloads;
  }

  if (content_type.find("application/json") != std::string::npos) {
    payloads.push_back(body);
  }
  return payloads;
}

StreamableHttpSession::StreamableHttpSession(event::Dispatcher& dispatcher,
                                             CurlMultiClient& http,
                                             const Options& options)
    : HttpSessionBase(dispatcher, http, options) {}

void StreamableHttpSession::open(Callbacks callbacks, OpenCallback callback) {
  if (state_ != State::Idle) {
    callback(makeVoidError(
        makeConnectionError(options_.server_id, "session already opened")));
    return;
  }

  MCPLINK_LOG_INFO("[{}] using streamable HTTP endpoint {}",
                   options_.server_id, options_.url);
  callbacks_ = std::move(callbacks);
  open_callback_ = std::move(callback);
  state_ = State::Open;
  finishOpen(makeVoidSuccess());
}

void StreamableHttpSession::postMessage(const json& message,
                                        std::chrono::milliseconds timeout,
                                        PostCallback callback) {
  HttpRequest request = makeRequest(HttpMethod::POST, options_.url);
  request.headers["Content-Type"] = "application/json";
  request.headers["Accept"] = "application/json, text/event-stream";
  if (!session_id_.empty()) {
    request.headers[kSessionIdHeader] = session_id_;
  }
  request.body = message.dump();
  request.timeout = timeout.count() > 0 ? timeout : options_.timeout;

  startTransfer(request, [this, callback](HttpResponse response) {
    onPostResponse(std::move(response), callback);
  });
}

void StreamableHttpSession::onPostResponse(HttpResponse response,
                                           PostCallback callback) {
  if (!response.error.empty()) {
    callback(makeVoidError(makeConnectionError(
        options_.server_id, "POST failed: " + response.error)));
    return;
  }

  if (response.status_code == 404 && !session_id_.empty()) {
    Error error = makeConnectionError(options_.server_id, "session expired",
                                      404);
    handleClosed(error.message);
    callback(makeVoidError(error));
    return;
  }

  if (response.status_code < 200 || response.status_code >= 300) {
    callback(makeVoidError(makeConnectionError(
        options_.server_id, "POST failed: " + describeFailure(response),
        static_cast<int>(response.status_code))));
    return;
  }

  auto session_id = response.header(kSessionIdHeader);
  if (session_id.has_value() && *session_id != session_id_) {
    MCPLINK_LOG_DEBUG("[{}] session id: {}", options_.server_id, *session_id);
    session_id_ = *session_id;
  }

  // 202 Accepted carries no body
  if (response.status_code != 202) {
    const std::string content_type =
        response.header("content-type").value_or("");
    auto payloads = extractMessagePayloads(content_type, response.body);
    if (payloads.empty() && !response.body.empty()) {
      MCPLINK_LOG_WARNING("[{}] ignoring response body of type '{}'",
                          options_.server_id, content_type);
    }
    for (const auto& payload : payloads) {
      if (state_ == State::Closed) {
        break;
      }
      handleMessageText(payload);
    }
  }

  callback(makeVoidSuccess());
}

void StreamableHttpSession::onClose() {
  if (session_id_.empty()) {
    return;
  }

  // Best effort; the session object may be gone when the reply arrives
  HttpRequest request = makeRequest(HttpMethod::DELETE, options_.url);
  request.headers[kSessionIdHeader] = session_id_;
  request.timeout = kDeleteTimeout;

  const std::string server_id = options_.server_id;
  http_.send(request, [server_id](HttpResponse response) {
    MCPLINK_LOG_DEBUG("[{}] session DELETE: {}", server_id,
                      response.error.empty()
                          ? "HTTP " + std::to_string(response.status_code)
                          : response.error);
  });
  session_id_.clear();
}

}  // namespace http
}  // namespace mcplink
