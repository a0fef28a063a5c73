#include "mcplink/http/sse_session.h"

#define MCPLINK_LOG_COMPONENT "http.session"
#include "mcplink/logging/log_macros.h"

namespace mcplink {
namespace http {

std::string resolveEndpointUrl(const std::string& base,
                               const std::string& reference) {
  if (reference.find("://") != std::string::npos) {
    return reference;
  }

  const size_t scheme_end = base.find("://");
  if (scheme_end == std::string::npos) {
    return reference;
  }
  const std::string scheme = base.substr(0, scheme_end);

  if (reference.compare(0, 2, "//") == 0) {
    return scheme + ":" + reference;
  }

  const size_t authority_start = scheme_end + 3;
  size_t path_start = base.find_first_of("/?#", authority_start);
  const std::string origin = base.substr(0, path_start);

  if (!reference.empty() && reference[0] == '/') {
    return origin + reference;
  }

  // Path-relative: replace the last segment of the base path
  std::string path;
  if (path_start != std::string::npos && base[path_start] == '/') {
    size_t path_end = base.find_first_of("?#", path_start);
    path = base.substr(path_start, path_end == std::string::npos
                                       ? std::string::npos
                                       : path_end - path_start);
  }
  size_t last_slash = path.rfind('/');
  std::string directory =
      last_slash == std::string::npos ? "/" : path.substr(0, last_slash + 1);

  if (!reference.empty() && reference[0] == '?') {
    return origin + (path.empty() ? "/" : path) + reference;
  }
  return origin + directory + reference;
}

SseSession::SseSession(event::Dispatcher& dispatcher,
                       CurlMultiClient& http,
                       const Options& options)
    : HttpSessionBase(dispatcher, http, options), parser_(this) {
  open_timer_ = dispatcher_.createTimer([this]() { onOpenTimeout(); });
}

SseSession::~SseSession() {
  open_timer_->disableTimer();
  if (stream_active_) {
    http_.cancel(stream_id_);
  }
}

void SseSession::open(Callbacks callbacks, OpenCallback callback) {
  if (state_ != State::Idle) {
    callback(makeVoidError(
        makeConnectionError(options_.server_id, "session already opened")));
    return;
  }

  callbacks_ = std::move(callbacks);
  open_callback_ = std::move(callback);
  state_ = State::Opening;

  MCPLINK_LOG_INFO("[{}] opening SSE stream {}", options_.server_id,
                   options_.url);

  HttpRequest request = makeRequest(HttpMethod::GET, options_.url);
  request.headers["Accept"] = "text/event-stream";
  request.headers["Cache-Control"] = "no-cache";

  CurlMultiClient::StreamCallbacks stream_callbacks;
  stream_callbacks.on_headers = [this](const HttpResponse& response) {
    onStreamHeaders(response);
  };
  stream_callbacks.on_data = [this](const char* data, size_t length) {
    parser_.parse(data, length);
  };
  stream_callbacks.on_complete = [this](HttpResponse response) {
    onStreamComplete(std::move(response));
  };

  stream_id_ = http_.stream(request, std::move(stream_callbacks));
  stream_active_ = true;
  open_timer_->enableTimer(options_.timeout);
}

void SseSession::postMessage(const json& message,
                             std::chrono::milliseconds timeout,
                             PostCallback callback) {
  HttpRequest request = makeRequest(HttpMethod::POST, endpoint_url_);
  request.headers["Content-Type"] = "application/json";
  request.body = message.dump();
  request.timeout = timeout.count() > 0 ? timeout : options_.timeout;

  const std::string server_id = options_.server_id;
  startTransfer(request, [server_id, callback](HttpResponse response) {
    if (!response.ok()) {
      callback(makeVoidError(makeConnectionError(
          server_id, "POST failed: " + describeFailure(response),
          static_cast<int>(response.status_code))));
      return;
    }
    // The reply itself arrives on the event stream
    callback(makeVoidSuccess());
  });
}

void SseSession::onClose() {
  open_timer_->disableTimer();
  if (stream_active_) {
    stream_active_ = false;
    http_.cancel(stream_id_);
  }
}

void SseSession::onStreamHeaders(const HttpResponse& response) {
  if (response.status_code < 200 || response.status_code >= 300) {
    // The body of an error reply is not an event stream
    stream_active_ = false;
    http_.cancel(stream_id_);
    open_timer_->disableTimer();
    handleClosed("event stream rejected: HTTP " +
                 std::to_string(response.status_code));
    return;
  }

  auto content_type = response.header("content-type");
  if (!content_type.has_value() ||
      content_type->find("text/event-stream") == std::string::npos) {
    MCPLINK_LOG_WARNING("[{}] unexpected content type '{}' on SSE stream",
                        options_.server_id, content_type.value_or(""));
  }
}

void SseSession::onStreamComplete(HttpResponse response) {
  stream_active_ = false;
  open_timer_->disableTimer();
  parser_.flush();
  if (state_ == State::Closed) {
    return;
  }

  if (!response.error.empty()) {
    handleClosed("event stream failed: " + response.error);
  } else if (response.status_code < 200 || response.status_code >= 300) {
    handleClosed("event stream rejected: HTTP " +
                 std::to_string(response.status_code));
  } else {
    handleClosed("event stream closed");
  }
}

void SseSession::onOpenTimeout() {
  if (state_ != State::Opening) {
    return;
  }
  handleClosed("no endpoint event within " +
               std::to_string(options_.timeout.count()) + "ms");
}

void SseSession::onSseEvent(const SseEvent& event) {
  if (state_ == State::Closed) {
    return;
  }

  const std::string& type = event.type();
  if (type == "endpoint") {
    if (state_ != State::Opening) {
      MCPLINK_LOG_DEBUG("[{}] ignoring repeated endpoint event",
                        options_.server_id);
      return;
    }
    endpoint_url_ = resolveEndpointUrl(options_.url, event.data);
    MCPLINK_LOG_DEBUG("[{}] message endpoint: {}", options_.server_id,
                      endpoint_url_);
    open_timer_->disableTimer();
    state_ = State::Open;
    finishOpen(makeVoidSuccess());
    return;
  }

  if (type == "message") {
    if (state_ != State::Open) {
      MCPLINK_LOG_WARNING("[{}] message before endpoint event dropped",
                          options_.server_id);
      return;
    }
    handleMessageText(event.data);
    return;
  }

  MCPLINK_LOG_DEBUG("[{}] ignoring SSE event '{}'", options_.server_id, type);
}

void SseSession::onSseComment(const std::string& /*comment*/) {
  // Keep-alives carry no information
}

}  // namespace http
}  // namespace mcplink
