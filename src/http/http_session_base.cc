#include "mcplink/http/http_session_base.h"

#include <memory>

#define MCPLINK_LOG_COMPONENT "http.session"
#include "mcplink/logging/log_macros.h"

namespace mcplink {
namespace http {

HttpSessionBase::HttpSessionBase(event::Dispatcher& dispatcher,
                                 CurlMultiClient& http,
                                 const Options& options)
    : dispatcher_(dispatcher),
      http_(http),
      options_(options),
      tracker_(dispatcher) {}

HttpSessionBase::~HttpSessionBase() {
  callbacks_ = Callbacks();
  open_callback_ = nullptr;
  cancelTransfers();
}

void HttpSessionBase::request(const std::string& method,
                              const json& params,
                              std::chrono::milliseconds timeout,
                              RequestCallback callback) {
  if (state_ != State::Open) {
    callback(makeError<json>(
        makeConnectionError(options_.server_id, "not connected")));
    return;
  }

  const int64_t id = tracker_.nextId();
  tracker_.track(id, method, timeout, std::move(callback));
  postMessage(jsonrpc::toJson(jsonrpc::Request(id, method, params)), timeout,
              [this, id, method](VoidResult result) {
                if (is_error(result)) {
                  Error error = *get_error(result);
                  MCPLINK_LOG_WARNING("[{}] request '{}' failed: {}",
                                      options_.server_id, method,
                                      error.message);
                  tracker_.complete(id, makeError<json>(error));
                }
              });
}

void HttpSessionBase::notify(const std::string& method, const json& params) {
  if (state_ != State::Open) {
    MCPLINK_LOG_DEBUG("[{}] dropping notification '{}' on closed session",
                      options_.server_id, method);
    return;
  }
  postMessage(jsonrpc::toJson(jsonrpc::Notification(method, params)),
              options_.timeout, [this, method](VoidResult result) {
                if (is_error(result)) {
                  MCPLINK_LOG_WARNING("[{}] notification '{}' failed: {}",
                                      options_.server_id, method,
                                      get_error(result)->message);
                }
              });
}

void HttpSessionBase::close() {
  close_requested_ = true;
  if (state_ == State::Closed) {
    return;
  }
  state_ = State::Closed;
  open_callback_ = nullptr;

  cancelTransfers();
  onClose();

  tracker_.failAll(makeConnectionError(options_.server_id, "connection closed"));
  callbacks_ = Callbacks();
}

void HttpSessionBase::handleClosed(const std::string& cause) {
  if (state_ == State::Closed) {
    return;
  }
  const bool was_open = state_ == State::Open;
  state_ = State::Closed;
  cancelTransfers();

  Error error = makeConnectionError(options_.server_id, cause);
  MCPLINK_LOG_WARNING("[{}] session closed: {}", options_.server_id, cause);

  if (!was_open) {
    finishOpen(makeVoidError(error));
    callbacks_ = Callbacks();
    return;
  }

  // on_closed first: pending callers must observe a closed connection
  auto on_closed = std::move(callbacks_.on_closed);
  callbacks_ = Callbacks();
  if (!close_requested_ && on_closed) {
    on_closed(error);
  }
  tracker_.failAll(error);
}

void HttpSessionBase::finishOpen(VoidResult result) {
  if (!open_callback_) {
    return;
  }
  OpenCallback callback = std::move(open_callback_);
  open_callback_ = nullptr;
  callback(std::move(result));
}

void HttpSessionBase::handleMessageText(const std::string& text) {
  json message;
  try {
    message = json::parse(text);
  } catch (const json::parse_error& e) {
    MCPLINK_LOG_WARNING("[{}] dropping malformed message ({}): {}",
                        options_.server_id, e.what(), text.substr(0, 200));
    return;
  }
  handleMessage(message);
}

void HttpSessionBase::handleMessage(const json& message) {
  // Batches arrive as arrays
  if (message.is_array()) {
    for (const auto& item : message) {
      if (state_ == State::Closed) {
        return;
      }
      handleMessage(item);
    }
    return;
  }

  auto parsed = jsonrpc::parseMessage(message);
  if (is_error(parsed)) {
    MCPLINK_LOG_WARNING("[{}] dropping invalid message: {}",
                        options_.server_id, get_error(parsed)->message);
    return;
  }

  match(
      *get_value(parsed),
      [this](const jsonrpc::Request& request) { handleRequest(request); },
      [this](const jsonrpc::Response& response) { handleResponse(response); },
      [this](const jsonrpc::Notification& notification) {
        MCPLINK_LOG_DEBUG("[{}] notification: {}", options_.server_id,
                          notification.method);
        if (callbacks_.on_notification) {
          callbacks_.on_notification(
              notification.method,
              notification.params.value_or(json::object()));
        }
      });
}

void HttpSessionBase::handleRequest(const jsonrpc::Request& request) {
  json reply;
  if (request.method == "ping") {
    reply = jsonrpc::toJson(
        jsonrpc::Response::success(request.id, json::object()));
  } else {
    MCPLINK_LOG_DEBUG("[{}] rejecting server request '{}'", options_.server_id,
                      request.method);
    reply = jsonrpc::toJson(jsonrpc::Response::make_error(
        request.id, jsonrpc::ResponseError(
                        jsonrpc::METHOD_NOT_FOUND,
                        "Method not found: " + request.method)));
  }

  if (state_ != State::Open) {
    return;
  }
  postMessage(reply, options_.timeout, [this](VoidResult result) {
    if (is_error(result)) {
      MCPLINK_LOG_DEBUG("[{}] reply to server request failed: {}",
                        options_.server_id, get_error(result)->message);
    }
  });
}

void HttpSessionBase::handleResponse(const jsonrpc::Response& response) {
  const int64_t* id = get_if<int64_t>(&response.id);
  if (!id) {
    MCPLINK_LOG_DEBUG("[{}] ignoring response with foreign id '{}'",
                      options_.server_id,
                      jsonrpc::requestIdToString(response.id));
    return;
  }

  if (response.error.has_value()) {
    tracker_.complete(*id, makeError<json>(jsonrpc::toError(*response.error)));
  } else {
    tracker_.complete(*id, response.result.value_or(json::object()));
  }
}

CurlMultiClient::TransferId HttpSessionBase::startTransfer(
    const HttpRequest& request,
    std::function<void(HttpResponse)> callback) {
  // The id is only known after send() returns, so the callback looks it up
  // through a shared slot
  auto slot = std::make_shared<CurlMultiClient::TransferId>(0);
  CurlMultiClient::TransferId id = http_.send(
      request, [this, slot, callback](HttpResponse response) {
        transfers_.erase(*slot);
        callback(std::move(response));
      });
  *slot = id;
  transfers_.insert(id);
  return id;
}

void HttpSessionBase::cancelTransfers() {
  std::unordered_set<CurlMultiClient::TransferId> transfers;
  transfers.swap(transfers_);
  for (auto id : transfers) {
    http_.cancel(id);
  }
}

HttpRequest HttpSessionBase::makeRequest(HttpMethod method,
                                         const std::string& url) const {
  HttpRequest request;
  request.method = method;
  request.url = url;
  request.headers = options_.headers;
  return request;
}

std::string HttpSessionBase::describeFailure(const HttpResponse& response) {
  if (!response.error.empty()) {
    return response.error;
  }
  std::string text = "HTTP " + std::to_string(response.status_code);
  if (!response.body.empty()) {
    text += ": " + response.body.substr(0, 200);
  }
  return text;
}

}  // namespace http
}  // namespace mcplink
