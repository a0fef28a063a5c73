#include "mcplink/transport/stdio_session.h"

#include <signal.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

#define MCPLINK_LOG_COMPONENT "transport.stdio"
#include "mcplink/logging/log_macros.h"

namespace mcplink {
namespace transport {

namespace {

constexpr size_t kReadChunkSize = 64 * 1024;
constexpr uint32_t kReadEvents = static_cast<uint32_t>(event::FileReadyType::Read);
constexpr uint32_t kWriteEvents =
    static_cast<uint32_t>(event::FileReadyType::Write);

}  // namespace

StdioSession::StdioSession(event::Dispatcher& dispatcher,
                           const std::string& server_id,
                           const StdioParams& params,
                           std::chrono::milliseconds startup_timeout)
    : dispatcher_(dispatcher),
      server_id_(server_id),
      params_(params),
      startup_timeout_(startup_timeout),
      tracker_(dispatcher) {}

StdioSession::~StdioSession() {
  callbacks_ = Callbacks();
  open_callback_ = nullptr;
  stopWatching();
  // ChildProcess kills and reaps whatever is still running
}

void StdioSession::open(Callbacks callbacks, OpenCallback callback) {
  if (state_ != State::Idle) {
    callback(makeVoidError(
        makeConnectionError(server_id_, "session already opened")));
    return;
  }

  callbacks_ = std::move(callbacks);
  open_callback_ = std::move(callback);
  state_ = State::Spawning;

  ChildProcess::Options options;
  options.command = params_.command;
  options.args = params_.args;
  options.env = params_.env;

  MCPLINK_LOG_INFO("[{}] starting MCP server process: {}", server_id_,
                   params_.command);

  auto spawned = process_.spawn(options);
  if (is_error(spawned)) {
    state_ = State::Closed;
    finishOpen(makeVoidError(makeConnectionError(
        server_id_, "failed to start '" + params_.command +
                        "': " + get_error(spawned)->message)));
    return;
  }

  status_event_ = dispatcher_.createFileEvent(
      process_.statusFd(), [this](uint32_t) { onStatusReady(); },
      event::FileTriggerType::Level, kReadEvents);
  stdout_event_ = dispatcher_.createFileEvent(
      process_.stdoutFd(), [this](uint32_t) { onStdoutReady(); },
      event::FileTriggerType::Level, kReadEvents);
  stderr_event_ = dispatcher_.createFileEvent(
      process_.stderrFd(), [this](uint32_t) { onStderrReady(); },
      event::FileTriggerType::Level, kReadEvents);
  stdin_event_ = dispatcher_.createFileEvent(
      process_.stdinFd(), [this](uint32_t) { flushWrites(); },
      event::FileTriggerType::Level, 0);

  startup_timer_ = dispatcher_.createTimer([this]() { onStartupTimeout(); });
  startup_timer_->enableTimer(startup_timeout_);
}

void StdioSession::request(const std::string& method,
                           const json& params,
                           std::chrono::milliseconds timeout,
                           RequestCallback callback) {
  if (state_ != State::Open) {
    callback(makeError<json>(makeConnectionError(server_id_, "not connected")));
    return;
  }

  int64_t id = tracker_.nextId();
  tracker_.track(id, method, timeout, std::move(callback));
  sendMessage(jsonrpc::toJson(jsonrpc::Request(id, method, params)));
}

void StdioSession::notify(const std::string& method, const json& params) {
  if (state_ != State::Open) {
    MCPLINK_LOG_DEBUG("[{}] dropping notification '{}' on closed session",
                      server_id_, method);
    return;
  }
  sendMessage(jsonrpc::toJson(jsonrpc::Notification(method, params)));
}

void StdioSession::close() {
  close_requested_ = true;
  if (state_ == State::Closed) {
    return;
  }
  state_ = State::Closed;
  open_callback_ = nullptr;

  stopWatching();

  // Orderly end of input first, then make sure the process is gone
  process_.closeStdin();
  process_.kill(SIGKILL);
  auto status = process_.reap(true);
  if (status.has_value()) {
    MCPLINK_LOG_INFO("[{}] MCP server process {} {}", server_id_,
                     process_.pid(),
                     ChildProcess::describeExitStatus(*status));
  }

  tracker_.failAll(makeConnectionError(server_id_, "connection closed"));
  callbacks_ = Callbacks();
}

void StdioSession::onStatusReady() {
  auto exec_status = process_.readExecStatus();
  if (!exec_status.has_value()) {
    return;
  }
  status_event_->setEnabled(0);

  if (state_ != State::Spawning) {
    return;
  }

  if (*exec_status != 0) {
    std::string cause = "failed to start '" + params_.command +
                        "': " + strerror(*exec_status);
    MCPLINK_LOG_ERROR("[{}] {}", server_id_, cause);
    handleExit(cause);
    return;
  }

  MCPLINK_LOG_DEBUG("[{}] MCP server process {} started", server_id_,
                    process_.pid());
  state_ = State::Open;
  startup_timer_->disableTimer();
  finishOpen(makeVoidSuccess());
}

void StdioSession::onStartupTimeout() {
  if (state_ != State::Spawning) {
    return;
  }
  handleExit("process did not start within " +
             std::to_string(startup_timeout_.count()) + "ms");
}

void StdioSession::onStdoutReady() {
  char buffer[kReadChunkSize];

  while (state_ != State::Closed) {
    ssize_t n = ::read(process_.stdoutFd(), buffer, sizeof(buffer));
    if (n > 0) {
      auto lines = stdout_framer_.feed(buffer, static_cast<size_t>(n));
      for (const auto& line : lines) {
        handleLine(line);
        if (state_ == State::Closed) {
          return;
        }
      }
      continue;
    }
    if (n == 0) {
      handleExit("process exited unexpectedly");
      return;
    }
    if (errno == EINTR) {
      continue;
    }
    if (errno == EAGAIN || errno == EWOULDBLOCK) {
      return;
    }
    handleExit(std::string("error reading from process: ") + strerror(errno));
    return;
  }
}

void StdioSession::onStderrReady() {
  char buffer[kReadChunkSize];

  for (;;) {
    ssize_t n = ::read(process_.stderrFd(), buffer, sizeof(buffer));
    if (n > 0) {
      for (const auto& line :
           stderr_framer_.feed(buffer, static_cast<size_t>(n))) {
        MCPLINK_LOG_DEBUG("[{}] stderr: {}", server_id_, line);
      }
      continue;
    }
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      return;
    }
    // EOF or error; stdout decides when the process is gone
    stderr_event_->setEnabled(0);
    return;
  }
}

void StdioSession::handleLine(const std::string& line) {
  auto parsed = jsonrpc::parseMessage(line);
  if (is_error(parsed)) {
    MCPLINK_LOG_WARNING("[{}] dropping malformed message ({}): {}", server_id_,
                        get_error(parsed)->message,
                        line.substr(0, 200));
    return;
  }

  match(
      *get_value(parsed),
      [this](const jsonrpc::Request& request) { handleRequest(request); },
      [this](const jsonrpc::Response& response) { handleResponse(response); },
      [this](const jsonrpc::Notification& notification) {
        MCPLINK_LOG_DEBUG("[{}] notification: {}", server_id_,
                          notification.method);
        if (callbacks_.on_notification) {
          callbacks_.on_notification(
              notification.method,
              notification.params.value_or(json::object()));
        }
      });
}

void StdioSession::handleRequest(const jsonrpc::Request& request) {
  if (request.method == "ping") {
    sendMessage(jsonrpc::toJson(
        jsonrpc::Response::success(request.id, json::object())));
    return;
  }

  MCPLINK_LOG_DEBUG("[{}] rejecting server request '{}'", server_id_,
                    request.method);
  sendMessage(jsonrpc::toJson(jsonrpc::Response::make_error(
      request.id, jsonrpc::ResponseError(jsonrpc::METHOD_NOT_FOUND,
                                         "Method not found: " +
                                             request.method))));
}

void StdioSession::handleResponse(const jsonrpc::Response& response) {
  const int64_t* id = get_if<int64_t>(&response.id);
  if (!id) {
    MCPLINK_LOG_DEBUG("[{}] ignoring response with foreign id '{}'",
                      server_id_, jsonrpc::requestIdToString(response.id));
    return;
  }

  if (response.error.has_value()) {
    tracker_.complete(*id, makeError<json>(jsonrpc::toError(*response.error)));
  } else {
    tracker_.complete(*id, response.result.value_or(json::object()));
  }
}

void StdioSession::sendMessage(const json& message) {
  write_buffer_ += protocol::LineFramer::frame(message);
  flushWrites();
}

void StdioSession::flushWrites() {
  while (!write_buffer_.empty() && state_ == State::Open) {
    ssize_t n = ::write(process_.stdinFd(), write_buffer_.data(),
                        write_buffer_.size());
    if (n > 0) {
      write_buffer_.erase(0, static_cast<size_t>(n));
      continue;
    }
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      stdin_event_->setEnabled(kWriteEvents);
      return;
    }
    handleExit(std::string("error writing to process: ") + strerror(errno));
    return;
  }

  if (stdin_event_) {
    stdin_event_->setEnabled(0);
  }
}

void StdioSession::handleExit(const std::string& cause) {
  if (state_ == State::Closed) {
    return;
  }
  const bool was_open = state_ == State::Open;
  state_ = State::Closed;

  stopWatching();
  write_buffer_.clear();

  process_.closeStdin();
  auto status = process_.reap(false);
  if (!status.has_value()) {
    // stdout is gone but the process lingers; it is of no further use
    process_.kill(SIGKILL);
    status = process_.reap(true);
  }
  if (status.has_value()) {
    MCPLINK_LOG_WARNING("[{}] MCP server process {} {}", server_id_,
                        process_.pid(),
                        ChildProcess::describeExitStatus(*status));
  }

  Error error = makeConnectionError(server_id_, cause);

  if (!was_open) {
    // A failed exec also closes stdout; prefer the errno the child reported
    auto exec_status = process_.readExecStatus();
    if (exec_status.has_value() && *exec_status != 0) {
      error = makeConnectionError(server_id_,
                                  "failed to start '" + params_.command +
                                      "': " + strerror(*exec_status));
    }
    finishOpen(makeVoidError(error));
    callbacks_ = Callbacks();
    return;
  }

  // The owner hears of the exit before any pending caller does, so a
  // rejected caller already sees the connection as gone
  auto on_closed = std::move(callbacks_.on_closed);
  callbacks_ = Callbacks();
  if (!close_requested_ && on_closed) {
    on_closed(error);
  }
  tracker_.failAll(error);
}

void StdioSession::finishOpen(VoidResult result) {
  if (!open_callback_) {
    return;
  }
  OpenCallback callback = std::move(open_callback_);
  open_callback_ = nullptr;
  callback(std::move(result));
}

void StdioSession::stopWatching() {
  // Events are disabled rather than destroyed since this may run inside one
  // of their callbacks; they are freed with the session
  for (auto* file_event :
       {&status_event_, &stdout_event_, &stderr_event_, &stdin_event_}) {
    if (*file_event) {
      (*file_event)->setEnabled(0);
    }
  }
  if (startup_timer_) {
    startup_timer_->disableTimer();
  }
}

}  // namespace transport
}  // namespace mcplink
