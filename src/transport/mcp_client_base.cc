#include "mcplink/transport/mcp_client_base.h"

#include "mcplink/json.h"
#include "mcplink/protocol/jsonrpc.h"

#define MCPLINK_LOG_COMPONENT "transport.client"
#include "mcplink/logging/log_macros.h"

namespace mcplink {
namespace transport {

namespace {

// Session errors do not always know which server they belong to
Error withServerId(Error error, const std::string& server_id) {
  if (error.server_id.empty()) {
    error.server_id = server_id;
  }
  return error;
}

}  // namespace

McpClientBase::McpClientBase(event::Dispatcher& dispatcher,
                             const ServerConfig& config,
                             const ClientOptions& options,
                             DisconnectListener& listener)
    : dispatcher_(dispatcher),
      config_(config),
      options_(options),
      listener_(listener) {}

McpClientBase::~McpClientBase() { abandonConnection(); }

void McpClientBase::abandonConnection() {
  ++generation_;
  status_ = ConnectionStatus::Disconnected;
  releaseSession();
}

void McpClientBase::connect(ConnectCallback callback) {
  switch (status_.load()) {
    case ConnectionStatus::Connected:
      callback(makeVoidSuccess());
      return;
    case ConnectionStatus::Connecting:
      connect_waiters_.push_back(std::move(callback));
      return;
    case ConnectionStatus::Disconnected:
    case ConnectionStatus::Error:
      break;
  }

  connect_waiters_.push_back(std::move(callback));
  status_ = ConnectionStatus::Connecting;
  tools_cache_.reset();
  const uint64_t generation = ++generation_;

  MCPLINK_LOG_INFO("[{}] connecting to MCP server '{}' over {}", config_.id,
                   config_.name, toString(config_.kind()));

  session_ = createSession();

  McpSession::Callbacks callbacks;
  callbacks.on_closed = [this, generation](const Error& error) {
    if (generation != generation_) {
      return;
    }
    if (status_ == ConnectionStatus::Connecting) {
      failConnect(error);
    } else {
      handleDisconnect(error);
    }
  };
  callbacks.on_notification = [this](const std::string& method,
                                     const json& params) {
    onNotification(method, params);
  };

  session_->open(std::move(callbacks), [this, generation](VoidResult result) {
    if (generation != generation_) {
      return;
    }
    if (is_error(result)) {
      failConnect(*get_error(result));
      return;
    }
    initialize();
  });
}

void McpClientBase::initialize() {
  json params = {{"protocolVersion", options_.protocol_version},
                 {"capabilities", json::object()},
                 {"clientInfo",
                  {{"name", clientName()}, {"version", options_.client_version}}}};

  const uint64_t generation = generation_;
  sendRequest("initialize", params, [this, generation](Result<json> result) {
    if (generation != generation_) {
      return;
    }
    if (is_error(result)) {
      const Error& error = *get_error(result);
      Error cause = error.kind == ErrorKind::Connection
                        ? error
                        : makeConnectionError(
                              config_.id,
                              "initialize failed: " + error.message,
                              error.code);
      failConnect(cause);
      return;
    }

    const json& reply = *get_value(result);
    if (reply.is_object() && reply.contains("serverInfo")) {
      MCPLINK_LOG_DEBUG("[{}] server info: {}", config_.id,
                        reply["serverInfo"].dump());
    }
    if (reply.is_object() && reply.contains("protocolVersion") &&
        reply["protocolVersion"] != options_.protocol_version) {
      MCPLINK_LOG_WARNING("[{}] server answered with protocol version {}",
                          config_.id, reply["protocolVersion"].dump());
    }

    session_->notify("notifications/initialized", json::object());
    status_ = ConnectionStatus::Connected;
    MCPLINK_LOG_INFO("[{}] connected", config_.id);
    onConnected();
    finishConnect(makeVoidSuccess());
  });
}

void McpClientBase::finishConnect(VoidResult result) {
  std::vector<ConnectCallback> waiters;
  waiters.swap(connect_waiters_);
  for (auto& waiter : waiters) {
    waiter(result);
  }
}

void McpClientBase::failConnect(const Error& error) {
  Error cause = error.kind == ErrorKind::Connection
                    ? withServerId(error, config_.id)
                    : makeConnectionError(config_.id, error.message, error.code);
  MCPLINK_LOG_ERROR("[{}] connect failed: {}", config_.id, cause.message);

  ++generation_;
  status_ = ConnectionStatus::Error;
  onTearDown();
  releaseSession();
  finishConnect(makeVoidError(cause));
}

void McpClientBase::disconnect(DisconnectCallback callback) {
  const ConnectionStatus previous = status_.load();

  ++generation_;
  status_ = ConnectionStatus::Disconnected;
  onTearDown();
  releaseSession();
  tools_cache_.reset();

  if (!connect_waiters_.empty()) {
    finishConnect(makeVoidError(
        makeConnectionError(config_.id, "connection cancelled")));
  }

  if (previous != ConnectionStatus::Disconnected) {
    MCPLINK_LOG_INFO("[{}] disconnected", config_.id);
  }
  if (callback) {
    callback();
  }
}

void McpClientBase::handleDisconnect(const Error& cause) {
  if (listener_notified_ || status_ != ConnectionStatus::Connected) {
    return;
  }
  listener_notified_ = true;

  MCPLINK_LOG_WARNING("[{}] connection lost: {}", config_.id, cause.message);

  ++generation_;
  status_ = ConnectionStatus::Disconnected;
  onTearDown();
  releaseSession();
  tools_cache_.reset();

  listener_.onDisconnected(config_.id);
}

void McpClientBase::releaseSession() {
  if (!session_) {
    return;
  }
  // close() fails whatever is still outstanding; the session object may be
  // on the call stack, so it is freed on a later iteration
  McpSessionPtr session = std::move(session_);
  session->close();
  dispatcher_.deferredDelete(std::move(session));
}

void McpClientBase::listTools(ListToolsCallback callback) {
  if (status_ != ConnectionStatus::Connected) {
    callback(makeError<std::vector<ToolDescriptor>>(
        makeConnectionError(config_.id, "not connected")));
    return;
  }
  if (tools_cache_.has_value()) {
    callback(*tools_cache_);
    return;
  }

  // Concurrent first callers share one wire request
  list_waiters_.push_back(std::move(callback));
  if (list_waiters_.size() > 1) {
    return;
  }

  ++tool_list_requests_;
  const uint64_t generation = generation_;
  sendRequest("tools/list", json::object(),
              [this, generation](Result<json> result) {
    const bool current = generation == generation_;

    if (is_error(result)) {
      Error error = withServerId(*get_error(result), config_.id);
      if (current) {
        onRequestFailed(error);
      }
      finishListTools(error);
      return;
    }

    std::vector<ToolDescriptor> tools;
    const json& reply = *get_value(result);
    std::string problem;
    if (!reply.is_object() || !reply.contains("tools") ||
        !reply["tools"].is_array()) {
      problem = "missing tools array";
    } else {
      try {
        for (const auto& tool : reply["tools"]) {
          tools.push_back(tool.get<ToolDescriptor>());
        }
      } catch (const json::exception& e) {
        problem = e.what();
      }
    }
    if (!problem.empty()) {
      Error error = makeProtocolError(
          jsonrpc::INTERNAL_ERROR, "malformed tools/list result: " + problem);
      if (current) {
        onRequestFailed(error);
      }
      finishListTools(error);
      return;
    }

    if (current && status_ == ConnectionStatus::Connected) {
      tools_cache_ = tools;
    }
    MCPLINK_LOG_DEBUG("[{}] server advertises {} tools", config_.id,
                      tools.size());
    finishListTools(std::move(tools));
  });
}

void McpClientBase::finishListTools(
    Result<std::vector<ToolDescriptor>> result) {
  std::vector<ListToolsCallback> waiters;
  waiters.swap(list_waiters_);
  for (auto& waiter : waiters) {
    waiter(result);
  }
}

void McpClientBase::callTool(const std::string& name,
                             const json& arguments,
                             CallToolCallback callback) {
  if (status_ != ConnectionStatus::Connected) {
    callback(makeError<CallToolResult>(
        makeConnectionError(config_.id, "not connected")));
    return;
  }

  json params = {{"name", name},
                 {"arguments",
                  arguments.is_null() ? json::object() : arguments}};

  const uint64_t generation = generation_;
  sendRequest("tools/call", params,
              [this, generation, name, callback](Result<json> result) {
    const bool current = generation == generation_;

    if (is_error(result)) {
      const Error& error = *get_error(result);
      // Error replies from the server are the tool's failure; transport
      // failures keep their own category
      Error mapped = error.kind == ErrorKind::Protocol
                         ? makeToolCallError(config_.id, name, error)
                         : withServerId(error, config_.id);
      if (current) {
        onRequestFailed(mapped);
      }
      callback(makeError<CallToolResult>(mapped));
      return;
    }

    CallToolResult call_result;
    try {
      from_json(*get_value(result), call_result);
    } catch (const std::exception& e) {
      Error mapped = makeToolCallError(
          config_.id, name,
          makeProtocolError(jsonrpc::INTERNAL_ERROR,
                            std::string("malformed tools/call result: ") +
                                e.what()));
      if (current) {
        onRequestFailed(mapped);
      }
      callback(makeError<CallToolResult>(mapped));
      return;
    }

    callback(std::move(call_result));
  });
}

void McpClientBase::sendRequest(const std::string& method,
                                const json& params,
                                McpSession::RequestCallback callback) {
  if (!session_) {
    callback(makeError<json>(makeConnectionError(config_.id, "not connected")));
    return;
  }
  session_->request(method, params, requestTimeout(), std::move(callback));
}

std::chrono::milliseconds McpClientBase::requestTimeout() const {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
      config_.timeout);
}

void McpClientBase::onNotification(const std::string& method,
                                   const json& /*params*/) {
  if (method == "notifications/tools/list_changed") {
    MCPLINK_LOG_INFO("[{}] tool list changed, dropping cache", config_.id);
    tools_cache_.reset();
    return;
  }
  MCPLINK_LOG_DEBUG("[{}] unhandled notification '{}'", config_.id, method);
}

}  // namespace transport
}  // namespace mcplink
