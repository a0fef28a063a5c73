#include "mcplink/registry/connection_registry.h"

#include "mcplink/core/errors.h"

#define MCPLINK_LOG_COMPONENT "registry"
#include "mcplink/logging/log_macros.h"

namespace mcplink {
namespace registry {

namespace {

template <typename T>
void deliver(std::promise<T>& promise, Result<T> result) {
  if (is_error(result)) {
    promise.set_exception(toExceptionPtr(*get_error(result)));
  } else {
    promise.set_value(std::move(*get_value(result)));
  }
}

}  // namespace

ConnectionRegistry::ConnectionRegistry(event::Dispatcher& dispatcher,
                                       ServerStore& store,
                                       transport::ClientFactory& factory)
    : dispatcher_(dispatcher), store_(store), factory_(factory) {
  status_timer_ = dispatcher_.createTimer([this]() { flushStatusUpdates(); });
}

ConnectionRegistry::~ConnectionRegistry() {
  status_timer_->disableTimer();

  std::map<std::string, transport::McpTransportClientPtr> entries;
  std::map<std::string, PendingConnect> connecting;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    entries.swap(entries_);
    connecting.swap(connecting_);
  }
  // Clients stop reporting once disconnected; waiters are dropped
  for (auto& entry : connecting) {
    entry.second.client->disconnect(nullptr);
    dispatcher_.deferredDelete(std::move(entry.second.client));
  }
  for (auto& entry : entries) {
    entry.second->disconnect(nullptr);
    dispatcher_.deferredDelete(std::move(entry.second));
  }
}

void ConnectionRegistry::connect(const std::string& id,
                                 ConnectCallback callback) {
  transport::McpTransportClientPtr stale;
  bool connected = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(id);
    if (it != entries_.end()) {
      if (it->second->status() == ConnectionStatus::Connected) {
        connected = true;
      } else {
        stale = std::move(it->second);
        entries_.erase(it);
      }
    }

    auto pending = connecting_.find(id);
    if (!connected && pending != connecting_.end()) {
      // Join the attempt in flight; never a second client for one id
      pending->second.waiters.push_back(std::move(callback));
      return;
    }
  }
  if (connected) {
    callback(makeVoidSuccess());
    return;
  }
  if (stale) {
    releaseClient(std::move(stale), nullptr);
  }

  optional<ServerConfig> config = store_.findConfig(id);
  if (!config.has_value()) {
    MCPLINK_LOG_WARNING("[{}] connect requested for unknown server", id);
    callback(makeVoidError(makeConnectionError(id, "unknown server")));
    return;
  }

  transport::McpTransportClientPtr client;
  try {
    client = factory_.createClient(*config, *this);
  } catch (const std::exception& e) {
    callback(makeVoidError(makeConnectionError(
        id, std::string("failed to create client: ") + e.what())));
    return;
  }

  MCPLINK_LOG_INFO("[{}] connecting to '{}' over {}", id, config->name,
                   toString(config->kind()));

  const uint64_t attempt = next_attempt_++;
  transport::McpTransportClient* raw = client.get();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    PendingConnect& pending = connecting_[id];
    pending.attempt = attempt;
    pending.client = std::move(client);
    pending.waiters.push_back(std::move(callback));
  }

  raw->connect([this, id, attempt](VoidResult result) {
    finishConnect(id, attempt, std::move(result));
  });
}

void ConnectionRegistry::finishConnect(const std::string& id,
                                       uint64_t attempt,
                                       VoidResult result) {
  PendingConnect pending;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = connecting_.find(id);
    if (it == connecting_.end() || it->second.attempt != attempt) {
      // Cancelled by disconnect()
      return;
    }
    pending = std::move(it->second);
    connecting_.erase(it);

    if (is_success(result)) {
      entries_[id] = std::move(pending.client);
    }
  }

  if (is_success(result)) {
    MCPLINK_LOG_INFO("[{}] connected", id);
  } else {
    MCPLINK_LOG_ERROR("[{}] connection failed: {}", id,
                      get_error(result)->message);
    dispatcher_.deferredDelete(std::move(pending.client));
  }

  for (auto& waiter : pending.waiters) {
    waiter(result);
  }
}

void ConnectionRegistry::disconnect(const std::string& id,
                                    DoneCallback callback) {
  PendingConnect pending;
  transport::McpTransportClientPtr client;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto connecting = connecting_.find(id);
    if (connecting != connecting_.end()) {
      pending = std::move(connecting->second);
      connecting_.erase(connecting);
    }
    auto entry = entries_.find(id);
    if (entry != entries_.end()) {
      client = std::move(entry->second);
      entries_.erase(entry);
    }
  }

  if (pending.client) {
    MCPLINK_LOG_INFO("[{}] cancelling connection attempt", id);
    releaseClient(std::move(pending.client), nullptr);
    for (auto& waiter : pending.waiters) {
      waiter(makeVoidError(makeConnectionError(id, "connection cancelled")));
    }
  }

  if (!client) {
    if (callback) {
      callback();
    }
    return;
  }

  MCPLINK_LOG_INFO("[{}] disconnecting", id);
  releaseClient(std::move(client), std::move(callback));
}

void ConnectionRegistry::releaseClient(transport::McpTransportClientPtr client,
                                       DoneCallback callback) {
  transport::McpTransportClient* raw = client.get();
  auto holder =
      std::make_shared<transport::McpTransportClientPtr>(std::move(client));
  event::Dispatcher* dispatcher = &dispatcher_;
  raw->disconnect([dispatcher, holder, callback]() {
    dispatcher->deferredDelete(std::move(*holder));
    if (callback) {
      callback();
    }
  });
}

transport::McpTransportClient* ConnectionRegistry::findConnected(
    const std::string& id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(id);
  if (it == entries_.end() ||
      it->second->status() != ConnectionStatus::Connected) {
    return nullptr;
  }
  return it->second.get();
}

void ConnectionRegistry::getTools(const std::string& id,
                                  transport::ListToolsCallback callback) {
  connect(id, [this, id, callback](VoidResult result) {
    if (is_error(result)) {
      callback(makeError<std::vector<ToolDescriptor>>(*get_error(result)));
      return;
    }
    transport::McpTransportClient* client = findConnected(id);
    if (!client) {
      callback(makeError<std::vector<ToolDescriptor>>(
          makeConnectionError(id, "not connected")));
      return;
    }
    client->listTools(callback);
  });
}

void ConnectionRegistry::callTool(const std::string& id,
                                  const std::string& name,
                                  const json& arguments,
                                  transport::CallToolCallback callback) {
  connect(id, [this, id, name, arguments, callback](VoidResult result) {
    if (is_error(result)) {
      callback(makeError<CallToolResult>(*get_error(result)));
      return;
    }
    transport::McpTransportClient* client = findConnected(id);
    if (!client) {
      callback(makeError<CallToolResult>(
          makeConnectionError(id, "not connected")));
      return;
    }
    client->callTool(name, arguments, callback);
  });
}

void ConnectionRegistry::disconnectAll(DoneCallback callback) {
  std::vector<std::string> ids;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& entry : entries_) {
      ids.push_back(entry.first);
    }
    for (const auto& entry : connecting_) {
      if (!entries_.count(entry.first)) {
        ids.push_back(entry.first);
      }
    }
  }

  if (ids.empty()) {
    if (callback) {
      callback();
    }
    return;
  }

  MCPLINK_LOG_INFO("disconnecting {} server(s)", ids.size());
  auto remaining = std::make_shared<size_t>(ids.size());
  for (const auto& id : ids) {
    disconnect(id, [remaining, callback]() {
      if (--*remaining == 0 && callback) {
        callback();
      }
    });
  }
}

void ConnectionRegistry::restoreConnections(RestoreCallback callback) {
  auto ids = std::make_shared<std::vector<std::string>>(
      store_.findIdsByStatus(PersistedStatus::Connected));
  MCPLINK_LOG_INFO("restoring {} connection(s)", ids->size());
  restoreNext(ids, 0, RestoreSummary(), std::move(callback));
}

void ConnectionRegistry::restoreNext(
    std::shared_ptr<std::vector<std::string>> ids,
    size_t index,
    RestoreSummary summary,
    RestoreCallback callback) {
  if (index >= ids->size()) {
    MCPLINK_LOG_INFO("restore finished: {} succeeded, {} failed",
                     summary.succeeded, summary.failed);
    if (callback) {
      callback(summary);
    }
    return;
  }

  const std::string id = (*ids)[index];
  MCPLINK_LOG_INFO("[{}] restoring ({}/{})", id, index + 1, ids->size());

  connect(id, [this, ids, index, summary, callback, id](VoidResult result) mutable {
    if (is_success(result)) {
      ++summary.succeeded;
    } else {
      ++summary.failed;
      auto update = store_.setStatus(id, PersistedStatus::Disconnected);
      if (is_error(update)) {
        MCPLINK_LOG_WARNING("[{}] failed to record status: {}", id,
                            get_error(update)->message);
      }
    }
    // Continue from the dispatcher so a synchronous completion does not
    // recurse once per server
    dispatcher_.post([this, ids, index, summary, callback]() {
      restoreNext(ids, index + 1, summary, callback);
    });
  });
}

void ConnectionRegistry::onDisconnected(const std::string& server_id) {
  transport::McpTransportClientPtr client;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(server_id);
    if (it == entries_.end() ||
        it->second->status() == ConnectionStatus::Connected) {
      MCPLINK_LOG_DEBUG("[{}] ignoring stale disconnect notification",
                        server_id);
      return;
    }
    client = std::move(it->second);
    entries_.erase(it);
  }

  MCPLINK_LOG_WARNING("[{}] connection lost, entry removed", server_id);
  // We are inside the client's own callback
  dispatcher_.deferredDelete(std::move(client));

  pending_status_updates_.push_back(server_id);
  status_timer_->enableTimer(std::chrono::milliseconds(0));
}

void ConnectionRegistry::flushStatusUpdates() {
  std::vector<std::string> ids;
  ids.swap(pending_status_updates_);
  for (const auto& id : ids) {
    auto result = store_.setStatus(id, PersistedStatus::Disconnected);
    if (is_error(result)) {
      // Not retried; the in-memory state is already correct
      MCPLINK_LOG_ERROR("[{}] failed to record disconnect: {}", id,
                        get_error(result)->message);
    }
  }
}

ConnectionStatus ConnectionRegistry::getStatus(const std::string& id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(id);
  if (it != entries_.end()) {
    return it->second->status();
  }
  if (connecting_.count(id)) {
    return ConnectionStatus::Connecting;
  }
  return ConnectionStatus::Disconnected;
}

bool ConnectionRegistry::isConnected(const std::string& id) const {
  return getStatus(id) == ConnectionStatus::Connected;
}

std::vector<std::string> ConnectionRegistry::getConnectedIds() const {
  std::vector<std::string> ids;
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& entry : entries_) {
    if (entry.second->status() == ConnectionStatus::Connected) {
      ids.push_back(entry.first);
    }
  }
  return ids;
}

std::future<bool> ConnectionRegistry::connectAsync(const std::string& id) {
  auto promise = std::make_shared<std::promise<bool>>();
  auto future = promise->get_future();
  dispatcher_.post([this, id, promise]() {
    connect(id, [promise](VoidResult result) {
      if (is_error(result)) {
        promise->set_exception(toExceptionPtr(*get_error(result)));
      } else {
        promise->set_value(true);
      }
    });
  });
  return future;
}

std::future<void> ConnectionRegistry::disconnectAsync(const std::string& id) {
  auto promise = std::make_shared<std::promise<void>>();
  auto future = promise->get_future();
  dispatcher_.post([this, id, promise]() {
    disconnect(id, [promise]() { promise->set_value(); });
  });
  return future;
}

std::future<std::vector<ToolDescriptor>> ConnectionRegistry::getToolsAsync(
    const std::string& id) {
  auto promise = std::make_shared<std::promise<std::vector<ToolDescriptor>>>();
  auto future = promise->get_future();
  dispatcher_.post([this, id, promise]() {
    getTools(id, [promise](Result<std::vector<ToolDescriptor>> result) {
      deliver(*promise, std::move(result));
    });
  });
  return future;
}

std::future<CallToolResult> ConnectionRegistry::callToolAsync(
    const std::string& id, const std::string& name, const json& arguments) {
  auto promise = std::make_shared<std::promise<CallToolResult>>();
  auto future = promise->get_future();
  dispatcher_.post([this, id, name, arguments, promise]() {
    callTool(id, name, arguments, [promise](Result<CallToolResult> result) {
      deliver(*promise, std::move(result));
    });
  });
  return future;
}

std::future<void> ConnectionRegistry::disconnectAllAsync() {
  auto promise = std::make_shared<std::promise<void>>();
  auto future = promise->get_future();
  dispatcher_.post([this, promise]() {
    disconnectAll([promise]() { promise->set_value(); });
  });
  return future;
}

std::future<ConnectionRegistry::RestoreSummary>
ConnectionRegistry::restoreConnectionsAsync() {
  auto promise = std::make_shared<std::promise<RestoreSummary>>();
  auto future = promise->get_future();
  dispatcher_.post([this, promise]() {
    restoreConnections(
        [promise](RestoreSummary summary) { promise->set_value(summary); });
  });
  return future;
}

}  // namespace registry
}  // namespace mcplink
