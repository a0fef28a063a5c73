#include "mcplink/registry/server_lifecycle.h"

#include "mcplink/core/errors.h"

#define MCPLINK_LOG_COMPONENT "registry"
#include "mcplink/logging/log_macros.h"

namespace mcplink {
namespace registry {

ServerLifecycle::ServerLifecycle(event::Dispatcher& dispatcher,
                                 ConnectionRegistry& registry,
                                 ServerStore& store)
    : dispatcher_(dispatcher), registry_(registry), store_(store) {}

void ServerLifecycle::open(const std::string& id, Callback callback) {
  registry_.connect(id, [this, id, callback](VoidResult result) {
    record(id, is_success(result) ? PersistedStatus::Connected
                                  : PersistedStatus::Disconnected);
    callback(std::move(result));
  });
}

void ServerLifecycle::close(const std::string& id, Callback callback) {
  registry_.disconnect(id, [this, id, callback]() {
    record(id, PersistedStatus::Closed);
    callback(makeVoidSuccess());
  });
}

void ServerLifecycle::reconnect(const std::string& id, Callback callback) {
  MCPLINK_LOG_INFO("[{}] reconnecting", id);
  registry_.disconnect(id, [this, id, callback]() { open(id, callback); });
}

void ServerLifecycle::record(const std::string& id, PersistedStatus status) {
  auto result = store_.setStatus(id, status);
  if (is_error(result)) {
    MCPLINK_LOG_ERROR("[{}] failed to record status {}: {}", id,
                      toString(status), get_error(result)->message);
  }
}

std::future<void> ServerLifecycle::runAsync(
    std::function<void(const std::string&, Callback)> action,
    const std::string& id) {
  auto promise = std::make_shared<std::promise<void>>();
  auto future = promise->get_future();
  dispatcher_.post([action, id, promise]() {
    action(id, [promise](VoidResult result) {
      if (is_error(result)) {
        promise->set_exception(toExceptionPtr(*get_error(result)));
      } else {
        promise->set_value();
      }
    });
  });
  return future;
}

std::future<void> ServerLifecycle::openAsync(const std::string& id) {
  return runAsync(
      [this](const std::string& server_id, Callback cb) { open(server_id, cb); },
      id);
}

std::future<void> ServerLifecycle::closeAsync(const std::string& id) {
  return runAsync(
      [this](const std::string& server_id, Callback cb) { close(server_id, cb); },
      id);
}

std::future<void> ServerLifecycle::reconnectAsync(const std::string& id) {
  return runAsync(
      [this](const std::string& server_id, Callback cb) {
        reconnect(server_id, cb);
      },
      id);
}

}  // namespace registry
}  // namespace mcplink
