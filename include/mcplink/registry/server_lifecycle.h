#ifndef MCPLINK_REGISTRY_SERVER_LIFECYCLE_H
#define MCPLINK_REGISTRY_SERVER_LIFECYCLE_H

#include <functional>
#include <future>
#include <string>

#include "mcplink/registry/connection_registry.h"
#include "mcplink/registry/server_store.h"

namespace mcplink {
namespace registry {

/**
 * Operator actions on a server: connect or shut it down and record the
 * outcome in the store. A server closed here stays closed across restarts.
 *
 * Same threading rules as ConnectionRegistry.
 */
class ServerLifecycle {
 public:
  using Callback = std::function<void(VoidResult)>;

  ServerLifecycle(event::Dispatcher& dispatcher,
                  ConnectionRegistry& registry,
                  ServerStore& store);

  // Connects and records connected; on failure records disconnected
  void open(const std::string& id, Callback callback);
  // Disconnects and records closed
  void close(const std::string& id, Callback callback);
  void reconnect(const std::string& id, Callback callback);

  std::future<void> openAsync(const std::string& id);
  std::future<void> closeAsync(const std::string& id);
  std::future<void> reconnectAsync(const std::string& id);

 private:
  void record(const std::string& id, PersistedStatus status);
  std::future<void> runAsync(
      std::function<void(const std::string&, Callback)> action,
      const std::string& id);

  event::Dispatcher& dispatcher_;
  ConnectionRegistry& registry_;
  ServerStore& store_;
};

}  // namespace registry
}  // namespace mcplink

#endif  // MCPLINK_REGISTRY_SERVER_LIFECYCLE_H
