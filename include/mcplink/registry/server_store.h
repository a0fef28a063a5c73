#ifndef MCPLINK_REGISTRY_SERVER_STORE_H
#define MCPLINK_REGISTRY_SERVER_STORE_H

#include <string>
#include <vector>

#include "mcplink/core/result.h"
#include "mcplink/types.h"

namespace mcplink {
namespace registry {

/**
 * Persistence of server configurations and their recorded status.
 *
 * Called on the dispatcher thread. Implementations must be thread-safe
 * when they are also used from elsewhere (operator tooling).
 */
class ServerStore {
 public:
  virtual ~ServerStore() = default;

  virtual optional<ServerConfig> findConfig(const std::string& id) = 0;

  virtual VoidResult setStatus(const std::string& id,
                               PersistedStatus status) = 0;

  virtual std::vector<std::string> findIdsByStatus(PersistedStatus status) = 0;
};

}  // namespace registry
}  // namespace mcplink

#endif  // MCPLINK_REGISTRY_SERVER_STORE_H
