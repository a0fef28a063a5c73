#ifndef MCPLINK_CONFIG_YAML_SERVER_STORE_H
#define MCPLINK_CONFIG_YAML_SERVER_STORE_H

#include <chrono>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "mcplink/registry/server_store.h"

namespace mcplink {
namespace config {

/**
 * ServerStore backed by a YAML file:
 *
 *   servers:
 *     - id: files
 *       name: File tools
 *       transport: stdio            # stdio | sse | streamable-http
 *       command: /usr/bin/files-mcp
 *       args: [--root, /srv]
 *       env: {LOG: debug}
 *       timeout: 30                 # seconds
 *       status: connected           # connected | disconnected | closed
 *     - id: search
 *       transport: sse
 *       url: http://localhost:8080/sse
 *       headers: {Authorization: "Bearer ${SEARCH_TOKEN}"}
 *
 * ${VAR} placeholders are expanded when the file is loaded; status updates
 * rewrite the file with the placeholders intact. The rewrite goes to a
 * temporary file that is then renamed over the original.
 */
class YamlServerStore : public registry::ServerStore {
 public:
  // Throws ConfigError for unreadable files and invalid records. A missing
  // file is an empty store.
  YamlServerStore(const std::string& path,
                  std::chrono::seconds default_timeout = kDefaultServerTimeout);

  optional<ServerConfig> findConfig(const std::string& id) override;
  VoidResult setStatus(const std::string& id, PersistedStatus status) override;
  std::vector<std::string> findIdsByStatus(PersistedStatus status) override;

  // Every id in file order
  std::vector<std::string> ids() const;
  optional<PersistedStatus> statusOf(const std::string& id) const;

  const std::string& path() const { return path_; }

 private:
  struct Record {
    ServerConfig config;
    PersistedStatus status{PersistedStatus::Disconnected};
    YAML::Node node;
  };

  void load();
  Record parseRecord(const YAML::Node& node, size_t index) const;
  VoidResult save();

  const std::string path_;
  const std::chrono::seconds default_timeout_;

  mutable std::mutex mutex_;
  YAML::Node document_;
  std::vector<std::string> order_;
  std::map<std::string, Record> records_;
};

}  // namespace config
}  // namespace mcplink

#endif  // MCPLINK_CONFIG_YAML_SERVER_STORE_H
