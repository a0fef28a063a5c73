#include "mcplink/config/yaml_server_store.h"

#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>

#include "mcplink/config/config_error.h"
#include "mcplink/config/yaml_helpers.h"

#define MCPLINK_LOG_COMPONENT "config"
#include "mcplink/logging/log_macros.h"

namespace mcplink {
namespace config {

namespace {

std::map<std::string, std::string> stringMap(const YAML::Node& node,
                                             const std::string& path) {
  std::map<std::string, std::string> values;
  if (!node || node.IsNull()) {
    return values;
  }
  if (!node.IsMap()) {
    throw ConfigError("expected a mapping", path);
  }
  for (const auto& entry : node) {
    const std::string key = entry.first.as<std::string>();
    if (!entry.second.IsScalar()) {
      throw ConfigError("expected a string", path + "." + key);
    }
    values[key] =
        expandEnvironment(entry.second.as<std::string>(), path + "." + key);
  }
  return values;
}

std::vector<std::string> stringList(const YAML::Node& node,
                                    const std::string& path) {
  std::vector<std::string> values;
  if (!node || node.IsNull()) {
    return values;
  }
  if (!node.IsSequence()) {
    throw ConfigError("expected a list", path);
  }
  for (size_t i = 0; i < node.size(); ++i) {
    const std::string item_path = path + "[" + std::to_string(i) + "]";
    if (!node[i].IsScalar()) {
      throw ConfigError("expected a string", item_path);
    }
    values.push_back(expandEnvironment(node[i].as<std::string>(), item_path));
  }
  return values;
}

bool fileExists(const std::string& path) {
  struct stat st;
  return ::stat(path.c_str(), &st) == 0;
}

}  // namespace

YamlServerStore::YamlServerStore(const std::string& path,
                                 std::chrono::seconds default_timeout)
    : path_(path), default_timeout_(default_timeout) {
  load();
}

void YamlServerStore::load() {
  if (!fileExists(path_)) {
    MCPLINK_LOG_WARNING("Servers file {} does not exist, no servers known",
                        path_);
    document_ = YAML::Node(YAML::NodeType::Map);
    document_["servers"] = YAML::Node(YAML::NodeType::Sequence);
    return;
  }

  document_ = parseYaml(readFile(path_), path_);
  if (!document_ || document_.IsNull()) {
    document_ = YAML::Node(YAML::NodeType::Map);
  }
  if (!document_.IsMap()) {
    throw ConfigError("top level must be a mapping", "", path_);
  }

  YAML::Node servers = document_["servers"];
  if (!servers || servers.IsNull()) {
    document_["servers"] = YAML::Node(YAML::NodeType::Sequence);
    return;
  }
  if (!servers.IsSequence()) {
    throw ConfigError("expected a list", "servers", path_);
  }

  try {
    for (size_t i = 0; i < servers.size(); ++i) {
      Record record = parseRecord(servers[i], i);
      const std::string id = record.config.id;
      if (records_.count(id)) {
        throw ConfigError("duplicate server id '" + id + "'",
                          "servers[" + std::to_string(i) + "].id");
      }
      order_.push_back(id);
      records_.emplace(id, std::move(record));
    }
  } catch (const ConfigError& e) {
    throw ConfigError(e.message(), e.field(), path_);
  } catch (const YAML::Exception& e) {
    throw ConfigError(e.what(), "servers", path_);
  }

  MCPLINK_LOG_INFO("Loaded {} server(s) from {}", records_.size(), path_);
}

YamlServerStore::Record YamlServerStore::parseRecord(const YAML::Node& node,
                                                     size_t index) const {
  const std::string path = "servers[" + std::to_string(index) + "]";
  if (!node.IsMap()) {
    throw ConfigError("expected a mapping", path);
  }

  Record record;
  record.node = node;
  ServerConfig& config = record.config;

  config.id = getString(node, "id", path + ".id", "");
  if (config.id.empty()) {
    throw ConfigError("missing server id", path + ".id");
  }
  config.name = getString(node, "name", path + ".name", config.id);
  config.timeout = std::chrono::seconds(getInteger(
      node, "timeout", path + ".timeout", default_timeout_.count(), 1));

  const std::string transport =
      getString(node, "transport", path + ".transport", "");
  auto kind = transportKindFromString(transport);
  if (!kind.has_value()) {
    throw ConfigError("unknown transport '" + transport + "'",
                      path + ".transport");
  }

  switch (*kind) {
    case TransportKind::Stdio: {
      StdioParams params;
      params.command = getString(node, "command", path + ".command", "");
      if (params.command.empty()) {
        throw ConfigError("stdio server needs a command", path + ".command");
      }
      params.args = stringList(node["args"], path + ".args");
      params.env = stringMap(node["env"], path + ".env");
      config.transport = params;
      break;
    }
    case TransportKind::Sse: {
      SseParams params;
      params.url = getString(node, "url", path + ".url", "");
      if (params.url.empty()) {
        throw ConfigError("sse server needs a url", path + ".url");
      }
      params.headers = stringMap(node["headers"], path + ".headers");
      config.transport = params;
      break;
    }
    case TransportKind::StreamableHttp: {
      StreamableHttpParams params;
      params.url = getString(node, "url", path + ".url", "");
      if (params.url.empty()) {
        throw ConfigError("streamable-http server needs a url", path + ".url");
      }
      params.headers = stringMap(node["headers"], path + ".headers");
      config.transport = params;
      break;
    }
  }

  const std::string status =
      getString(node, "status", path + ".status", "disconnected");
  auto persisted = persistedStatusFromString(status);
  if (!persisted.has_value()) {
    throw ConfigError("unknown status '" + status + "'", path + ".status");
  }
  record.status = *persisted;

  return record;
}

optional<ServerConfig> YamlServerStore::findConfig(const std::string& id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = records_.find(id);
  if (it == records_.end()) {
    return nullopt;
  }
  return it->second.config;
}

VoidResult YamlServerStore::setStatus(const std::string& id,
                                      PersistedStatus status) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = records_.find(id);
  if (it == records_.end()) {
    return makeVoidError(Error(0, "unknown server '" + id + "'"));
  }
  if (it->second.status == status) {
    return makeVoidSuccess();
  }

  it->second.status = status;
  it->second.node["status"] = toString(status);
  MCPLINK_LOG_DEBUG("[{}] status -> {}", id, toString(status));
  return save();
}

std::vector<std::string> YamlServerStore::findIdsByStatus(
    PersistedStatus status) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> ids;
  for (const auto& id : order_) {
    if (records_.at(id).status == status) {
      ids.push_back(id);
    }
  }
  return ids;
}

std::vector<std::string> YamlServerStore::ids() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return order_;
}

optional<PersistedStatus> YamlServerStore::statusOf(
    const std::string& id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = records_.find(id);
  if (it == records_.end()) {
    return nullopt;
  }
  return it->second.status;
}

VoidResult YamlServerStore::save() {
  YAML::Emitter out;
  out << document_;
  if (!out.good()) {
    return makeVoidError(
        Error(0, "failed to serialize servers: " + out.GetLastError()));
  }

  const std::string temp_path = path_ + ".tmp";
  {
    std::ofstream file(temp_path, std::ios::out | std::ios::trunc);
    if (!file) {
      return makeVoidError(Error(errno, "cannot write " + temp_path + ": " +
                                            std::strerror(errno)));
    }
    file << out.c_str() << "\n";
    file.flush();
    if (!file) {
      int err = errno;
      std::remove(temp_path.c_str());
      return makeVoidError(
          Error(err, "write to " + temp_path + " failed: " + std::strerror(err)));
    }
  }

  if (::rename(temp_path.c_str(), path_.c_str()) != 0) {
    int err = errno;
    std::remove(temp_path.c_str());
    return makeVoidError(Error(err, "cannot replace " + path_ + ": " +
                                        std::strerror(err)));
  }
  return makeVoidSuccess();
}

}  // namespace config
}  // namespace mcplink
