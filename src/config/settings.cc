#include "mcplink/config/settings.h"

#include <sys/stat.h>

#include <cstdlib>
#include <vector>

#include "mcplink/config/config_error.h"
#include "mcplink/config/yaml_helpers.h"
#include "mcplink/logging/log_sink.h"
#include "mcplink/logging/logger_registry.h"

#define MCPLINK_LOG_COMPONENT "config"
#include "mcplink/logging/log_macros.h"

namespace mcplink {
namespace config {

namespace {

bool exists(const std::string& path) {
  struct stat st;
  return ::stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode);
}

logging::LogLevel levelAt(const YAML::Node& node,
                          const std::string& key,
                          const std::string& path,
                          logging::LogLevel fallback) {
  const YAML::Node value = node[key];
  if (!value || value.IsNull()) {
    return fallback;
  }
  const std::string text = getString(node, key, path, "");
  auto level = logging::parseLogLevel(text);
  if (!level.has_value()) {
    throw ConfigError("unknown log level '" + text + "'", path);
  }
  return *level;
}

YAML::Node section(const YAML::Node& root, const std::string& key) {
  const YAML::Node node = root[key];
  if (node && !node.IsNull() && !node.IsMap()) {
    throw ConfigError("expected a mapping", key);
  }
  return node;
}

}  // namespace

std::string findSettingsFile(const std::string& explicit_path) {
  if (!explicit_path.empty()) {
    MCPLINK_LOG_INFO("Configuration source: --config={}", explicit_path);
    return explicit_path;
  }

  std::vector<std::string> search_paths;
  const char* env_config = std::getenv("MCPLINK_CONFIG");
  if (env_config && *env_config) {
    search_paths.push_back(env_config);
  }
  search_paths.push_back("./mcplink.yaml");
  search_paths.push_back("./config/mcplink.yaml");
  search_paths.push_back("/etc/mcplink/mcplink.yaml");

  for (const auto& path : search_paths) {
    if (exists(path)) {
      MCPLINK_LOG_INFO("Configuration source: {}", path);
      return path;
    }
  }

  MCPLINK_LOG_DEBUG("No configuration file found in {} locations, using "
                    "defaults",
                    search_paths.size());
  return "";
}

Settings parseSettings(const std::string& content, const std::string& file) {
  Settings settings;
  settings.source = file;

  YAML::Node root = parseYaml(content, file);
  if (!root || root.IsNull()) {
    return settings;
  }
  if (!root.IsMap()) {
    throw ConfigError("top level must be a mapping", "", file);
  }

  try {
    if (YAML::Node client = section(root, "client")) {
      settings.client.client_name = getString(
          client, "name", "client.name", settings.client.client_name);
      settings.client.client_version = getString(
          client, "version", "client.version", settings.client.client_version);
    }

    if (YAML::Node requests = section(root, "requests")) {
      settings.default_timeout = std::chrono::seconds(getInteger(
          requests, "default_timeout_seconds",
          "requests.default_timeout_seconds",
          settings.default_timeout.count(), 1));
    }

    if (YAML::Node heartbeat = section(root, "heartbeat")) {
      settings.client.heartbeat_interval = std::chrono::milliseconds(
          getInteger(heartbeat, "interval_ms", "heartbeat.interval_ms",
                     settings.client.heartbeat_interval.count(), 0));
      settings.client.heartbeat_failure_tolerance = static_cast<uint32_t>(
          getInteger(heartbeat, "failure_tolerance",
                     "heartbeat.failure_tolerance",
                     settings.client.heartbeat_failure_tolerance, 1));
    }

    if (YAML::Node http = section(root, "http")) {
      settings.client.http_connect_timeout = std::chrono::milliseconds(
          getInteger(http, "connect_timeout_ms", "http.connect_timeout_ms",
                     settings.client.http_connect_timeout.count(), 1));
    }

    if (YAML::Node log = section(root, "logging")) {
      LoggingSettings& logging_settings = settings.logging;
      logging_settings.level =
          levelAt(log, "level", "logging.level", logging_settings.level);
      logging_settings.file =
          getString(log, "file", "logging.file", logging_settings.file);

      const std::string format =
          getString(log, "format", "logging.format", "text");
      if (format != "text" && format != "json") {
        throw ConfigError("expected 'text' or 'json', got '" + format + "'",
                          "logging.format");
      }
      logging_settings.json = format == "json";

      logging_settings.max_file_size = static_cast<size_t>(
          getInteger(log, "max_file_size", "logging.max_file_size",
                     static_cast<int64_t>(logging_settings.max_file_size), 1));
      logging_settings.max_files = static_cast<size_t>(
          getInteger(log, "max_files", "logging.max_files",
                     static_cast<int64_t>(logging_settings.max_files), 1));

      const YAML::Node components = log["components"];
      if (components && !components.IsNull()) {
        if (!components.IsMap()) {
          throw ConfigError("expected a mapping", "logging.components");
        }
        for (const auto& entry : components) {
          const std::string name = entry.first.as<std::string>();
          const std::string path = "logging.components." + name;
          logging_settings.components[name] =
              levelAt(components, name, path, logging::LogLevel::Info);
        }
      }
    }

    std::string servers_file =
        getString(root, "servers_file", "servers_file", settings.servers_file);
    // Relative to the settings file, not the working directory
    if (!file.empty() && !servers_file.empty() && servers_file[0] != '/') {
      servers_file = directoryOf(file) + "/" + servers_file;
    }
    settings.servers_file = servers_file;
  } catch (const ConfigError& e) {
    if (!e.file().empty() || file.empty()) {
      throw;
    }
    throw ConfigError(e.message(), e.field(), file);
  } catch (const YAML::Exception& e) {
    throw ConfigError(e.what(), "", file);
  }

  return settings;
}

Settings loadSettings(const std::string& explicit_path) {
  const std::string path = findSettingsFile(explicit_path);
  if (path.empty()) {
    return Settings();
  }
  return parseSettings(readFile(path), path);
}

void applyLoggingSettings(const LoggingSettings& settings) {
  auto& registry = logging::LoggerRegistry::instance();

  std::shared_ptr<logging::LogSink> sink;
  if (settings.file.empty()) {
    sink = logging::SinkFactory::createStdioSink(true);
  } else {
    logging::RotatingFileSink::Config file_config;
    file_config.base_filename = settings.file;
    file_config.max_file_size = settings.max_file_size;
    file_config.max_files = settings.max_files;
    sink = std::make_shared<logging::RotatingFileSink>(file_config);
  }
  if (settings.json) {
    sink->setFormatter(std::make_unique<logging::JsonFormatter>());
  }
  registry.setSink(sink);

  registry.clearPatterns();
  registry.setGlobalLevel(settings.level);
  for (const auto& component : settings.components) {
    registry.setPattern(component.first, component.second);
  }
}

}  // namespace config
}  // namespace mcplink
