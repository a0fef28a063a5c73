#ifndef MCPLINK_CONFIG_SETTINGS_H
#define MCPLINK_CONFIG_SETTINGS_H

#include <chrono>
#include <map>
#include <string>

#include "mcplink/logging/log_level.h"
#include "mcplink/transport/transport.h"

namespace mcplink {
namespace config {

struct LoggingSettings {
  logging::LogLevel level{logging::LogLevel::Info};
  std::string file;  // Empty logs to stderr
  bool json{false};
  size_t max_file_size{100 * 1024 * 1024};
  size_t max_files{10};
  std::map<std::string, logging::LogLevel> components;
};

struct Settings {
  transport::ClientOptions client;
  std::chrono::seconds default_timeout{kDefaultServerTimeout};
  LoggingSettings logging;
  std::string servers_file{"servers.yaml"};

  // File the settings came from, empty when defaults are in use
  std::string source;
};

/**
 * Locate the settings file. Search order:
 *   1. explicit_path (--config)
 *   2. MCPLINK_CONFIG environment variable
 *   3. ./mcplink.yaml
 *   4. ./config/mcplink.yaml
 *   5. /etc/mcplink/mcplink.yaml
 * Returns an empty string when none exists. An explicit path is returned
 * even when missing so loading reports it.
 */
std::string findSettingsFile(const std::string& explicit_path);

// Throws ConfigError
Settings parseSettings(const std::string& content, const std::string& file);
Settings loadSettings(const std::string& explicit_path);

// Points the logger registry at the configured sink, format and levels
void applyLoggingSettings(const LoggingSettings& settings);

}  // namespace config
}  // namespace mcplink

#endif  // MCPLINK_CONFIG_SETTINGS_H
