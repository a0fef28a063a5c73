#ifndef MCPLINK_CONFIG_YAML_HELPERS_H
#define MCPLINK_CONFIG_YAML_HELPERS_H

#include <chrono>
#include <cstdint>
#include <string>

#include <yaml-cpp/yaml.h>

namespace mcplink {
namespace config {

/**
 * Replace ${VAR} and ${VAR:-default} with values from the environment.
 * An undefined variable without a default throws ConfigError naming
 * field.
 */
std::string expandEnvironment(const std::string& value,
                              const std::string& field = "");

// Entire file as a string; throws ConfigError when it cannot be read
std::string readFile(const std::string& path);

YAML::Node parseYaml(const std::string& content, const std::string& file);

// Scalar accessors. Missing keys yield the fallback, present keys of the
// wrong type throw ConfigError with the dotted key path.
std::string getString(const YAML::Node& node,
                      const std::string& key,
                      const std::string& path,
                      const std::string& fallback);
int64_t getInteger(const YAML::Node& node,
                   const std::string& key,
                   const std::string& path,
                   int64_t fallback,
                   int64_t min_value = 0);

// Directory part of a file path, "." when there is none
std::string directoryOf(const std::string& path);

}  // namespace config
}  // namespace mcplink

#endif  // MCPLINK_CONFIG_YAML_HELPERS_H
