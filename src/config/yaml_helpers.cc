#include "mcplink/config/yaml_helpers.h"

#include <cstdlib>
#include <fstream>
#include <regex>
#include <sstream>

#include "mcplink/config/config_error.h"

#define MCPLINK_LOG_COMPONENT "config"
#include "mcplink/logging/log_macros.h"

namespace mcplink {
namespace config {

std::string expandEnvironment(const std::string& value,
                              const std::string& field) {
  if (value.find("${") == std::string::npos) {
    return value;
  }

  static const std::regex env_regex(
      R"(\$\{([A-Za-z_][A-Za-z0-9_]*)(:-([^}]*))?\})");

  std::string result;
  auto search_start = value.cbegin();
  std::smatch match;

  while (std::regex_search(search_start, value.cend(), match, env_regex)) {
    const std::string var_name = match[1].str();
    const bool has_default = match[2].matched;

    const char* env_value = std::getenv(var_name.c_str());
    if (!env_value && !has_default) {
      MCPLINK_LOG_ERROR("Undefined environment variable without default: ${{{}}}",
                        var_name);
      throw ConfigError("undefined environment variable: " + var_name, field);
    }

    result.append(search_start, match[0].first);
    result += env_value ? std::string(env_value) : match[3].str();
    search_start = match[0].second;
  }
  result.append(search_start, value.cend());
  return result;
}

std::string readFile(const std::string& path) {
  std::ifstream file(path, std::ios::in | std::ios::binary);
  if (!file) {
    throw ConfigError("cannot open file", "", path);
  }
  std::ostringstream content;
  content << file.rdbuf();
  return content.str();
}

YAML::Node parseYaml(const std::string& content, const std::string& file) {
  try {
    return YAML::Load(content);
  } catch (const YAML::ParserException& e) {
    std::ostringstream error;
    error << "YAML parse error at line " << e.mark.line + 1 << ", column "
          << e.mark.column + 1 << ": " << e.msg;
    throw ConfigError(error.str(), "", file);
  }
}

std::string getString(const YAML::Node& node,
                      const std::string& key,
                      const std::string& path,
                      const std::string& fallback) {
  const YAML::Node value = node[key];
  if (!value || value.IsNull()) {
    return fallback;
  }
  if (!value.IsScalar()) {
    throw ConfigError("expected a string", path);
  }
  return expandEnvironment(value.as<std::string>(), path);
}

int64_t getInteger(const YAML::Node& node,
                   const std::string& key,
                   const std::string& path,
                   int64_t fallback,
                   int64_t min_value) {
  const YAML::Node value = node[key];
  if (!value || value.IsNull()) {
    return fallback;
  }
  if (!value.IsScalar()) {
    throw ConfigError("expected an integer", path);
  }
  const std::string text = expandEnvironment(value.as<std::string>(), path);
  int64_t parsed = 0;
  try {
    size_t consumed = 0;
    parsed = std::stoll(text, &consumed);
    if (consumed != text.size()) {
      throw ConfigError("expected an integer, got '" + text + "'", path);
    }
  } catch (const std::logic_error&) {
    throw ConfigError("expected an integer, got '" + text + "'", path);
  }
  if (parsed < min_value) {
    throw ConfigError("must be at least " + std::to_string(min_value), path);
  }
  return parsed;
}

std::string directoryOf(const std::string& path) {
  size_t slash = path.rfind('/');
  if (slash == std::string::npos) {
    return ".";
  }
  if (slash == 0) {
    return "/";
  }
  return path.substr(0, slash);
}

}  // namespace config
}  // namespace mcplink
