#ifndef MCPLINK_CONFIG_CONFIG_ERROR_H
#define MCPLINK_CONFIG_CONFIG_ERROR_H

#include <sstream>
#include <stdexcept>
#include <string>

namespace mcplink {
namespace config {

/**
 * Invalid or unreadable configuration, with the offending key path and
 * file where known.
 */
class ConfigError : public std::runtime_error {
 public:
  ConfigError(const std::string& message,
              const std::string& field = "",
              const std::string& file = "")
      : std::runtime_error(formatError(message, field, file)),
        message_(message),
        field_(field),
        file_(file) {}

  const std::string& message() const { return message_; }
  const std::string& field() const { return field_; }
  const std::string& file() const { return file_; }

 private:
  static std::string formatError(const std::string& msg,
                                 const std::string& field,
                                 const std::string& file) {
    std::ostringstream oss;
    oss << "Configuration error";
    if (!file.empty()) {
      oss << " in " << file;
    }
    if (!field.empty()) {
      oss << " at field '" << field << "'";
    }
    oss << ": " << msg;
    return oss.str();
  }

  std::string message_;
  std::string field_;
  std::string file_;
};

}  // namespace config
}  // namespace mcplink

#endif  // MCPLINK_CONFIG_CONFIG_ERROR_H
