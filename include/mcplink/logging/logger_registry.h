#pragma once

#include <memory>
#include <mutex>
#include <regex>
#include <string>
#include <unordered_map>
#include <vector>

#include "mcplink/logging/logger.h"

namespace mcplink {
namespace logging {

// Pattern for glob-style log level control, e.g. "transport.*"
struct LogPattern {
  std::string glob;
  std::regex pattern;
  LogLevel level;

  LogPattern(const std::string& g, LogLevel lvl)
      : glob(g), pattern(globToRegex(g)), level(lvl) {}

 private:
  static std::string globToRegex(const std::string& glob) {
    std::string regex;
    for (char c : glob) {
      switch (c) {
        case '*':
          regex += ".*";
          break;
        case '?':
          regex += ".";
          break;
        case '.':
        case '+':
        case '(':
        case ')':
        case '[':
        case ']':
        case '{':
        case '}':
        case '^':
        case '$':
        case '|':
        case '\\':
          regex += '\\';
          regex += c;
          break;
        default:
          regex += c;
          break;
      }
    }
    return regex;
  }
};

/**
 * Process wide table of named loggers.
 *
 * Works without any setup: loggers are created on first use, share one
 * stderr sink and start at the global level. Patterns registered with
 * setPattern() override the global level for matching names; the most
 * recently added matching pattern wins.
 */
class LoggerRegistry {
 public:
  static LoggerRegistry& instance();

  std::shared_ptr<Logger> getOrCreateLogger(const std::string& name);
  std::shared_ptr<Logger> getDefaultLogger();

  void setGlobalLevel(LogLevel level);
  LogLevel getGlobalLevel() const;

  void setPattern(const std::string& pattern, LogLevel level);
  void clearPatterns();

  // Replaces the sink of every logger, existing and future
  void setSink(std::shared_ptr<LogSink> sink);
  std::shared_ptr<LogSink> getSink() const;

  LogLevel getEffectiveLevel(const std::string& name) const;

  // Get all registered loggers (for testing/debugging)
  std::vector<std::string> getLoggerNames() const;

 private:
  LoggerRegistry();

  LogLevel getEffectiveLevelLocked(const std::string& name) const;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::shared_ptr<Logger>> loggers_;
  std::vector<LogPattern> patterns_;
  LogLevel global_level_{LogLevel::Info};
  std::shared_ptr<Logger> default_logger_;
  std::shared_ptr<LogSink> default_sink_;
};

}  // namespace logging
}  // namespace mcplink
