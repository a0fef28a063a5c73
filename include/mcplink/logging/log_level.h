#pragma once

#include <cstdint>
#include <string>

#include "mcplink/core/compat.h"

namespace mcplink {
namespace logging {

// Log levels matching the MCP logging levels (RFC-5424)
enum class LogLevel : uint8_t {
  Debug = 0,
  Info = 1,
  Notice = 2,
  Warning = 3,
  Error = 4,
  Critical = 5,
  Alert = 6,
  Emergency = 7,
  Off = 8
};

// Sink types
enum class SinkType { File, Stdio, Null };

inline const char* logLevelToString(LogLevel level) {
  switch (level) {
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info: return "INFO";
    case LogLevel::Notice: return "NOTICE";
    case LogLevel::Warning: return "WARNING";
    case LogLevel::Error: return "ERROR";
    case LogLevel::Critical: return "CRITICAL";
    case LogLevel::Alert: return "ALERT";
    case LogLevel::Emergency: return "EMERGENCY";
    case LogLevel::Off: return "OFF";
  }
  return "UNKNOWN";
}

// Accepts the upper or lower case spelling; nullopt for anything else
inline optional<LogLevel> parseLogLevel(const std::string& str) {
  if (str == "DEBUG" || str == "debug") return LogLevel::Debug;
  if (str == "INFO" || str == "info") return LogLevel::Info;
  if (str == "NOTICE" || str == "notice") return LogLevel::Notice;
  if (str == "WARNING" || str == "warning") return LogLevel::Warning;
  if (str == "ERROR" || str == "error") return LogLevel::Error;
  if (str == "CRITICAL" || str == "critical") return LogLevel::Critical;
  if (str == "ALERT" || str == "alert") return LogLevel::Alert;
  if (str == "EMERGENCY" || str == "emergency") return LogLevel::Emergency;
  if (str == "OFF" || str == "off") return LogLevel::Off;
  return nullopt;
}

inline LogLevel stringToLogLevel(const std::string& str) {
  auto level = parseLogLevel(str);
  return level ? *level : LogLevel::Info;  // Default
}

}  // namespace logging
}  // namespace mcplink
