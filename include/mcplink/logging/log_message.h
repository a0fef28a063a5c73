#pragma once

#include <chrono>
#include <map>
#include <string>
#include <thread>
#include <unistd.h>

#include "mcplink/logging/log_level.h"

namespace mcplink {
namespace logging {

// One log record with its source location and connection context
struct LogMessage {
  LogLevel level{LogLevel::Info};
  std::string message;
  std::chrono::system_clock::time_point timestamp;

  // Name of the logger, e.g. "transport.stdio"
  std::string logger_name;

  // Source location
  const char* file{nullptr};
  int line{0};
  const char* function{nullptr};

  // Process and thread info
  pid_t process_id{0};
  std::thread::id thread_id;

  // Connection context
  std::string server_id;
  std::string request_id;
  std::string method_name;
  std::string tool_name;

  // Custom metadata
  std::map<std::string, std::string> key_values;

  LogMessage()
      : timestamp(std::chrono::system_clock::now()),
        process_id(getpid()),
        thread_id(std::this_thread::get_id()) {}
};

}  // namespace logging
}  // namespace mcplink
