#ifndef MCPLINK_CORE_ERRORS_H
#define MCPLINK_CORE_ERRORS_H

#include <exception>
#include <stdexcept>
#include <string>

#include "mcplink/core/result.h"

namespace mcplink {

/**
 * Base of the exceptions delivered through the future-returning API.
 *
 * Internally every failure travels as an Error inside a Result. When a
 * Result crosses into a std::promise it is converted to one of the classes
 * below so callers can catch by category.
 */
class McpError : public std::runtime_error {
 public:
  explicit McpError(const Error& error);

  const Error& error() const noexcept { return error_; }
  ErrorKind kind() const noexcept { return error_.kind; }

 private:
  Error error_;
};

class ConnectionError : public McpError {
 public:
  explicit ConnectionError(const Error& error) : McpError(error) {}
  ConnectionError(const std::string& server_id, const std::string& cause)
      : McpError(makeConnectionError(server_id, cause)) {}

  const std::string& serverId() const noexcept { return error().server_id; }
  const std::string& cause() const noexcept { return error().message; }
};

class TimeoutError : public McpError {
 public:
  explicit TimeoutError(const Error& error) : McpError(error) {}

  const std::string& method() const noexcept { return error().method; }
  std::chrono::milliseconds timeout() const noexcept {
    return error().timeout;
  }
};

class ToolCallError : public McpError {
 public:
  explicit ToolCallError(const Error& error) : McpError(error) {}

  const std::string& serverId() const noexcept { return error().server_id; }
  const std::string& toolName() const noexcept { return error().tool_name; }
  const std::string& cause() const noexcept { return error().message; }
};

class ProtocolError : public McpError {
 public:
  explicit ProtocolError(const Error& error) : McpError(error) {}

  int code() const noexcept { return error().code; }
};

// Wraps an Error in the exception class matching its kind
std::exception_ptr toExceptionPtr(const Error& error);

[[noreturn]] void throwError(const Error& error);

}  // namespace mcplink

#endif  // MCPLINK_CORE_ERRORS_H
