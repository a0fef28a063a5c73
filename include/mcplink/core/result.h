#ifndef MCPLINK_CORE_RESULT_H
#define MCPLINK_CORE_RESULT_H

#include <chrono>
#include <cstddef>
#include <type_traits>
#include <string>
#include <utility>

#include "mcplink/core/compat.h"

namespace mcplink {

/**
 * Failure categories surfaced by connections.
 *
 * Connection: endpoint unreachable, handshake failed, or the channel died.
 * Timeout:    a single request exceeded its deadline.
 * ToolCall:   a tool invocation failed after the connection was established.
 * Protocol:   the peer answered with a JSON-RPC error or a malformed reply.
 */
enum class ErrorKind { Connection, Timeout, ToolCall, Protocol };

inline const char* errorKindToString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::Connection:
      return "connection";
    case ErrorKind::Timeout:
      return "timeout";
    case ErrorKind::ToolCall:
      return "tool_call";
    case ErrorKind::Protocol:
      return "protocol";
  }
  return "unknown";
}

struct Error {
  ErrorKind kind{ErrorKind::Protocol};
  int code{0};
  std::string message;

  // Context, filled in according to kind
  std::string server_id;
  std::string method;
  std::string tool_name;
  std::chrono::milliseconds timeout{0};

  Error() = default;
  Error(int c, const std::string& m) : code(c), message(m) {}
  Error(ErrorKind k, int c, const std::string& m)
      : kind(k), code(c), message(m) {}
};

// Result is either a value or the Error that prevented it
template <typename T>
using Result = variant<T, Error>;

// For cleaner API, we define a VoidResult type
using VoidResult = Result<std::nullptr_t>;

template <typename T>
bool is_success(const Result<T>& result) {
  return holds_alternative<T>(result);
}

template <typename T>
bool is_error(const Result<T>& result) {
  return holds_alternative<Error>(result);
}

template <typename T>
const T* get_value(const Result<T>& result) {
  return get_if<T>(&result);
}

template <typename T>
T* get_value(Result<T>& result) {
  return get_if<T>(&result);
}

template <typename T>
const Error* get_error(const Result<T>& result) {
  return get_if<Error>(&result);
}

inline VoidResult makeVoidSuccess() { return VoidResult(nullptr); }

inline VoidResult makeVoidError(const Error& error) {
  return VoidResult(error);
}

template <typename T>
Result<std::decay_t<T>> makeSuccess(T&& value) {
  return Result<std::decay_t<T>>(std::forward<T>(value));
}

template <typename T>
Result<T> makeError(const Error& error) {
  return Result<T>(error);
}

template <typename T>
Result<T> makeError(int code, const std::string& message) {
  return Result<T>(Error(code, message));
}

// Error factories. The message field always holds the cause; the kind
// specific fields carry the context the caller needs to act on it.

inline Error makeConnectionError(const std::string& server_id,
                                 const std::string& cause,
                                 int code = 0) {
  Error err(ErrorKind::Connection, code, cause);
  err.server_id = server_id;
  return err;
}

inline Error makeTimeoutError(const std::string& method,
                              std::chrono::milliseconds timeout) {
  Error err(ErrorKind::Timeout, 0,
            "request '" + method + "' timed out after " +
                std::to_string(timeout.count()) + "ms");
  err.method = method;
  err.timeout = timeout;
  return err;
}

inline Error makeToolCallError(const std::string& server_id,
                               const std::string& tool_name,
                               const Error& cause) {
  Error err(ErrorKind::ToolCall, cause.code, cause.message);
  err.server_id = server_id;
  err.tool_name = tool_name;
  err.method = cause.method;
  err.timeout = cause.timeout;
  return err;
}

inline Error makeProtocolError(int code, const std::string& message) {
  return Error(ErrorKind::Protocol, code, message);
}

// Human readable one-line description including the context fields
std::string describe(const Error& error);

}  // namespace mcplink

#endif  // MCPLINK_CORE_RESULT_H
