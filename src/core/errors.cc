#include "mcplink/core/errors.h"

namespace mcplink {

std::string describe(const Error& error) {
  switch (error.kind) {
    case ErrorKind::Connection:
      return "MCP server '" + error.server_id +
             "' connection failed: " + error.message;
    case ErrorKind::Timeout:
      return error.message;
    case ErrorKind::ToolCall:
      return "tool '" + error.tool_name + "' on MCP server '" +
             error.server_id + "' failed: " + error.message;
    case ErrorKind::Protocol:
      if (error.code != 0) {
        return "protocol error " + std::to_string(error.code) + ": " +
               error.message;
      }
      return "protocol error: " + error.message;
  }
  return error.message;
}

McpError::McpError(const Error& error)
    : std::runtime_error(describe(error)), error_(error) {}

std::exception_ptr toExceptionPtr(const Error& error) {
  switch (error.kind) {
    case ErrorKind::Connection:
      return std::make_exception_ptr(ConnectionError(error));
    case ErrorKind::Timeout:
      return std::make_exception_ptr(TimeoutError(error));
    case ErrorKind::ToolCall:
      return std::make_exception_ptr(ToolCallError(error));
    case ErrorKind::Protocol:
      return std::make_exception_ptr(ProtocolError(error));
  }
  return std::make_exception_ptr(McpError(error));
}

void throwError(const Error& error) {
  std::rethrow_exception(toExceptionPtr(error));
}

}  // namespace mcplink
