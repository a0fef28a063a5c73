#ifndef MCPLINK_TYPES_H
#define MCPLINK_TYPES_H

#include <chrono>
#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "mcplink/core/compat.h"
#include "mcplink/core/result.h"

namespace mcplink {

using json = nlohmann::json;

// Live state of one client instance
enum class ConnectionStatus { Connecting, Connected, Disconnected, Error };

inline const char* toString(ConnectionStatus status) {
  switch (status) {
    case ConnectionStatus::Connecting:
      return "connecting";
    case ConnectionStatus::Connected:
      return "connected";
    case ConnectionStatus::Disconnected:
      return "disconnected";
    case ConnectionStatus::Error:
      return "error";
  }
  return "unknown";
}

// Status as recorded by the persistence collaborator. Closed marks a server
// an operator shut down on purpose; it is never restored at startup.
enum class PersistedStatus { Connected, Disconnected, Closed };

inline const char* toString(PersistedStatus status) {
  switch (status) {
    case PersistedStatus::Connected:
      return "connected";
    case PersistedStatus::Disconnected:
      return "disconnected";
    case PersistedStatus::Closed:
      return "closed";
  }
  return "unknown";
}

optional<PersistedStatus> persistedStatusFromString(const std::string& str);

using HeaderMap = std::map<std::string, std::string>;
using EnvironmentMap = std::map<std::string, std::string>;

// Transport parameters, one alternative per wire transport

struct StdioParams {
  std::string command;
  std::vector<std::string> args;
  EnvironmentMap env;
};

struct SseParams {
  std::string url;
  HeaderMap headers;
};

struct StreamableHttpParams {
  std::string url;
  HeaderMap headers;
};

using TransportParams = variant<StdioParams, SseParams, StreamableHttpParams>;

enum class TransportKind { Stdio, Sse, StreamableHttp };

const char* toString(TransportKind kind);
optional<TransportKind> transportKindFromString(const std::string& str);
TransportKind transportKindOf(const TransportParams& params);

constexpr std::chrono::seconds kDefaultServerTimeout{30};

/**
 * Connection settings for one MCP server, as read from persistence.
 * Immutable for the duration of one connection attempt.
 */
struct ServerConfig {
  std::string id;
  std::string name;
  TransportParams transport;
  std::chrono::seconds timeout{kDefaultServerTimeout};

  TransportKind kind() const { return transportKindOf(transport); }
};

struct ToolDescriptor {
  std::string name;
  optional<std::string> description;
  json input_schema = json::object();
};

// Content parts returned by tools/call

struct TextContent {
  std::string type = "text";
  std::string text;

  TextContent() = default;
  explicit TextContent(const std::string& t) : text(t) {}
};

struct ImageContent {
  std::string type = "image";
  std::string data;
  std::string mimeType;

  ImageContent() = default;
  ImageContent(const std::string& d, const std::string& mime)
      : data(d), mimeType(mime) {}
};

// Embedded resources and resource links are kept as raw JSON; the caller
// forwards them without interpretation.
struct ResourceContent {
  std::string type = "resource";
  json resource = json::object();
};

using ContentBlock = variant<TextContent, ImageContent, ResourceContent>;

struct CallToolResult {
  std::vector<ContentBlock> content;
  bool isError{false};
};

}  // namespace mcplink

#endif  // MCPLINK_TYPES_H
