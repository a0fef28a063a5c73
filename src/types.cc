#include "mcplink/types.h"

namespace mcplink {

optional<PersistedStatus> persistedStatusFromString(const std::string& str) {
  if (str == "connected") return PersistedStatus::Connected;
  if (str == "disconnected") return PersistedStatus::Disconnected;
  if (str == "closed") return PersistedStatus::Closed;
  return nullopt;
}

const char* toString(TransportKind kind) {
  switch (kind) {
    case TransportKind::Stdio:
      return "stdio";
    case TransportKind::Sse:
      return "sse";
    case TransportKind::StreamableHttp:
      return "streamable-http";
  }
  return "unknown";
}

optional<TransportKind> transportKindFromString(const std::string& str) {
  if (str == "stdio") return TransportKind::Stdio;
  if (str == "sse") return TransportKind::Sse;
  if (str == "streamable-http" || str == "streamableHttp") {
    return TransportKind::StreamableHttp;
  }
  return nullopt;
}

TransportKind transportKindOf(const TransportParams& params) {
  return match(
      params, [](const StdioParams&) { return TransportKind::Stdio; },
      [](const SseParams&) { return TransportKind::Sse; },
      [](const StreamableHttpParams&) { return TransportKind::StreamableHttp; });
}

}  // namespace mcplink
