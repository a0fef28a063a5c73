#include "mcplink/transport/stdio_client.h"

#include "mcplink/transport/stdio_session.h"

namespace mcplink {
namespace transport {

StdioMcpClient::StdioMcpClient(event::Dispatcher& dispatcher,
                               const ServerConfig& config,
                               const ClientOptions& options,
                               DisconnectListener& listener)
    : McpClientBase(dispatcher, config, options, listener) {}

McpSessionPtr StdioMcpClient::createSession() {
  // The server timeout also bounds process start-up
  return std::make_unique<StdioSession>(
      dispatcher_, config_.id, get<StdioParams>(config_.transport),
      requestTimeout());
}

}  // namespace transport
}  // namespace mcplink
