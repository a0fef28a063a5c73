#ifndef MCPLINK_TRANSPORT_STDIO_CLIENT_H
#define MCPLINK_TRANSPORT_STDIO_CLIENT_H

#include "mcplink/transport/mcp_client_base.h"

namespace mcplink {
namespace transport {

/**
 * MCP client for a server launched as a child process.
 *
 * The process is spawned on connect() and killed on disconnect(). When it
 * exits on its own the client fails outstanding requests, drops its tool
 * cache and reports the closure to the listener.
 */
class StdioMcpClient : public McpClientBase {
 public:
  StdioMcpClient(event::Dispatcher& dispatcher,
                 const ServerConfig& config,
                 const ClientOptions& options,
                 DisconnectListener& listener);

 protected:
  McpSessionPtr createSession() override;
};

}  // namespace transport
}  // namespace mcplink

#endif  // MCPLINK_TRANSPORT_STDIO_CLIENT_H
