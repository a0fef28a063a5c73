#ifndef MCPLINK_TRANSPORT_TRANSPORT_H
#define MCPLINK_TRANSPORT_TRANSPORT_H

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "mcplink/core/result.h"
#include "mcplink/event/event_loop.h"
#include "mcplink/types.h"

namespace mcplink {
namespace transport {

/**
 * Receives self-detected closure of a connected client.
 *
 * Invoked on the dispatcher thread, at most once per client instance, and
 * only when the client notices the channel died on its own (process exit,
 * stream closed, heartbeat failure). A local disconnect() never triggers
 * it.
 */
class DisconnectListener {
 public:
  virtual ~DisconnectListener() = default;

  virtual void onDisconnected(const std::string& server_id) = 0;
};

/**
 * Settings shared by every client a factory creates.
 */
struct ClientOptions {
  std::string client_name = "McpClient";
  std::string client_version = "1.0.0";
  std::string protocol_version = "2024-11-05";

  // HTTP transports only
  std::chrono::milliseconds heartbeat_interval{30000};
  uint32_t heartbeat_failure_tolerance{1};
  std::chrono::milliseconds http_connect_timeout{10000};
};

using ConnectCallback = std::function<void(VoidResult)>;
using DisconnectCallback = std::function<void()>;
using ListToolsCallback =
    std::function<void(Result<std::vector<ToolDescriptor>>)>;
using CallToolCallback = std::function<void(Result<CallToolResult>)>;

/**
 * Uniform capability set of one connection to one MCP server.
 *
 * Every method must be called on the dispatcher thread and every callback
 * is invoked there. Errors follow the ErrorKind categories:
 *
 *   connect:   Connection on unreachable endpoint or failed handshake
 *   listTools: Connection when not connected, Timeout, Protocol
 *   callTool:  Connection when not connected or when the channel dies,
 *              Timeout, ToolCall for error replies and malformed results
 *
 * Instances are destroyed through Dispatcher::deferredDelete() so they can
 * be released from inside their own callbacks.
 */
class McpTransportClient : public event::DeferredDeletable {
 public:
  ~McpTransportClient() override = default;

  // Succeeds at once when already connected; joins an attempt in progress
  virtual void connect(ConnectCallback callback) = 0;

  // Never fails; tolerates a channel that is already gone
  virtual void disconnect(DisconnectCallback callback) = 0;

  virtual void listTools(ListToolsCallback callback) = 0;

  virtual void callTool(const std::string& name,
                        const json& arguments,
                        CallToolCallback callback) = 0;

  // Safe to read from any thread
  virtual ConnectionStatus status() const = 0;

  virtual const std::string& serverId() const = 0;
  virtual TransportKind kind() const = 0;
};

using McpTransportClientPtr = std::unique_ptr<McpTransportClient>;

}  // namespace transport
}  // namespace mcplink

#endif  // MCPLINK_TRANSPORT_TRANSPORT_H
