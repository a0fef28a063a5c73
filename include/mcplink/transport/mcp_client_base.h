#ifndef MCPLINK_TRANSPORT_MCP_CLIENT_BASE_H
#define MCPLINK_TRANSPORT_MCP_CLIENT_BASE_H

#include <atomic>
#include <chrono>
#include <string>
#include <vector>

#include "mcplink/event/event_loop.h"
#include "mcplink/transport/mcp_session.h"
#include "mcplink/transport/transport.h"

namespace mcplink {
namespace transport {

/**
 * MCP client logic shared by every transport.
 *
 * Runs the initialize handshake over an McpSession supplied by the
 * subclass, caches tools/list, maps tools/call results and errors, and
 * owns the single-shot disconnect path that reports self-detected closure
 * to the DisconnectListener.
 */
class McpClientBase : public McpTransportClient {
 public:
  McpClientBase(event::Dispatcher& dispatcher,
                const ServerConfig& config,
                const ClientOptions& options,
                DisconnectListener& listener);
  ~McpClientBase() override;

  void connect(ConnectCallback callback) override;
  void disconnect(DisconnectCallback callback) override;
  void listTools(ListToolsCallback callback) override;
  void callTool(const std::string& name,
                const json& arguments,
                CallToolCallback callback) override;

  ConnectionStatus status() const override { return status_.load(); }
  const std::string& serverId() const override { return config_.id; }
  TransportKind kind() const override { return config_.kind(); }

  const ServerConfig& config() const { return config_; }

  // Number of tools/list requests put on the wire; the cache test hook
  size_t toolListRequests() const { return tool_list_requests_; }

 protected:
  virtual McpSessionPtr createSession() = 0;

  // clientInfo.name sent in initialize
  virtual std::string clientName() const { return options_.client_name; }

  // Hooks around the connection lifetime
  virtual void onConnected() {}
  virtual void onTearDown() {}

  // Called after any failed tools/list or tools/call, before the caller
  // sees the error
  virtual void onRequestFailed(const Error& /*error*/) {}

  /**
   * Self-detected closure. Stops everything, fails outstanding requests,
   * clears the tool cache, marks the client disconnected and informs the
   * listener. Only the first call while connected has any effect.
   */
  void handleDisconnect(const Error& cause);

  // Drops the session without hooks or listener. Pending callers still get
  // their Connection error. Subclass destructors call this while their own
  // members are alive.
  void abandonConnection();

  void sendRequest(const std::string& method,
                   const json& params,
                   McpSession::RequestCallback callback);

  std::chrono::milliseconds requestTimeout() const;

  event::Dispatcher& dispatcher_;
  const ServerConfig config_;
  const ClientOptions options_;

 private:
  void initialize();
  void finishConnect(VoidResult result);
  void failConnect(const Error& error);
  void releaseSession();
  void onNotification(const std::string& method, const json& params);
  void finishListTools(Result<std::vector<ToolDescriptor>> result);

  DisconnectListener& listener_;
  std::atomic<ConnectionStatus> status_{ConnectionStatus::Disconnected};
  bool listener_notified_{false};

  McpSessionPtr session_;
  std::vector<ConnectCallback> connect_waiters_;

  optional<std::vector<ToolDescriptor>> tools_cache_;
  std::vector<ListToolsCallback> list_waiters_;
  size_t tool_list_requests_{0};

  // Bumped whenever a connection ends so stale completions are ignored
  uint64_t generation_{0};
};

}  // namespace transport
}  // namespace mcplink

#endif  // MCPLINK_TRANSPORT_MCP_CLIENT_BASE_H
