#ifndef MCPLINK_REGISTRY_CONNECTION_REGISTRY_H
#define MCPLINK_REGISTRY_CONNECTION_REGISTRY_H

#include <functional>
#include <future>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "mcplink/event/event_loop.h"
#include "mcplink/registry/server_store.h"
#include "mcplink/transport/client_factory.h"
#include "mcplink/transport/transport.h"

namespace mcplink {
namespace registry {

/**
 * Maps server ids to live MCP clients.
 *
 * Created once at startup and handed to whoever needs connections. Clients
 * are created lazily from the store's configuration on first use, kept
 * while connected, and dropped on disconnect() or when the client reports
 * that its channel died. In the latter case the store is told the server
 * is now disconnected.
 *
 * Every operation comes in two forms. The callback form must be called on
 * the dispatcher thread and completes there. The *Async form may be called
 * from any other thread; it posts the work to the dispatcher and returns a
 * future that raises the McpError subclass matching the failure. Blocking
 * on such a future from the dispatcher thread deadlocks.
 *
 * The registry must outlive the work it started on the dispatcher; tear
 * down with disconnectAll() before destroying it.
 */
class ConnectionRegistry : public transport::DisconnectListener {
 public:
  using ConnectCallback = std::function<void(VoidResult)>;
  using DoneCallback = std::function<void()>;

  struct RestoreSummary {
    size_t succeeded{0};
    size_t failed{0};
  };
  using RestoreCallback = std::function<void(RestoreSummary)>;

  ConnectionRegistry(event::Dispatcher& dispatcher,
                     ServerStore& store,
                     transport::ClientFactory& factory);
  ~ConnectionRegistry() override;

  // Dispatcher thread

  void connect(const std::string& id, ConnectCallback callback);
  void disconnect(const std::string& id, DoneCallback callback);
  void getTools(const std::string& id, transport::ListToolsCallback callback);
  void callTool(const std::string& id,
                const std::string& name,
                const json& arguments,
                transport::CallToolCallback callback);
  void disconnectAll(DoneCallback callback);
  void restoreConnections(RestoreCallback callback);

  // Any thread except the dispatcher's

  std::future<bool> connectAsync(const std::string& id);
  std::future<void> disconnectAsync(const std::string& id);
  std::future<std::vector<ToolDescriptor>> getToolsAsync(const std::string& id);
  std::future<CallToolResult> callToolAsync(const std::string& id,
                                            const std::string& name,
                                            const json& arguments);
  std::future<void> disconnectAllAsync();
  std::future<RestoreSummary> restoreConnectionsAsync();

  // Any thread

  ConnectionStatus getStatus(const std::string& id) const;
  bool isConnected(const std::string& id) const;
  std::vector<std::string> getConnectedIds() const;

  // transport::DisconnectListener
  void onDisconnected(const std::string& server_id) override;

 private:
  struct PendingConnect {
    uint64_t attempt{0};
    transport::McpTransportClientPtr client;
    std::vector<ConnectCallback> waiters;
  };

  void finishConnect(const std::string& id, uint64_t attempt, VoidResult result);
  transport::McpTransportClient* findConnected(const std::string& id);
  void releaseClient(transport::McpTransportClientPtr client,
                     DoneCallback callback);
  void restoreNext(std::shared_ptr<std::vector<std::string>> ids,
                   size_t index,
                   RestoreSummary summary,
                   RestoreCallback callback);
  void flushStatusUpdates();

  event::Dispatcher& dispatcher_;
  ServerStore& store_;
  transport::ClientFactory& factory_;

  // Guards entries_ and connecting_ for readers on other threads; both are
  // only mutated on the dispatcher thread
  mutable std::mutex mutex_;
  std::map<std::string, transport::McpTransportClientPtr> entries_;
  std::map<std::string, PendingConnect> connecting_;
  uint64_t next_attempt_{1};

  // Store updates for servers that dropped, applied outside the client's
  // callback
  std::vector<std::string> pending_status_updates_;
  event::TimerPtr status_timer_;
};

}  // namespace registry
}  // namespace mcplink

#endif  // MCPLINK_REGISTRY_CONNECTION_REGISTRY_H
