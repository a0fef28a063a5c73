#ifndef MCPLINK_TRANSPORT_HTTP_CLIENT_H
#define MCPLINK_TRANSPORT_HTTP_CLIENT_H

#include <functional>

#include "mcplink/transport/mcp_client_base.h"

namespace mcplink {
namespace transport {

/**
 * MCP client for the SSE and streamable HTTP transports.
 *
 * While connected a heartbeat sends "ping" every heartbeat_interval. The
 * next probe is armed only when the previous one has completed. After
 * heartbeat_failure_tolerance consecutive failed probes the connection is
 * considered lost. Any failed tools/list or tools/call is treated the same
 * way: the client tears down before the error reaches the caller.
 */
class HttpMcpClient : public McpClientBase {
 public:
  using SessionFactory = std::function<McpSessionPtr()>;

  HttpMcpClient(event::Dispatcher& dispatcher,
                const ServerConfig& config,
                const ClientOptions& options,
                DisconnectListener& listener,
                SessionFactory session_factory);
  ~HttpMcpClient() override;

  // Timer armed or probe in flight
  bool heartbeatActive() const;
  uint32_t consecutiveHeartbeatFailures() const { return heartbeat_failures_; }

 protected:
  McpSessionPtr createSession() override;
  std::string clientName() const override;
  void onConnected() override;
  void onTearDown() override;
  void onRequestFailed(const Error& error) override;

 private:
  void armHeartbeat();
  void sendHeartbeat();

  SessionFactory session_factory_;
  event::TimerPtr heartbeat_timer_;
  bool probe_in_flight_{false};
  uint32_t heartbeat_failures_{0};
  uint64_t heartbeat_epoch_{0};
};

}  // namespace transport
}  // namespace mcplink

#endif  // MCPLINK_TRANSPORT_HTTP_CLIENT_H
