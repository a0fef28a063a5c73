#include "mcplink/transport/http_client.h"

#include <algorithm>

#define MCPLINK_LOG_COMPONENT "transport.http"
#include "mcplink/logging/log_macros.h"

namespace mcplink {
namespace transport {

HttpMcpClient::HttpMcpClient(event::Dispatcher& dispatcher,
                             const ServerConfig& config,
                             const ClientOptions& options,
                             DisconnectListener& listener,
                             SessionFactory session_factory)
    : McpClientBase(dispatcher, config, options, listener),
      session_factory_(std::move(session_factory)) {
  heartbeat_timer_ = dispatcher_.createTimer([this]() { sendHeartbeat(); });
}

HttpMcpClient::~HttpMcpClient() {
  ++heartbeat_epoch_;
  heartbeat_timer_->disableTimer();
  // A probe in flight is failed here, while heartbeat_epoch_ still exists
  abandonConnection();
}

McpSessionPtr HttpMcpClient::createSession() { return session_factory_(); }

std::string HttpMcpClient::clientName() const {
  return options_.client_name + "-" + config_.name;
}

bool HttpMcpClient::heartbeatActive() const {
  return heartbeat_timer_->enabled() || probe_in_flight_;
}

void HttpMcpClient::onConnected() {
  heartbeat_failures_ = 0;
  probe_in_flight_ = false;
  ++heartbeat_epoch_;
  armHeartbeat();
}

void HttpMcpClient::onTearDown() {
  // Any probe still in flight belongs to a dead epoch and is ignored
  ++heartbeat_epoch_;
  probe_in_flight_ = false;
  heartbeat_timer_->disableTimer();
}

void HttpMcpClient::onRequestFailed(const Error& error) {
  handleDisconnect(error);
}

void HttpMcpClient::armHeartbeat() {
  if (options_.heartbeat_interval.count() <= 0) {
    return;
  }
  heartbeat_timer_->enableTimer(options_.heartbeat_interval);
}

void HttpMcpClient::sendHeartbeat() {
  if (status() != ConnectionStatus::Connected) {
    return;
  }

  probe_in_flight_ = true;
  const uint64_t epoch = heartbeat_epoch_;
  sendRequest("ping", json::object(), [this, epoch](Result<json> result) {
    if (epoch != heartbeat_epoch_) {
      return;
    }
    probe_in_flight_ = false;

    if (is_success(result)) {
      heartbeat_failures_ = 0;
      armHeartbeat();
      return;
    }

    ++heartbeat_failures_;
    const Error& error = *get_error(result);
    const uint32_t tolerance =
        std::max<uint32_t>(1, options_.heartbeat_failure_tolerance);
    MCPLINK_LOG_WARNING("[{}] heartbeat failed ({}/{}): {}", serverId(),
                        heartbeat_failures_, tolerance, error.message);

    if (heartbeat_failures_ >= tolerance) {
      heartbeat_timer_->disableTimer();
      handleDisconnect(makeConnectionError(
          serverId(), "heartbeat failed: " + error.message, error.code));
      return;
    }
    armHeartbeat();
  });
}

}  // namespace transport
}  // namespace mcplink
