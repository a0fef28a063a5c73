#ifndef MCPLINK_TRANSPORT_CLIENT_FACTORY_H
#define MCPLINK_TRANSPORT_CLIENT_FACTORY_H

#include <memory>

#include "mcplink/event/event_loop.h"
#include "mcplink/http/curl_multi_client.h"
#include "mcplink/transport/transport.h"

namespace mcplink {
namespace transport {

/**
 * Builds the transport-appropriate client for a server configuration.
 */
class ClientFactory {
 public:
  virtual ~ClientFactory() = default;

  virtual McpTransportClientPtr createClient(const ServerConfig& config,
                                             DisconnectListener& listener) = 0;
};

/**
 * Factory for the real transports. Owns the HTTP client shared by every
 * SSE and streamable HTTP connection; it is created on first use.
 */
class DefaultClientFactory : public ClientFactory {
 public:
  DefaultClientFactory(event::Dispatcher& dispatcher,
                       const ClientOptions& options);
  ~DefaultClientFactory() override;

  McpTransportClientPtr createClient(const ServerConfig& config,
                                     DisconnectListener& listener) override;

  const ClientOptions& options() const { return options_; }

 private:
  http::CurlMultiClient& httpClient();

  event::Dispatcher& dispatcher_;
  const ClientOptions options_;
  http::CurlMultiClientPtr http_client_;
};

}  // namespace transport
}  // namespace mcplink

#endif  // MCPLINK_TRANSPORT_CLIENT_FACTORY_H
