#include "mcplink/transport/client_factory.h"

#include "mcplink/http/sse_session.h"
#include "mcplink/http/streamable_http_session.h"
#include "mcplink/transport/http_client.h"
#include "mcplink/transport/stdio_client.h"

#define MCPLINK_LOG_COMPONENT "transport.client"
#include "mcplink/logging/log_macros.h"

namespace mcplink {
namespace transport {

namespace {

http::HttpSessionBase::Options sessionOptions(const ServerConfig& config,
                                              const std::string& url,
                                              const HeaderMap& headers) {
  http::HttpSessionBase::Options options;
  options.server_id = config.id;
  options.url = url;
  options.headers = headers;
  options.timeout =
      std::chrono::duration_cast<std::chrono::milliseconds>(config.timeout);
  return options;
}

}  // namespace

DefaultClientFactory::DefaultClientFactory(event::Dispatcher& dispatcher,
                                           const ClientOptions& options)
    : dispatcher_(dispatcher), options_(options) {}

DefaultClientFactory::~DefaultClientFactory() = default;

http::CurlMultiClient& DefaultClientFactory::httpClient() {
  if (!http_client_) {
    http::CurlMultiClient::Config config;
    config.connect_timeout = options_.http_connect_timeout;
    config.user_agent = options_.client_name + "/" + options_.client_version;
    http_client_ = std::make_unique<http::CurlMultiClient>(dispatcher_, config);
  }
  return *http_client_;
}

McpTransportClientPtr DefaultClientFactory::createClient(
    const ServerConfig& config, DisconnectListener& listener) {
  MCPLINK_LOG_DEBUG("[{}] creating {} client", config.id,
                    toString(config.kind()));

  return match(
      config.transport,
      [&](const StdioParams&) -> McpTransportClientPtr {
        return std::make_unique<StdioMcpClient>(dispatcher_, config, options_,
                                                listener);
      },
      [&](const SseParams& params) -> McpTransportClientPtr {
        auto session_options = sessionOptions(config, params.url, params.headers);
        http::CurlMultiClient& http = httpClient();
        event::Dispatcher& dispatcher = dispatcher_;
        return std::make_unique<HttpMcpClient>(
            dispatcher_, config, options_, listener,
            [&dispatcher, &http, session_options]() -> McpSessionPtr {
              return std::make_unique<http::SseSession>(dispatcher, http,
                                                        session_options);
            });
      },
      [&](const StreamableHttpParams& params) -> McpTransportClientPtr {
        auto session_options = sessionOptions(config, params.url, params.headers);
        http::CurlMultiClient& http = httpClient();
        event::Dispatcher& dispatcher = dispatcher_;
        return std::make_unique<HttpMcpClient>(
            dispatcher_, config, options_, listener,
            [&dispatcher, &http, session_options]() -> McpSessionPtr {
              return std::make_unique<http::StreamableHttpSession>(
                  dispatcher, http, session_options);
            });
      });
}

}  // namespace transport
}  // namespace mcplink
