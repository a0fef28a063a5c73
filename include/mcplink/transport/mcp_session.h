#ifndef MCPLINK_TRANSPORT_MCP_SESSION_H
#define MCPLINK_TRANSPORT_MCP_SESSION_H

#include <chrono>
#include <functional>
#include <memory>
#include <string>

#include "mcplink/core/result.h"
#include "mcplink/event/event_loop.h"
#include "mcplink/types.h"

namespace mcplink {
namespace transport {

/**
 * A JSON-RPC channel to one MCP server.
 *
 * Sessions carry messages only; the MCP handshake and tool semantics live
 * in the client on top. Implementations exist for a child process over
 * stdio and for the two HTTP transports.
 *
 * Contract:
 *  - open() completes exactly once.
 *  - Every request() completes exactly once, with a Timeout error when the
 *    deadline passes first.
 *  - When the channel dies on its own, on_closed fires once and then
 *    outstanding requests fail with a Connection error. on_closed may
 *    call close(); the requests still fail.
 *  - close() fails outstanding requests with a Connection error. After it
 *    returns no callback of any kind is invoked.
 *
 * Sessions are destroyed through Dispatcher::deferredDelete() because
 * close() is commonly called from inside one of their callbacks.
 */
class McpSession : public event::DeferredDeletable {
 public:
  struct Callbacks {
    // Channel died without close() being called
    std::function<void(const Error&)> on_closed;
    // Server notification other than responses
    std::function<void(const std::string& method, const json& params)>
        on_notification;
  };

  using OpenCallback = std::function<void(VoidResult)>;
  using RequestCallback = std::function<void(Result<json>)>;

  ~McpSession() override = default;

  virtual void open(Callbacks callbacks, OpenCallback callback) = 0;

  virtual void request(const std::string& method,
                       const json& params,
                       std::chrono::milliseconds timeout,
                       RequestCallback callback) = 0;

  virtual void notify(const std::string& method, const json& params) = 0;

  virtual void close() = 0;
};

using McpSessionPtr = std::unique_ptr<McpSession>;

}  // namespace transport
}  // namespace mcplink

#endif  // MCPLINK_TRANSPORT_MCP_SESSION_H
