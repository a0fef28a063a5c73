#ifndef MCPLINK_TRANSPORT_STDIO_SESSION_H
#define MCPLINK_TRANSPORT_STDIO_SESSION_H

#include <chrono>
#include <string>

#include "mcplink/event/event_loop.h"
#include "mcplink/protocol/jsonrpc.h"
#include "mcplink/protocol/line_framer.h"
#include "mcplink/protocol/request_tracker.h"
#include "mcplink/transport/child_process.h"
#include "mcplink/transport/mcp_session.h"

namespace mcplink {
namespace transport {

/**
 * JSON-RPC over the standard streams of a child process.
 *
 * open() spawns the process and completes once exec() succeeded, or fails
 * when it did not or the start-up deadline passed. Messages are written one
 * per line to stdin; stdout is split into lines by a LineFramer. stderr is
 * logged at debug. EOF or a read error on stdout means the process went
 * away: the child is reaped, on_closed fires and pending requests fail.
 */
class StdioSession : public McpSession {
 public:
  StdioSession(event::Dispatcher& dispatcher,
               const std::string& server_id,
               const StdioParams& params,
               std::chrono::milliseconds startup_timeout);
  ~StdioSession() override;

  void open(Callbacks callbacks, OpenCallback callback) override;

  void request(const std::string& method,
               const json& params,
               std::chrono::milliseconds timeout,
               RequestCallback callback) override;

  void notify(const std::string& method, const json& params) override;

  void close() override;

  pid_t pid() const { return process_.pid(); }
  size_t pendingRequests() const { return tracker_.pendingCount(); }

 private:
  enum class State { Idle, Spawning, Open, Closed };

  void onStatusReady();
  void onStdoutReady();
  void onStderrReady();
  void onStartupTimeout();

  void handleLine(const std::string& line);
  void handleRequest(const jsonrpc::Request& request);
  void handleResponse(const jsonrpc::Response& response);

  void sendMessage(const json& message);
  void flushWrites();

  // The process went away or became unusable
  void handleExit(const std::string& cause);
  void finishOpen(VoidResult result);
  void stopWatching();

  event::Dispatcher& dispatcher_;
  const std::string server_id_;
  const StdioParams params_;
  const std::chrono::milliseconds startup_timeout_;

  State state_{State::Idle};
  bool close_requested_{false};

  ChildProcess process_;
  protocol::LineFramer stdout_framer_;
  protocol::LineFramer stderr_framer_;
  protocol::RequestTracker tracker_;
  std::string write_buffer_;

  event::FileEventPtr status_event_;
  event::FileEventPtr stdout_event_;
  event::FileEventPtr stderr_event_;
  event::FileEventPtr stdin_event_;
  event::TimerPtr startup_timer_;

  Callbacks callbacks_;
  OpenCallback open_callback_;
};

}  // namespace transport
}  // namespace mcplink

#endif  // MCPLINK_TRANSPORT_STDIO_SESSION_H
