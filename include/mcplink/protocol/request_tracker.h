#ifndef MCPLINK_PROTOCOL_REQUEST_TRACKER_H
#define MCPLINK_PROTOCOL_REQUEST_TRACKER_H

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>

#include <nlohmann/json.hpp>

#include "mcplink/core/result.h"
#include "mcplink/event/event_loop.h"

namespace mcplink {
namespace protocol {

/**
 * Correlates outstanding requests with their responses.
 *
 * Every tracked request owns a one-shot timer on the dispatcher. Exactly
 * one of complete(), the timer, or failAll() delivers the callback; a
 * response that arrives after that point is reported by complete()
 * returning false and is otherwise ignored.
 *
 * Dispatcher thread only.
 */
class RequestTracker {
 public:
  using Callback = std::function<void(Result<nlohmann::json>)>;

  explicit RequestTracker(event::Dispatcher& dispatcher)
      : dispatcher_(dispatcher) {}

  // Pending callbacks are dropped without being invoked
  ~RequestTracker();

  RequestTracker(const RequestTracker&) = delete;
  RequestTracker& operator=(const RequestTracker&) = delete;

  int64_t nextId() { return next_id_++; }

  // A zero timeout waits forever
  void track(int64_t id,
             const std::string& method,
             std::chrono::milliseconds timeout,
             Callback callback);

  bool complete(int64_t id, Result<nlohmann::json> result);

  // Fails every pending request with the same error
  void failAll(const Error& error);

  size_t pendingCount() const { return pending_.size(); }
  bool contains(int64_t id) const { return pending_.count(id) > 0; }

 private:
  struct PendingRequest : public event::DeferredDeletable {
    std::string method;
    std::chrono::milliseconds timeout{0};
    std::chrono::steady_clock::time_point start_time;
    Callback callback;
    event::TimerPtr timer;
  };
  using PendingRequestPtr = std::unique_ptr<PendingRequest>;

  void onTimeout(int64_t id);

  event::Dispatcher& dispatcher_;
  int64_t next_id_{1};
  std::unordered_map<int64_t, PendingRequestPtr> pending_;
};

}  // namespace protocol
}  // namespace mcplink

#endif  // MCPLINK_PROTOCOL_REQUEST_TRACKER_H
