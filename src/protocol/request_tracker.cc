#include "mcplink/protocol/request_tracker.h"

#define MCPLINK_LOG_COMPONENT "protocol.tracker"
#include "mcplink/logging/log_macros.h"

namespace mcplink {
namespace protocol {

RequestTracker::~RequestTracker() {
  for (auto& entry : pending_) {
    if (entry.second->timer) {
      entry.second->timer->disableTimer();
    }
  }
}

void RequestTracker::track(int64_t id,
                           const std::string& method,
                           std::chrono::milliseconds timeout,
                           Callback callback) {
  auto request = std::make_unique<PendingRequest>();
  request->method = method;
  request->timeout = timeout;
  request->start_time = dispatcher_.approximateMonotonicTime();
  request->callback = std::move(callback);

  if (timeout.count() > 0) {
    request->timer = dispatcher_.createTimer([this, id]() { onTimeout(id); });
    request->timer->enableTimer(timeout);
  }

  pending_[id] = std::move(request);
}

bool RequestTracker::complete(int64_t id, Result<nlohmann::json> result) {
  auto it = pending_.find(id);
  if (it == pending_.end()) {
    MCPLINK_LOG_DEBUG("ignoring response for unknown or settled request {}",
                      id);
    return false;
  }

  PendingRequestPtr request = std::move(it->second);
  pending_.erase(it);
  if (request->timer) {
    request->timer->disableTimer();
  }

  auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      dispatcher_.approximateMonotonicTime() - request->start_time);
  MCPLINK_LOG_DEBUG("request {} '{}' settled after {}ms", id, request->method,
                    elapsed.count());

  request->callback(std::move(result));
  return true;
}

void RequestTracker::failAll(const Error& error) {
  if (pending_.empty()) {
    return;
  }

  // Callbacks may issue new requests; those land in the fresh map
  std::unordered_map<int64_t, PendingRequestPtr> failing;
  failing.swap(pending_);

  for (auto& entry : failing) {
    if (entry.second->timer) {
      entry.second->timer->disableTimer();
    }
  }
  for (auto& entry : failing) {
    entry.second->callback(makeError<nlohmann::json>(error));
  }
}

void RequestTracker::onTimeout(int64_t id) {
  auto it = pending_.find(id);
  if (it == pending_.end()) {
    return;
  }

  PendingRequestPtr request = std::move(it->second);
  pending_.erase(it);

  MCPLINK_LOG_WARNING("request {} '{}' timed out after {}ms", id,
                      request->method, request->timeout.count());

  // Running inside the entry's own timer; it is freed on a later iteration
  event::Dispatcher& dispatcher = dispatcher_;
  Callback callback = std::move(request->callback);
  Error error = makeTimeoutError(request->method, request->timeout);
  dispatcher.deferredDelete(std::move(request));
  callback(makeError<nlohmann::json>(error));
}

}  // namespace protocol
}  // namespace mcplink
