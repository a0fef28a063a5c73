#include "mcplink/event/libevent_dispatcher.h"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <stdexcept>

#include <event2/event.h>
#include <event2/thread.h>
#include <event2/util.h>

#define MCPLINK_LOG_COMPONENT "event.dispatcher"
#include "mcplink/logging/log_macros.h"

namespace mcplink {
namespace event {

namespace {

// Convert our event types to libevent flags
short toLibeventEvents(uint32_t events, FileTriggerType trigger) {
  short result = EV_PERSIST;
  if (events & static_cast<uint32_t>(FileReadyType::Read)) {
    result |= EV_READ;
  }
  if (events & static_cast<uint32_t>(FileReadyType::Write)) {
    result |= EV_WRITE;
  }
#ifdef EV_ET
  if (trigger == FileTriggerType::Edge) {
    result |= EV_ET;
  }
#else
  (void)trigger;
#endif
  return result;
}

// Convert libevent flags to our event types
uint32_t fromLibeventEvents(short events) {
  uint32_t result = 0;
  if (events & EV_READ) {
    result |= static_cast<uint32_t>(FileReadyType::Read);
  }
  if (events & EV_WRITE) {
    result |= static_cast<uint32_t>(FileReadyType::Write);
  }
  return result;
}

struct timeval toTimeval(std::chrono::milliseconds duration) {
  if (duration.count() < 0) {
    duration = std::chrono::milliseconds(0);
  }
  struct timeval tv;
  tv.tv_sec = static_cast<time_t>(duration.count() / 1000);
  tv.tv_usec = static_cast<suseconds_t>((duration.count() % 1000) * 1000);
  return tv;
}

// Lazy initialization for libevent threading support
void ensureLibeventThreadingInitialized() {
  static std::once_flag init_flag;
  std::call_once(init_flag, []() { evthread_use_pthreads(); });
}

}  // namespace

// LibeventDispatcher implementation
LibeventDispatcher::LibeventDispatcher(const std::string& name) : name_(name) {
  ensureLibeventThreadingInitialized();

  // thread_id_ is only set once run() is called
  initializeLibevent();
  updateApproximateMonotonicTime();
}

LibeventDispatcher::~LibeventDispatcher() {
  {
    std::lock_guard<std::mutex> lock(post_mutex_);
    std::queue<PostCb> empty;
    post_callbacks_.swap(empty);
  }

  // Deferred objects may still own events registered on base_
  while (!deferred_delete_list_.empty()) {
    runDeferredDeletes();
  }
  deferred_delete_timer_.reset();

  if (wakeup_event_) {
    event_free(wakeup_event_);
  }
  if (wakeup_fd_[0] >= 0) {
    close(wakeup_fd_[0]);
  }
  if (wakeup_fd_[1] >= 0) {
    close(wakeup_fd_[1]);
  }
  if (base_) {
    event_base_free(base_);
  }
}

void LibeventDispatcher::initializeLibevent() {
  struct event_config* config = event_config_new();
  if (config) {
    event_config_set_flag(config, EVENT_BASE_FLAG_PRECISE_TIMER);
    base_ = event_base_new_with_config(config);
    event_config_free(config);
  } else {
    base_ = event_base_new();
  }

  if (!base_) {
    throw std::runtime_error("Failed to create event base");
  }

  const char* method = event_base_get_method(base_);
  MCPLINK_LOG_DEBUG("dispatcher '{}' created event base using backend: {}",
                    name_, method ? method : "unknown");

  // Pipe for waking up the event loop from other threads
  if (pipe(wakeup_fd_) != 0) {
    throw std::runtime_error(std::string("Failed to create wakeup pipe: ") +
                             strerror(errno));
  }
  evutil_make_socket_nonblocking(wakeup_fd_[0]);
  evutil_make_socket_nonblocking(wakeup_fd_[1]);
  evutil_make_socket_closeonexec(wakeup_fd_[0]);
  evutil_make_socket_closeonexec(wakeup_fd_[1]);

  wakeup_event_ = event_new(base_, wakeup_fd_[0], EV_READ | EV_PERSIST,
                            &LibeventDispatcher::postWakeupCallback, this);
  if (!wakeup_event_) {
    throw std::runtime_error("Failed to create wakeup event");
  }
  event_add(wakeup_event_, nullptr);

  deferred_delete_timer_ =
      std::make_unique<TimerImpl>(*this, [this]() { runDeferredDeletes(); });
}

void LibeventDispatcher::post(PostCb callback) {
  bool need_wakeup = false;
  {
    std::lock_guard<std::mutex> lock(post_mutex_);
    need_wakeup = post_callbacks_.empty();
    post_callbacks_.push(std::move(callback));
  }

  if (need_wakeup) {
    // Also wake from the dispatcher thread so the queue drains on the next
    // iteration instead of waiting for unrelated activity
    char byte = 1;
    ssize_t rc = write(wakeup_fd_[1], &byte, 1);
    (void)rc;  // EAGAIN means a wakeup is already pending
  }
}

bool LibeventDispatcher::isThreadSafe() const {
  std::thread::id owner = thread_id_.load();
  if (owner == std::thread::id()) {
    return false;
  }
  return std::this_thread::get_id() == owner;
}

FileEventPtr LibeventDispatcher::createFileEvent(int fd,
                                                 FileReadyCb cb,
                                                 FileTriggerType trigger,
                                                 uint32_t events) {
  return std::make_unique<FileEventImpl>(*this, fd, std::move(cb), trigger,
                                         events);
}

TimerPtr LibeventDispatcher::createTimer(TimerCb cb) {
  return std::make_unique<TimerImpl>(*this, std::move(cb));
}

void LibeventDispatcher::deferredDelete(DeferredDeletablePtr&& to_delete) {
  if (!to_delete) {
    return;
  }
  deferred_delete_list_.push_back(std::move(to_delete));

  if (!deferred_delete_timer_->enabled()) {
    deferred_delete_timer_->enableTimer(std::chrono::milliseconds(0));
  }
}

void LibeventDispatcher::exit() {
  exit_requested_ = true;

  if (isThreadSafe()) {
    event_base_loopbreak(base_);
  } else {
    // Wake the loop; runPostCallbacks() sees the flag and breaks
    post([]() {});
  }
}

SignalEventPtr LibeventDispatcher::listenForSignal(int signal_num,
                                                   SignalCb cb) {
  return std::make_unique<SignalEventImpl>(*this, signal_num, std::move(cb));
}

void LibeventDispatcher::run(RunType type) {
  thread_id_ = std::this_thread::get_id();

  // Run any pending post callbacks before starting
  runPostCallbacks();

  switch (type) {
    case RunType::Block:
      updateApproximateMonotonicTime();
      if (!exit_requested_) {
        event_base_loop(base_, 0);
      }
      break;
    case RunType::NonBlock:
      updateApproximateMonotonicTime();
      event_base_loop(base_, EVLOOP_NONBLOCK);
      break;
    case RunType::RunUntilExit:
      while (!exit_requested_) {
        updateApproximateMonotonicTime();
        event_base_loop(base_, EVLOOP_ONCE);
      }
      break;
  }

  runPostCallbacks();
  if (type != RunType::NonBlock) {
    // An exit() issued before run() started is consumed here
    exit_requested_ = false;
  }
}

std::chrono::steady_clock::time_point
LibeventDispatcher::approximateMonotonicTime() const {
  return approximate_monotonic_time_;
}

void LibeventDispatcher::updateApproximateMonotonicTime() {
  approximate_monotonic_time_ = std::chrono::steady_clock::now();
}

void LibeventDispatcher::clearDeferredDeleteList() {
  runDeferredDeletes();
}

void LibeventDispatcher::shutdown() {
  clearDeferredDeleteList();

  std::lock_guard<std::mutex> lock(post_mutex_);
  std::queue<PostCb> empty;
  post_callbacks_.swap(empty);
}

void LibeventDispatcher::postWakeupCallback(int fd,
                                            short /*events*/,
                                            void* arg) {
  auto* dispatcher = static_cast<LibeventDispatcher*>(arg);

  char buffer[256];
  while (read(fd, buffer, sizeof(buffer)) > 0) {
    // Continue draining
  }

  dispatcher->runPostCallbacks();
}

void LibeventDispatcher::runPostCallbacks() {
  std::queue<PostCb> callbacks;
  {
    std::lock_guard<std::mutex> lock(post_mutex_);
    callbacks.swap(post_callbacks_);
  }

  while (!callbacks.empty()) {
    PostCb cb = std::move(callbacks.front());
    callbacks.pop();
    cb();
  }

  if (exit_requested_) {
    event_base_loopbreak(base_);
  }
}

void LibeventDispatcher::runDeferredDeletes() {
  // Destructors may defer more objects; those land in the fresh list
  std::vector<DeferredDeletablePtr> to_delete;
  to_delete.swap(deferred_delete_list_);
  to_delete.clear();
}

// FileEventImpl implementation
LibeventDispatcher::FileEventImpl::FileEventImpl(LibeventDispatcher& dispatcher,
                                                 int fd,
                                                 FileReadyCb cb,
                                                 FileTriggerType trigger,
                                                 uint32_t events)
    : dispatcher_(dispatcher), fd_(fd), cb_(std::move(cb)), trigger_(trigger) {
  event_ = event_new(dispatcher_.base(), fd_, 0, &FileEventImpl::eventCallback,
                     this);
  if (!event_) {
    throw std::runtime_error("Failed to create file event");
  }
  setEnabled(events);
}

LibeventDispatcher::FileEventImpl::~FileEventImpl() {
  if (event_) {
    event_free(event_);
  }
}

void LibeventDispatcher::FileEventImpl::activate(uint32_t events) {
  short libevent_events = 0;
  if (events & static_cast<uint32_t>(FileReadyType::Read)) {
    libevent_events |= EV_READ;
  }
  if (events & static_cast<uint32_t>(FileReadyType::Write)) {
    libevent_events |= EV_WRITE;
  }
  if (libevent_events != 0) {
    event_active(event_, libevent_events, 0);
  }
}

void LibeventDispatcher::FileEventImpl::setEnabled(uint32_t events) {
  // Edge events are re-armed even when the mask is unchanged so that a
  // consumer can force readiness to be recomputed
  if (trigger_ != FileTriggerType::Edge && event_added_ &&
      enabled_events_ == events) {
    return;
  }
  enabled_events_ = events;

  if (event_added_) {
    event_del(event_);
    event_added_ = false;
  }
  if (events != 0) {
    event_assign(event_, dispatcher_.base(), fd_,
                 toLibeventEvents(events, trigger_),
                 &FileEventImpl::eventCallback, this);
    if (event_add(event_, nullptr) == 0) {
      event_added_ = true;
    } else {
      MCPLINK_LOG_ERROR("event_add failed for fd {}", fd_);
    }
  }
}

void LibeventDispatcher::FileEventImpl::eventCallback(int /*fd*/,
                                                      short events,
                                                      void* arg) {
  auto* file_event = static_cast<FileEventImpl*>(arg);
  file_event->dispatcher_.updateApproximateMonotonicTime();

  uint32_t ready_events = fromLibeventEvents(events);
  if (ready_events != 0) {
    // The callback may destroy this object; nothing touches it afterwards
    file_event->cb_(ready_events);
  }
}

// TimerImpl implementation
LibeventDispatcher::TimerImpl::TimerImpl(LibeventDispatcher& dispatcher,
                                         TimerCb cb)
    : dispatcher_(dispatcher), cb_(std::move(cb)) {
  event_ = evtimer_new(dispatcher_.base(), &TimerImpl::timerCallback, this);
  if (!event_) {
    throw std::runtime_error("Failed to create timer");
  }
}

LibeventDispatcher::TimerImpl::~TimerImpl() {
  if (event_) {
    event_free(event_);
  }
}

void LibeventDispatcher::TimerImpl::disableTimer() {
  if (enabled_) {
    event_del(event_);
    enabled_ = false;
  }
}

void LibeventDispatcher::TimerImpl::enableTimer(
    std::chrono::milliseconds duration) {
  struct timeval tv = toTimeval(duration);
  if (event_add(event_, &tv) == 0) {
    enabled_ = true;
  } else {
    MCPLINK_LOG_ERROR("failed to arm timer for {}ms", duration.count());
  }
}

bool LibeventDispatcher::TimerImpl::enabled() { return enabled_; }

void LibeventDispatcher::TimerImpl::timerCallback(int /*fd*/,
                                                  short /*events*/,
                                                  void* arg) {
  auto* timer = static_cast<TimerImpl*>(arg);

  timer->enabled_ = false;
  timer->dispatcher_.updateApproximateMonotonicTime();

  // The callback may re-arm or destroy the timer
  timer->cb_();
}

// SignalEventImpl implementation
LibeventDispatcher::SignalEventImpl::SignalEventImpl(
    LibeventDispatcher& dispatcher, int signal_num, SignalCb cb)
    : dispatcher_(dispatcher), signal_num_(signal_num), cb_(std::move(cb)) {
  event_ = evsignal_new(dispatcher_.base(), signal_num_,
                        &SignalEventImpl::signalCallback, this);
  if (!event_) {
    throw std::runtime_error("Failed to create signal event");
  }

  event_add(event_, nullptr);
}

LibeventDispatcher::SignalEventImpl::~SignalEventImpl() {
  if (event_) {
    event_free(event_);
  }
}

void LibeventDispatcher::SignalEventImpl::signalCallback(int /*fd*/,
                                                         short /*events*/,
                                                         void* arg) {
  auto* signal_event = static_cast<SignalEventImpl*>(arg);
  signal_event->dispatcher_.updateApproximateMonotonicTime();
  signal_event->cb_();
}

// LibeventDispatcherFactory implementation
const std::string LibeventDispatcherFactory::backend_name_ = "libevent";

DispatcherPtr LibeventDispatcherFactory::createDispatcher(
    const std::string& name) {
  return std::make_unique<LibeventDispatcher>(name);
}

const std::string& LibeventDispatcherFactory::backendName() const {
  return backend_name_;
}

DispatcherFactoryPtr createLibeventDispatcherFactory() {
  return std::make_unique<LibeventDispatcherFactory>();
}

}  // namespace event
}  // namespace mcplink
