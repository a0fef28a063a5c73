#ifndef MCPLINK_EVENT_LIBEVENT_DISPATCHER_H
#define MCPLINK_EVENT_LIBEVENT_DISPATCHER_H

#include <atomic>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

#include "mcplink/event/event_loop.h"

// Forward declarations for libevent types
struct event_base;
struct event;

namespace mcplink {
namespace event {

// Rename to avoid conflict with namespace event
using libevent_event = struct ::event;

/**
 * @brief Libevent-based implementation of the Dispatcher interface
 *
 * Cross thread posts go through a queue guarded by a mutex; a byte written
 * to a non-blocking pipe wakes the loop to drain it.
 */
class LibeventDispatcher : public Dispatcher {
 public:
  explicit LibeventDispatcher(const std::string& name);
  ~LibeventDispatcher() override;

  // DispatcherBase interface
  void post(PostCb callback) override;
  bool isThreadSafe() const override;

  // Dispatcher interface
  const std::string& name() override { return name_; }

  FileEventPtr createFileEvent(int fd,
                               FileReadyCb cb,
                               FileTriggerType trigger,
                               uint32_t events) override;

  TimerPtr createTimer(TimerCb cb) override;

  void deferredDelete(DeferredDeletablePtr&& to_delete) override;

  void exit() override;

  SignalEventPtr listenForSignal(int signal_num, SignalCb cb) override;

  void run(RunType type) override;

  std::chrono::steady_clock::time_point approximateMonotonicTime()
      const override;
  void updateApproximateMonotonicTime() override;

  void clearDeferredDeleteList() override;

  void shutdown() override;

  // Get the underlying event_base for advanced usage
  event_base* base() { return base_; }

 private:
  class FileEventImpl : public FileEvent {
   public:
    FileEventImpl(LibeventDispatcher& dispatcher,
                  int fd,
                  FileReadyCb cb,
                  FileTriggerType trigger,
                  uint32_t events);
    ~FileEventImpl() override;

    void activate(uint32_t events) override;
    void setEnabled(uint32_t events) override;

   private:
    static void eventCallback(int fd, short events, void* arg);

    LibeventDispatcher& dispatcher_;
    int fd_;
    FileReadyCb cb_;
    FileTriggerType trigger_;
    libevent_event* event_;
    uint32_t enabled_events_{0};
    bool event_added_{false};
  };

  class TimerImpl : public Timer {
   public:
    TimerImpl(LibeventDispatcher& dispatcher, TimerCb cb);
    ~TimerImpl() override;

    void disableTimer() override;
    void enableTimer(std::chrono::milliseconds duration) override;
    bool enabled() override;

   private:
    static void timerCallback(int fd, short events, void* arg);

    LibeventDispatcher& dispatcher_;
    TimerCb cb_;
    libevent_event* event_;
    bool enabled_{false};
  };

  class SignalEventImpl : public SignalEvent {
   public:
    SignalEventImpl(LibeventDispatcher& dispatcher,
                    int signal_num,
                    SignalCb cb);
    ~SignalEventImpl() override;

   private:
    static void signalCallback(int fd, short events, void* arg);

    LibeventDispatcher& dispatcher_;
    int signal_num_;
    SignalCb cb_;
    libevent_event* event_;
  };

  void runPostCallbacks();
  void runDeferredDeletes();
  void initializeLibevent();
  static void postWakeupCallback(int fd, short events, void* arg);

  const std::string name_;
  event_base* base_{nullptr};
  std::atomic<std::thread::id> thread_id_{};
  std::atomic<bool> exit_requested_{false};

  // Post callback handling
  std::mutex post_mutex_;
  std::queue<PostCb> post_callbacks_;
  int wakeup_fd_[2]{-1, -1};  // Pipe for waking up event loop
  libevent_event* wakeup_event_{nullptr};

  // Deferred deletion, drained by a zero delay timer
  std::vector<DeferredDeletablePtr> deferred_delete_list_;
  std::unique_ptr<TimerImpl> deferred_delete_timer_;

  std::chrono::steady_clock::time_point approximate_monotonic_time_;
};

/**
 * @brief Factory for creating libevent-based dispatchers
 */
class LibeventDispatcherFactory : public DispatcherFactory {
 public:
  DispatcherPtr createDispatcher(const std::string& name) override;
  const std::string& backendName() const override;

 private:
  static const std::string backend_name_;
};

}  // namespace event
}  // namespace mcplink

#endif  // MCPLINK_EVENT_LIBEVENT_DISPATCHER_H
