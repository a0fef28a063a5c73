#ifndef MCPLINK_EVENT_EVENT_LOOP_H
#define MCPLINK_EVENT_EVENT_LOOP_H

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace mcplink {
namespace event {

class Dispatcher;
class FileEvent;
class Timer;
class SignalEvent;
class DeferredDeletable;

using DispatcherPtr = std::unique_ptr<Dispatcher>;
using FileEventPtr = std::unique_ptr<FileEvent>;
using TimerPtr = std::unique_ptr<Timer>;
using SignalEventPtr = std::unique_ptr<SignalEvent>;
using DeferredDeletablePtr = std::unique_ptr<DeferredDeletable>;

// Callback types
using PostCb = std::function<void()>;
using FileReadyCb = std::function<void(uint32_t events)>;
using TimerCb = std::function<void()>;
using SignalCb = std::function<void()>;

// File event types
enum class FileReadyType : uint32_t {
  Read = 0x01,
  Write = 0x02,
  Closed = 0x04,
  Error = 0x08
};

inline FileReadyType operator|(FileReadyType a, FileReadyType b) {
  return static_cast<FileReadyType>(static_cast<uint32_t>(a) |
                                    static_cast<uint32_t>(b));
}

inline uint32_t operator&(FileReadyType a, uint32_t b) {
  return static_cast<uint32_t>(a) & b;
}

enum class FileTriggerType {
  // Fires while the condition holds. Pipes and curl sockets use this.
  Level,
  // Fires on state transitions only; the consumer must drain until EAGAIN
  Edge
};

enum class RunType {
  Block,        // Run until there are no more events or exit() is called
  NonBlock,     // Run one iteration without waiting
  RunUntilExit  // Run until exit() is called, blocking for events
};

/**
 * @brief Interface for objects that should be deleted on a deferred basis.
 *
 * Objects that may be destroyed from inside one of their own callbacks are
 * handed to Dispatcher::deferredDelete() and freed on a later iteration.
 */
class DeferredDeletable {
 public:
  virtual ~DeferredDeletable() = default;
};

/**
 * @brief File descriptor readiness notification.
 *
 * The event is unregistered when the object is destroyed. The descriptor
 * itself is not owned.
 */
class FileEvent {
 public:
  virtual ~FileEvent() = default;

  /**
   * Activate the file event explicitly. The callback runs on the next
   * iteration with the given events.
   */
  virtual void activate(uint32_t events) = 0;

  /**
   * Enable the file event with a new set of event types to monitor.
   * Passing 0 stops monitoring without destroying the event.
   */
  virtual void setEnabled(uint32_t events) = 0;
};

/**
 * @brief One-shot timer.
 */
class Timer {
 public:
  virtual ~Timer() = default;

  /**
   * Disable the timer. No-op if already disabled.
   */
  virtual void disableTimer() = 0;

  /**
   * Enable the timer to fire once after the given duration. Re-arming an
   * enabled timer replaces the previous deadline.
   */
  virtual void enableTimer(std::chrono::milliseconds duration) = 0;

  /**
   * Return whether the timer is currently enabled.
   */
  virtual bool enabled() = 0;
};

class SignalEvent {
 public:
  virtual ~SignalEvent() = default;
};

/**
 * @brief Base dispatcher interface
 */
class DispatcherBase {
 public:
  virtual ~DispatcherBase() = default;

  /**
   * Post a callback to be executed in the dispatcher thread.
   * Thread-safe: can be called from any thread.
   */
  virtual void post(PostCb callback) = 0;

  /**
   * Check if the current thread is the dispatcher thread.
   */
  virtual bool isThreadSafe() const = 0;
};

/**
 * @brief Main event dispatcher interface
 *
 * Single-threaded event loop. Everything except post(), exit() and
 * isThreadSafe() must be called on the thread running the loop, or before
 * the loop has been started.
 */
class Dispatcher : public DispatcherBase {
 public:
  virtual ~Dispatcher() = default;

  virtual const std::string& name() = 0;

  virtual FileEventPtr createFileEvent(int fd,
                                       FileReadyCb cb,
                                       FileTriggerType trigger,
                                       uint32_t events) = 0;

  virtual TimerPtr createTimer(TimerCb cb) = 0;

  /**
   * Submit an item for deferred deletion. The item is deleted on a later
   * event loop iteration, never before the current callback returns.
   */
  virtual void deferredDelete(DeferredDeletablePtr&& to_delete) = 0;

  /**
   * Exit the event loop. Safe to call from any thread.
   */
  virtual void exit() = 0;

  /**
   * Listen for a signal. Only one dispatcher per process should listen for
   * signals.
   */
  virtual SignalEventPtr listenForSignal(int signal_num, SignalCb cb) = 0;

  virtual void run(RunType type) = 0;

  /**
   * Return approximate monotonic time without a system call. Refreshed
   * when the loop starts and before every event, timer and signal callback.
   */
  virtual std::chrono::steady_clock::time_point approximateMonotonicTime()
      const = 0;
  virtual void updateApproximateMonotonicTime() = 0;

  virtual void clearDeferredDeleteList() = 0;

  /**
   * Drop pending posted callbacks and deferred deletes.
   */
  virtual void shutdown() = 0;
};

/**
 * @brief Factory for creating dispatchers
 */
class DispatcherFactory {
 public:
  virtual ~DispatcherFactory() = default;

  /**
   * Create a new dispatcher instance.
   *
   * @param name Name for the dispatcher (e.g., "mcplink")
   * @return Unique pointer to the dispatcher
   */
  virtual DispatcherPtr createDispatcher(const std::string& name) = 0;

  virtual const std::string& backendName() const = 0;
};

using DispatcherFactoryPtr = std::unique_ptr<DispatcherFactory>;

/**
 * @brief Create a libevent-based dispatcher factory
 */
DispatcherFactoryPtr createLibeventDispatcherFactory();

}  // namespace event
}  // namespace mcplink

#endif  // MCPLINK_EVENT_EVENT_LOOP_H
