#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>

#include <gtest/gtest.h>

#include "mcplink/event/event_loop.h"

namespace mcplink {
namespace test {

/**
 * Base class for tests that drive real IO through a dispatcher.
 *
 * The dispatcher runs on a background thread for the whole test. Objects
 * that belong to the dispatcher are created and destroyed through
 * executeInDispatcher(); subclasses release theirs in
 * tearDownInDispatcher(), which runs on the dispatcher thread before it
 * stops.
 */
class RealIoTestBase : public ::testing::Test {
 protected:
  void SetUp() override {
    factory_ = event::createLibeventDispatcherFactory();
    dispatcher_ = factory_->createDispatcher("integration_test");

    dispatcher_running_ = true;
    dispatcher_thread_ = std::thread([this]() {
      {
        std::lock_guard<std::mutex> lock(ready_mutex_);
        dispatcher_ready_ = true;
        ready_cv_.notify_all();
      }

      dispatcher_->run(event::RunType::RunUntilExit);

      dispatcher_running_ = false;
    });

    std::unique_lock<std::mutex> lock(ready_mutex_);
    ready_cv_.wait(lock, [this]() { return dispatcher_ready_; });
  }

  void TearDown() override {
    if (dispatcher_ && dispatcher_running_) {
      executeInDispatcher([this]() { tearDownInDispatcher(); });
      // Let deferred deletes and closing transfers settle
      std::this_thread::sleep_for(std::chrono::milliseconds(20));
      dispatcher_->exit();
    }

    if (dispatcher_thread_.joinable()) {
      dispatcher_thread_.join();
    }

    dispatcher_->clearDeferredDeleteList();
    dispatcher_.reset();
    factory_.reset();
  }

  // Release objects owned by the dispatcher thread
  virtual void tearDownInDispatcher() {}

  /**
   * Execute a function within the dispatcher thread context and wait for
   * its result. Exceptions thrown by func are re-thrown here.
   */
  template <typename F>
  auto executeInDispatcher(F&& func) -> decltype(func()) {
    using ReturnType = decltype(func());

    if (!dispatcher_running_) {
      throw std::runtime_error("Dispatcher not running");
    }

    return executeInDispatcherImpl(std::forward<F>(func),
                                   std::is_void<ReturnType>{});
  }

  /**
   * Poll a condition on the dispatcher thread until it holds or the
   * timeout passes.
   */
  bool waitFor(std::function<bool()> condition,
               std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
      if (executeInDispatcher([&condition]() { return condition(); })) {
        return true;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return false;
  }

 private:
  template <typename F>
  void executeInDispatcherImpl(F&& func, std::true_type) {
    std::promise<void> promise;
    auto future = promise.get_future();

    dispatcher_->post([&promise, &func]() {
      try {
        func();
        promise.set_value();
      } catch (...) {
        promise.set_exception(std::current_exception());
      }
    });

    if (future.wait_for(operation_timeout_) != std::future_status::ready) {
      throw std::runtime_error("Operation timed out");
    }
    future.get();
  }

  template <typename F>
  auto executeInDispatcherImpl(F&& func, std::false_type) -> decltype(func()) {
    using ReturnType = decltype(func());
    std::promise<ReturnType> promise;
    auto future = promise.get_future();

    dispatcher_->post([&promise, &func]() {
      try {
        promise.set_value(func());
      } catch (...) {
        promise.set_exception(std::current_exception());
      }
    });

    if (future.wait_for(operation_timeout_) != std::future_status::ready) {
      throw std::runtime_error("Operation timed out");
    }
    return future.get();
  }

 protected:
  event::DispatcherFactoryPtr factory_;
  event::DispatcherPtr dispatcher_;
  std::thread dispatcher_thread_;
  std::atomic<bool> dispatcher_running_{false};

  std::mutex ready_mutex_;
  std::condition_variable ready_cv_;
  bool dispatcher_ready_{false};

  std::chrono::milliseconds operation_timeout_{10000};
};

}  // namespace test
}  // namespace mcplink
