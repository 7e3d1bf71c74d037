#pragma once

#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <thread>
#include <type_traits>

#include <pthread.h>

#include <gtest/gtest.h>

#include "mcpgate/event/event_loop.h"

namespace mcpgate {
namespace test {

/**
 * Base class for integration tests that drive real sockets.
 *
 * Runs a libevent dispatcher on a background thread. Objects that belong
 * to the dispatcher (listeners, connections, timers) must be created and
 * destroyed through executeInDispatcher().
 */
class RealIoTestBase : public ::testing::Test {
 protected:
  void SetUp() override {
    dispatcher_ = event::createLibeventDispatcher("integration_test");

    std::promise<void> ready;
    auto started = ready.get_future();
    dispatcher_running_ = true;
    dispatcher_thread_ = std::thread([this, &ready]() {
      pthread_setname_np(pthread_self(), "test_dispatcher");
      // Posted before run() so it fires only once the loop owns the thread
      dispatcher_->post([&ready]() { ready.set_value(); });
      dispatcher_->run(event::RunType::RunUntilExit);
      dispatcher_running_ = false;
    });

    ASSERT_EQ(started.wait_for(operation_timeout_), std::future_status::ready)
        << "dispatcher did not start";
  }

  void TearDown() override {
    if (dispatcher_ && dispatcher_running_) {
      dispatcher_->exit();
    }
    if (dispatcher_thread_.joinable()) {
      dispatcher_thread_.join();
    }
    dispatcher_.reset();
  }

  /**
   * Run func on the dispatcher thread and wait for it. Exceptions thrown
   * by func are rethrown here.
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

  event::DispatcherPtr dispatcher_;
  std::chrono::milliseconds operation_timeout_{5000};

 private:
  template <typename F>
  void executeInDispatcherImpl(F&& func, std::true_type) {
    std::promise<void> promise;
    auto future = promise.get_future();

    dispatcher_->post([&promise, func = std::forward<F>(func)]() mutable {
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

    dispatcher_->post([&promise, func = std::forward<F>(func)]() mutable {
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

  std::thread dispatcher_thread_;
  std::atomic<bool> dispatcher_running_{false};
};

}  // namespace test
}  // namespace mcpgate
