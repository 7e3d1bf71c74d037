#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <set>
#include <thread>

#include <gtest/gtest.h>

#include "mcpgate/event/worker_pool.h"

namespace mcpgate {
namespace event {
namespace {

TEST(WorkerPoolTest, RunsEverySubmittedTask) {
  WorkerPool pool("test", 3);
  EXPECT_EQ(pool.threadCount(), 3u);

  std::atomic<int> counter{0};
  for (int i = 0; i < 100; ++i) {
    ASSERT_TRUE(pool.submit([&counter]() { ++counter; }));
  }
  pool.shutdown();
  EXPECT_EQ(counter.load(), 100);
}

TEST(WorkerPoolTest, TasksRunOffTheCallingThread) {
  WorkerPool pool("test", 2);

  std::promise<std::thread::id> worker_id;
  ASSERT_TRUE(pool.submit(
      [&worker_id]() { worker_id.set_value(std::this_thread::get_id()); }));

  auto future = worker_id.get_future();
  ASSERT_EQ(future.wait_for(std::chrono::seconds(2)),
            std::future_status::ready);
  EXPECT_NE(future.get(), std::this_thread::get_id());
}

TEST(WorkerPoolTest, BlockedTaskDoesNotStallOthers) {
  WorkerPool pool("test", 2);

  std::promise<void> release;
  auto gate = release.get_future().share();
  ASSERT_TRUE(pool.submit([gate]() { gate.wait(); }));

  std::promise<void> ran;
  ASSERT_TRUE(pool.submit([&ran]() { ran.set_value(); }));
  EXPECT_EQ(ran.get_future().wait_for(std::chrono::seconds(2)),
            std::future_status::ready);

  release.set_value();
}

TEST(WorkerPoolTest, SubmitAfterShutdownIsRejected) {
  WorkerPool pool("test", 1);
  pool.shutdown();

  EXPECT_FALSE(pool.submit([]() {}));
  // Idempotent
  pool.shutdown();
}

TEST(WorkerPoolTest, ShutdownDrainsQueuedTasks) {
  WorkerPool pool("test", 1);

  std::promise<void> release;
  auto gate = release.get_future().share();
  std::atomic<int> counter{0};
  ASSERT_TRUE(pool.submit([gate]() { gate.wait(); }));
  for (int i = 0; i < 10; ++i) {
    ASSERT_TRUE(pool.submit([&counter]() { ++counter; }));
  }
  EXPECT_GE(pool.pendingTasks(), 1u);

  release.set_value();
  pool.shutdown();
  EXPECT_EQ(counter.load(), 10);
}

}  // namespace
}  // namespace event
}  // namespace mcpgate
