#ifndef MCPGATE_EVENT_WORKER_POOL_H
#define MCPGATE_EVENT_WORKER_POOL_H

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

namespace mcpgate {
namespace event {

/**
 * Fixed set of threads for blocking work (outbound HTTPS calls made by
 * tools and the OAuth callback). Results travel back to the event loop via
 * Dispatcher::post(); a WorkerPool never touches connection state itself.
 */
class WorkerPool {
 public:
  using Task = std::function<void()>;

  WorkerPool(const std::string& name, size_t thread_count);
  ~WorkerPool();

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  // Returns false once shutdown() has been called
  bool submit(Task task);

  // Drains queued tasks, then joins all threads. Idempotent.
  void shutdown();

  size_t threadCount() const { return threads_.size(); }
  size_t pendingTasks() const;

 private:
  void threadRoutine(size_t index);

  std::string name_;
  std::vector<std::thread> threads_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::queue<Task> tasks_;
  bool stopping_{false};
};

}  // namespace event
}  // namespace mcpgate

#endif  // MCPGATE_EVENT_WORKER_POOL_H
