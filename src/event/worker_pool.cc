#define MCPGATE_LOG_COMPONENT "event.worker"

#include "mcpgate/event/worker_pool.h"

#include <exception>

#include <pthread.h>

#include "mcpgate/logging/log_macros.h"

namespace mcpgate {
namespace event {

WorkerPool::WorkerPool(const std::string& name, size_t thread_count)
    : name_(name) {
  if (thread_count == 0) {
    thread_count = 1;
  }
  threads_.reserve(thread_count);
  for (size_t i = 0; i < thread_count; ++i) {
    threads_.emplace_back([this, i]() { threadRoutine(i); });
  }
  MCPGATE_LOG(Debug, "Worker pool '{}' started with {} threads", name_,
              thread_count);
}

WorkerPool::~WorkerPool() { shutdown(); }

bool WorkerPool::submit(Task task) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopping_) {
      return false;
    }
    tasks_.push(std::move(task));
  }
  cv_.notify_one();
  return true;
}

void WorkerPool::shutdown() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopping_) {
      return;
    }
    stopping_ = true;
  }
  cv_.notify_all();

  for (auto& thread : threads_) {
    if (thread.joinable()) {
      thread.join();
    }
  }
  MCPGATE_LOG(Debug, "Worker pool '{}' stopped", name_);
}

size_t WorkerPool::pendingTasks() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return tasks_.size();
}

void WorkerPool::threadRoutine(size_t index) {
#ifdef __linux__
  std::string thread_name = (name_ + "_" + std::to_string(index)).substr(0, 15);
  pthread_setname_np(pthread_self(), thread_name.c_str());
#endif

  while (true) {
    Task task;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      cv_.wait(lock, [this] { return stopping_ || !tasks_.empty(); });
      if (tasks_.empty()) {
        return;  // stopping and drained
      }
      task = std::move(tasks_.front());
      tasks_.pop();
    }

    try {
      task();
    } catch (const std::exception& e) {
      MCPGATE_LOG(Error, "Worker '{}' task threw: {}", name_, e.what());
    }
  }
}

}  // namespace event
}  // namespace mcpgate
