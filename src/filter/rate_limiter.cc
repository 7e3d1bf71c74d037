#define MCPGATE_LOG_COMPONENT "filter.ratelimit"

#include "mcpgate/filter/rate_limiter.h"

#include "mcpgate/logging/log_macros.h"

namespace mcpgate {
namespace filter {

SlidingWindowRateLimiter::SlidingWindowRateLimiter(const RateLimitConfig& config,
                                                   Clock clock)
    : config_(config), clock_(std::move(clock)) {
  if (!clock_) {
    clock_ = []() { return std::chrono::steady_clock::now(); };
  }
}

void SlidingWindowRateLimiter::evictExpired(std::deque<TimePoint>& window,
                                            TimePoint now) const {
  // An admission exactly window_size old no longer counts
  while (!window.empty() && now - window.front() >= config_.window_size) {
    window.pop_front();
  }
}

bool SlidingWindowRateLimiter::isLimited(const std::string& client_id) {
  auto now = clock_();
  std::lock_guard<std::mutex> lock(mutex_);
  auto& window = windows_[client_id];
  evictExpired(window, now);

  if (window.size() >= config_.max_requests_per_window) {
    MCPGATE_LOG(Warning, "Rate limit exceeded for client {} ({} in {}s)",
                client_id, window.size(), config_.window_size.count());
    return true;
  }

  window.push_back(now);
  return false;
}

std::chrono::milliseconds SlidingWindowRateLimiter::retryAfter(
    const std::string& client_id) {
  auto now = clock_();
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = windows_.find(client_id);
  if (it == windows_.end()) {
    return std::chrono::milliseconds(0);
  }
  evictExpired(it->second, now);
  if (it->second.size() < config_.max_requests_per_window ||
      it->second.empty()) {
    return std::chrono::milliseconds(0);
  }
  auto expires = it->second.front() + config_.window_size;
  return std::chrono::duration_cast<std::chrono::milliseconds>(expires - now);
}

size_t SlidingWindowRateLimiter::inFlightCount(const std::string& client_id) {
  auto now = clock_();
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = windows_.find(client_id);
  if (it == windows_.end()) {
    return 0;
  }
  evictExpired(it->second, now);
  return it->second.size();
}

size_t SlidingWindowRateLimiter::pruneIdleClients() {
  auto now = clock_();
  std::lock_guard<std::mutex> lock(mutex_);
  size_t removed = 0;
  for (auto it = windows_.begin(); it != windows_.end();) {
    evictExpired(it->second, now);
    if (it->second.empty()) {
      it = windows_.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  if (removed > 0) {
    MCPGATE_LOG(Debug, "Pruned {} idle rate limit windows", removed);
  }
  return removed;
}

size_t SlidingWindowRateLimiter::trackedClients() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return windows_.size();
}

}  // namespace filter
}  // namespace mcpgate
