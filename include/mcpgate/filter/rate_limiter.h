/**
 * @file rate_limiter.h
 * @brief Per-client sliding window admission control
 *
 * Each client identity owns a window of admission timestamps. A request is
 * admitted while fewer than max_requests_per_window admissions are younger
 * than window_size; refused requests are not recorded, so a client that
 * keeps hammering does not extend its own lockout.
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>

namespace mcpgate {
namespace filter {

struct RateLimitConfig {
  size_t max_requests_per_window = 60;
  std::chrono::seconds window_size{60};
};

class SlidingWindowRateLimiter {
 public:
  using TimePoint = std::chrono::steady_clock::time_point;
  using Clock = std::function<TimePoint()>;

  explicit SlidingWindowRateLimiter(const RateLimitConfig& config = {},
                                    Clock clock = nullptr);

  /**
   * Decide whether a request from client_id must be refused.
   * Returns true when limited. Admitted requests are recorded.
   */
  bool isLimited(const std::string& client_id);

  /**
   * Time until the oldest admission of client_id leaves the window.
   * Zero when the client currently has spare capacity.
   */
  std::chrono::milliseconds retryAfter(const std::string& client_id);

  // Admissions of client_id still inside the window
  size_t inFlightCount(const std::string& client_id);

  // Drop clients whose windows are empty. Returns the number removed.
  size_t pruneIdleClients();

  size_t trackedClients() const;

  const RateLimitConfig& config() const { return config_; }

 private:
  void evictExpired(std::deque<TimePoint>& window, TimePoint now) const;

  RateLimitConfig config_;
  Clock clock_;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::deque<TimePoint>> windows_;
};

}  // namespace filter
}  // namespace mcpgate
