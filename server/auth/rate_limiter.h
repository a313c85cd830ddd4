#pragma once

#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>

namespace jdguard {

// Sliding-window limiter keyed by client identity: at most `max_requests`
// admissions in any trailing `window_seconds`. Rejected attempts are not
// recorded.
class RateLimiter {
 public:
  // Seconds since the epoch.
  using Clock = std::function<double()>;

  RateLimiter(int max_requests, int window_seconds,
              std::size_t max_tracked_identities = 0, Clock clock = {});

  bool IsAllowed(const std::string& identity, std::string* reason = nullptr);
  bool Enabled() const { return max_requests_ > 0; }

  // Seconds until `identity` gets a free slot; 0 when one is free now.
  double RetryAfterSeconds(const std::string& identity);
  std::size_t Tracked() const;

  int MaxRequests() const { return max_requests_; }
  int WindowSeconds() const { return window_seconds_; }

  // Identities are swept for idle windows once per this many calls.
  static constexpr std::size_t kSweepInterval = 1024;

 private:
  struct Window {
    std::deque<double> timestamps;
    double last_seen{0.0};
  };

  void Purge(Window& window, double now) const;
  void SweepIdle(double now);
  void EvictLeastRecent(const std::string& keep);

  const int max_requests_;
  const int window_seconds_;
  const std::size_t max_tracked_identities_;
  Clock clock_;
  std::unordered_map<std::string, Window> windows_;
  std::size_t calls_since_sweep_{0};
  mutable std::mutex mutex_;
};

}  // namespace jdguard
