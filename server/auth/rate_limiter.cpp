#include "server/auth/rate_limiter.h"

#include "server/logging/logger.h"

#include <chrono>
#include <utility>

namespace jdguard {

namespace {
double SystemSeconds() {
  auto now = std::chrono::system_clock::now().time_since_epoch();
  return std::chrono::duration_cast<std::chrono::duration<double>>(now).count();
}
}  // namespace

RateLimiter::RateLimiter(int max_requests, int window_seconds,
                         std::size_t max_tracked_identities, Clock clock)
    : max_requests_(max_requests),
      window_seconds_(window_seconds),
      max_tracked_identities_(max_tracked_identities),
      clock_(clock ? std::move(clock) : Clock(SystemSeconds)) {}

void RateLimiter::Purge(Window& window, double now) const {
  while (!window.timestamps.empty() && now - window.timestamps.front() >= window_seconds_) {
    window.timestamps.pop_front();
  }
}

bool RateLimiter::IsAllowed(const std::string& identity, std::string* reason) {
  if (max_requests_ <= 0) {
    return true;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  double now = clock_();
  if (++calls_since_sweep_ >= kSweepInterval) {
    SweepIdle(now);
    calls_since_sweep_ = 0;
  }
  auto& window = windows_[identity];
  Purge(window, now);
  if (window.timestamps.size() >= static_cast<std::size_t>(max_requests_)) {
    if (reason) {
      *reason = "Rate limit exceeded. Max " + std::to_string(max_requests_) +
                " requests per " + std::to_string(window_seconds_) + " seconds.";
    }
    return false;
  }
  window.timestamps.push_back(now);
  window.last_seen = now;
  if (max_tracked_identities_ > 0 && windows_.size() > max_tracked_identities_) {
    EvictLeastRecent(identity);
  }
  return true;
}

double RateLimiter::RetryAfterSeconds(const std::string& identity) {
  if (max_requests_ <= 0) {
    return 0.0;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = windows_.find(identity);
  if (it == windows_.end()) {
    return 0.0;
  }
  double now = clock_();
  Purge(it->second, now);
  const auto& timestamps = it->second.timestamps;
  if (timestamps.size() < static_cast<std::size_t>(max_requests_)) {
    return 0.0;
  }
  // The slot frees when the entry that would bring the count under the
  // limit leaves the window.
  double frees_at = timestamps[timestamps.size() - max_requests_] + window_seconds_;
  return frees_at > now ? frees_at - now : 0.0;
}

std::size_t RateLimiter::Tracked() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return windows_.size();
}

// An identity whose newest timestamp has left the window has an empty
// window, so dropping it does not change any future decision.
void RateLimiter::SweepIdle(double now) {
  std::size_t removed = 0;
  for (auto it = windows_.begin(); it != windows_.end();) {
    if (now - it->second.last_seen >= window_seconds_) {
      it = windows_.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  if (removed > 0) {
    log::Debug("ratelimit", "swept idle identities",
               "removed=" + std::to_string(removed) +
                   " tracked=" + std::to_string(windows_.size()));
  }
}

void RateLimiter::EvictLeastRecent(const std::string& keep) {
  auto victim = windows_.end();
  for (auto it = windows_.begin(); it != windows_.end(); ++it) {
    if (it->first == keep) {
      continue;
    }
    if (victim == windows_.end() || it->second.last_seen < victim->second.last_seen) {
      victim = it;
    }
  }
  if (victim != windows_.end()) {
    log::Debug("ratelimit", "evicted least recently active identity",
               "identity=" + victim->first);
    windows_.erase(victim);
  }
}

}  // namespace jdguard
