#include "remote/rate_limiter.hpp"

#include "glog/logging.h"

namespace remote {

FixedWindowRateLimiter::FixedWindowRateLimiter(int32_t max_requests,
                                               std::chrono::seconds window,
                                               Clock clock)
    : max_requests_(max_requests), window_(window), clock_(std::move(clock)) {}

bool FixedWindowRateLimiter::Allow(const std::string& client) {
  if (max_requests_ <= 0) return true;
  std::chrono::steady_clock::time_point now = clock_();
  std::lock_guard<std::mutex> lck(mutex_);

  auto it = windows_.find(client);
  if (it == windows_.end()) {
    if (windows_.size() >= kPruneThreshold) Prune(now);
    windows_.emplace(client, Window{1, now});
    return true;
  }
  Window& window = it->second;
  if (now - window.start > window_) {
    window = Window{1, now};
    return true;
  }
  if (window.requests >= max_requests_) {
    LOG(WARNING) << "Rate limit exceeded for " << client;
    return false;
  }
  window.requests++;
  return true;
}

size_t FixedWindowRateLimiter::TrackedClients() {
  std::lock_guard<std::mutex> lck(mutex_);
  return windows_.size();
}

void FixedWindowRateLimiter::Prune(std::chrono::steady_clock::time_point now) {
  for (auto it = windows_.begin(); it != windows_.end();) {
    if (now - it->second.start > window_) {
      it = windows_.erase(it);
    } else {
      ++it;
    }
  }
}

}  // namespace remote
