#ifndef REMOTE_RATE_LIMITER_HPP
#define REMOTE_RATE_LIMITER_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>

namespace remote {

// Decides whether a client may issue one more request.
class RateLimiter {
 public:
  // Records a request of client and returns false if it exceeds the limit.
  virtual bool Allow(const std::string& client) = 0;

  RateLimiter() = default;
  virtual ~RateLimiter() = default;
  RateLimiter(const RateLimiter&) = delete;
  RateLimiter& operator=(const RateLimiter&) = delete;
  RateLimiter(RateLimiter&&) = delete;
  RateLimiter& operator=(RateLimiter&&) = delete;
};

// Allows up to max_requests requests per client in a window that starts with
// the first request of the client and lasts window. Requests that are denied
// do not count. A max_requests of 0 disables the limit. Thread safe.
class FixedWindowRateLimiter : public RateLimiter {
 public:
  using Clock = std::function<std::chrono::steady_clock::time_point()>;

  FixedWindowRateLimiter(int32_t max_requests, std::chrono::seconds window,
                         Clock clock = std::chrono::steady_clock::now);

  bool Allow(const std::string& client) override;

  // Number of clients that are currently tracked.
  size_t TrackedClients();

 private:
  struct Window {
    int32_t requests;
    std::chrono::steady_clock::time_point start;
  };

  // Forgets the clients whose window is over.
  void Prune(std::chrono::steady_clock::time_point now);

  static const constexpr size_t kPruneThreshold = 4096;

  int32_t max_requests_;
  std::chrono::seconds window_;
  Clock clock_;
  std::mutex mutex_;
  std::unordered_map<std::string, Window> windows_;
};

}  // namespace remote

#endif
