#pragma once

#include "server/auth/api_key_record.h"
#include "server/errors/gateway_error.h"

#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace modelgate {

enum class RateLimitScope { kPerKey, kPerCapability };

bool ParseRateLimitScope(const std::string& text, RateLimitScope* scope);
const char* RateLimitScopeName(RateLimitScope scope);

// Sliding-log limiter: each window keeps the timestamps of the requests it
// admitted during the last W seconds. A request is consumed only if fewer than
// N timestamps remain after dropping expired ones.
class RateLimiter {
 public:
  using Clock = std::function<std::chrono::steady_clock::time_point()>;

  explicit RateLimiter(RateLimitScope scope = RateLimitScope::kPerKey, Clock clock = {});

  GatewayError CheckAndConsume(const std::string& key_id, const RateLimitPolicy& policy,
                               Capability capability);

  // Units left in the current window without consuming one.
  int Remaining(const std::string& key_id, const RateLimitPolicy& policy,
                Capability capability) const;

  // Drops windows that hold no live timestamps. Returns the number removed.
  std::size_t Prune();

  RateLimitScope Scope() const { return scope_; }
  std::size_t WindowCount() const;

 private:
  struct Window {
    std::mutex mutex;
    std::deque<std::chrono::steady_clock::time_point> hits;
    std::chrono::seconds span{0};  // window length of the last consuming policy
    bool retired{false};  // set by Prune; callers must look the window up again
  };

  std::string WindowKey(const std::string& key_id, Capability capability) const;
  std::shared_ptr<Window> FindOrCreate(const std::string& window_key);
  std::chrono::steady_clock::time_point Now() const;

  RateLimitScope scope_;
  Clock clock_;
  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, std::shared_ptr<Window>> windows_;
};

}  // namespace modelgate
