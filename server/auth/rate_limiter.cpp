#include "server/auth/rate_limiter.h"

namespace modelgate {

namespace {
using TimePoint = std::chrono::steady_clock::time_point;

void DropExpired(std::deque<TimePoint>* hits, TimePoint now, std::chrono::seconds window) {
  while (!hits->empty() && hits->front() + window <= now) {
    hits->pop_front();
  }
}
}  // namespace

bool ParseRateLimitScope(const std::string& text, RateLimitScope* scope) {
  if (text == "per_key" || text == "key") {
    *scope = RateLimitScope::kPerKey;
    return true;
  }
  if (text == "per_capability" || text == "capability") {
    *scope = RateLimitScope::kPerCapability;
    return true;
  }
  return false;
}

const char* RateLimitScopeName(RateLimitScope scope) {
  return scope == RateLimitScope::kPerCapability ? "per_capability" : "per_key";
}

RateLimiter::RateLimiter(RateLimitScope scope, Clock clock)
    : scope_(scope), clock_(std::move(clock)) {}

TimePoint RateLimiter::Now() const {
  return clock_ ? clock_() : std::chrono::steady_clock::now();
}

std::string RateLimiter::WindowKey(const std::string& key_id, Capability capability) const {
  if (scope_ == RateLimitScope::kPerCapability) {
    return key_id + "/" + CapabilityName(capability);
  }
  return key_id;
}

std::shared_ptr<RateLimiter::Window> RateLimiter::FindOrCreate(const std::string& window_key) {
  {
    std::shared_lock lock(mutex_);
    auto it = windows_.find(window_key);
    if (it != windows_.end()) {
      return it->second;
    }
  }
  std::unique_lock lock(mutex_);
  auto& slot = windows_[window_key];
  if (!slot) {
    slot = std::make_shared<Window>();
  }
  return slot;
}

GatewayError RateLimiter::CheckAndConsume(const std::string& key_id,
                                          const RateLimitPolicy& policy,
                                          Capability capability) {
  if (policy.Unlimited()) {
    return GatewayError::Ok();
  }
  const auto window_key = WindowKey(key_id, capability);
  const std::chrono::seconds span(policy.window_seconds);
  for (;;) {
    auto window = FindOrCreate(window_key);
    std::lock_guard<std::mutex> lock(window->mutex);
    if (window->retired) {
      // Pruned between lookup and lock; the map now holds (or will hold) a fresh one.
      continue;
    }
    auto now = Now();
    window->span = span;
    DropExpired(&window->hits, now, span);
    if (static_cast<int>(window->hits.size()) < policy.max_requests) {
      window->hits.push_back(now);
      return GatewayError::Ok();
    }
    auto wait = window->hits.front() + span - now;
    auto retry = std::chrono::ceil<std::chrono::seconds>(wait);
    return GatewayError::RateLimited(retry);
  }
}

int RateLimiter::Remaining(const std::string& key_id, const RateLimitPolicy& policy,
                           Capability capability) const {
  if (policy.Unlimited()) {
    return -1;
  }
  std::shared_ptr<Window> window;
  {
    std::shared_lock lock(mutex_);
    auto it = windows_.find(WindowKey(key_id, capability));
    if (it == windows_.end()) {
      return policy.max_requests;
    }
    window = it->second;
  }
  std::lock_guard<std::mutex> lock(window->mutex);
  auto now = Now();
  int live = 0;
  for (auto ts : window->hits) {
    if (ts + std::chrono::seconds(policy.window_seconds) > now) {
      ++live;
    }
  }
  return live >= policy.max_requests ? 0 : policy.max_requests - live;
}

std::size_t RateLimiter::Prune() {
  auto now = Now();
  std::unique_lock lock(mutex_);
  std::size_t removed = 0;
  for (auto it = windows_.begin(); it != windows_.end();) {
    auto window = it->second;  // keeps the mutex alive across erase
    std::lock_guard<std::mutex> window_lock(window->mutex);
    bool idle = window->hits.empty() || window->hits.back() + window->span <= now;
    if (idle) {
      window->retired = true;
      it = windows_.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  return removed;
}

std::size_t RateLimiter::WindowCount() const {
  std::shared_lock lock(mutex_);
  return windows_.size();
}

}  // namespace modelgate
