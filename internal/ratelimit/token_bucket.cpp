#include "token_bucket.hpp"

#include <algorithm>

#include "internal/util/errors.hpp"

namespace chatrelay::ratelimit {

TokenBucket::TokenBucket(std::chrono::milliseconds interval, int burst)
    : interval_(std::max(interval, std::chrono::milliseconds(1))), burst_(std::max(burst, 1)), tokens_(burst_), last_refill_(Clock::now()) {
}

TokenBucket::Clock::duration TokenBucket::RefillLocked(Clock::time_point now) {
  if (tokens_ >= burst_) {
    last_refill_ = now;
    return Clock::duration::zero();
  }

  const auto elapsed = now - last_refill_;
  const auto earned  = elapsed / interval_;
  if (earned > 0) {
    tokens_ = static_cast<int>(std::min<long long>(burst_, tokens_ + static_cast<long long>(earned)));
    last_refill_ += interval_ * earned;
    if (tokens_ >= burst_) last_refill_ = now;
  }

  if (tokens_ > 0) return Clock::duration::zero();
  return interval_ - (now - last_refill_);
}

void TokenBucket::Acquire(const util::Context& ctx) {
  for (;;) {
    ctx.ThrowIfDone();

    Clock::duration wait;
    {
      std::lock_guard lock(mutex_);
      wait = RefillLocked(Clock::now());
      if (tokens_ > 0) {
        --tokens_;
        return;
      }
    }

    auto wait_ms = std::chrono::ceil<std::chrono::milliseconds>(wait);
    if (wait_ms.count() <= 0) wait_ms = std::chrono::milliseconds(1);
    if (!ctx.WaitFor(wait_ms)) {
      throw util::Cancelled("rate limiter wait cancelled");
    }
  }
}

bool TokenBucket::TryAcquire() {
  std::lock_guard lock(mutex_);
  RefillLocked(Clock::now());
  if (tokens_ == 0) return false;
  --tokens_;
  return true;
}

int TokenBucket::Available() {
  std::lock_guard lock(mutex_);
  RefillLocked(Clock::now());
  return tokens_;
}

} // namespace chatrelay::ratelimit
