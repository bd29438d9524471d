#pragma once

#include <chrono>
#include <mutex>

#include "internal/util/context.hpp"

namespace chatrelay::ratelimit {

/*
  Token bucket admission gate.

  Starts full with `burst` tokens; one token is added per `interval`, never
  exceeding `burst`. Acquire() blocks until a token is available or the
  context finishes (util::Cancelled).
*/
class TokenBucket {
 public:
  using Clock = std::chrono::steady_clock;

  TokenBucket(std::chrono::milliseconds interval, int burst);

  void Acquire(const util::Context& ctx);
  bool TryAcquire();

  int Available();

 private:
  // Requires mutex_. Returns time until the next token when empty.
  Clock::duration RefillLocked(Clock::time_point now);

  const std::chrono::milliseconds interval_;
  const int                       burst_;

  std::mutex        mutex_;
  int               tokens_;
  Clock::time_point last_refill_;
};

} // namespace chatrelay::ratelimit
