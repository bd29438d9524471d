#pragma once

#include <array>
#include <chrono>
#include <memory>
#include <string_view>
#include <utility>

#include "internal/ratelimit/retry.hpp"
#include "internal/ratelimit/token_bucket.hpp"

namespace chatrelay::ratelimit {

enum class OperationClass { Text = 0, Media = 1, Status = 2 };

std::string_view ToString(OperationClass op);

struct Policy {
  std::chrono::milliseconds interval{50};
  int                       burst = 5;

  int                       retry_attempts = 3;
  std::chrono::milliseconds retry_delay{250};
};

struct Policies {
  Policy text{std::chrono::milliseconds(50), 5, 3, std::chrono::milliseconds(250)};
  Policy media{std::chrono::milliseconds(150), 2, 3, std::chrono::milliseconds(400)};
  Policy status{std::chrono::milliseconds(500), 1, 2, std::chrono::milliseconds(600)};
};

/*
  Rate-limited retry decorator for outbound send primitives.

  One token bucket per operation class. Run() passes the admission gate
  first, then runs the bounded retry loop around the wrapped call.
*/
class RateLimiter {
 public:
  explicit RateLimiter(Policies policies = {});

  template <typename Fn>
  auto Run(OperationClass op, const util::Context& ctx, Fn&& fn) -> decltype(fn(ctx)) {
    const auto& policy = PolicyFor(op);
    Bucket(op).Acquire(ctx);
    return WithRetry(ctx, policy.retry_attempts, policy.retry_delay, ToString(op), std::forward<Fn>(fn));
  }

  const Policy& PolicyFor(OperationClass op) const;
  TokenBucket&  Bucket(OperationClass op);

 private:
  std::array<Policy, 3>                       policies_;
  std::array<std::unique_ptr<TokenBucket>, 3> buckets_;
};

} // namespace chatrelay::ratelimit
