#include "rate_limiter.hpp"

namespace chatrelay::ratelimit {

std::string_view ToString(OperationClass op) {
  switch (op) {
    case OperationClass::Text:
      return "text";
    case OperationClass::Media:
      return "media";
    case OperationClass::Status:
      return "status";
  }
  return "unknown";
}

RateLimiter::RateLimiter(Policies policies) : policies_{policies.text, policies.media, policies.status} {
  for (std::size_t i = 0; i < policies_.size(); ++i) {
    buckets_[i] = std::make_unique<TokenBucket>(policies_[i].interval, policies_[i].burst);
  }
}

const Policy& RateLimiter::PolicyFor(OperationClass op) const {
  return policies_[static_cast<std::size_t>(op)];
}

TokenBucket& RateLimiter::Bucket(OperationClass op) {
  return *buckets_[static_cast<std::size_t>(op)];
}

} // namespace chatrelay::ratelimit
