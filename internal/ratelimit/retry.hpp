#pragma once

#include <chrono>
#include <exception>
#include <string_view>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/context.hpp"
#include "internal/util/errors.hpp"

namespace chatrelay::ratelimit {

inline constexpr std::chrono::milliseconds kBackoffCeiling{5000};

/*
  Calls fn(ctx) up to `attempts` times. The delay between attempts starts at
  `delay` and doubles while it is below kBackoffCeiling. The first success
  returns; after the last failure its exception is rethrown. Cancellation
  (from fn or from the backoff wait) is never retried.
*/
template <typename Fn>
auto WithRetry(const util::Context& ctx, int attempts, std::chrono::milliseconds delay, std::string_view operation, Fn&& fn) -> decltype(fn(ctx)) {
  if (attempts < 1) attempts = 1;

  for (int attempt = 1;; ++attempt) {
    ctx.ThrowIfDone();
    try {
      return fn(ctx);
    } catch (const util::Cancelled&) {
      throw;
    } catch (const std::exception& e) {
      if (attempt >= attempts) throw;

      CHATRELAY_LOG_WARN("retry_attempt_failed", {observability::StringField("op", operation), observability::IntField("attempt", attempt),
                                                  observability::IntField("delay_ms", delay.count()), observability::StringField("error", e.what())});
    }

    if (!ctx.WaitFor(delay)) {
      throw util::Cancelled("retry backoff cancelled");
    }
    if (delay < kBackoffCeiling) delay *= 2;
  }
}

} // namespace chatrelay::ratelimit
