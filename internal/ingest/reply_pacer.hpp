#pragma once

#include <chrono>
#include <mutex>
#include <random>
#include <string>

#include "internal/ingest/engine_client.hpp"
#include "internal/util/context.hpp"

namespace chatrelay::ingest {

struct ReplyPacing {
  std::chrono::milliseconds pre_reply_delay{500};
  std::chrono::milliseconds base_wait{800};
  std::chrono::milliseconds per_char{35};
  std::chrono::milliseconds jitter{400};
  std::chrono::milliseconds max_wait{6000};
  std::chrono::milliseconds typing_pause{300};
};

// base_wait + per_char * runes(message) + jitter_sample, capped at max_wait.
std::chrono::milliseconds TypingWait(const ReplyPacing& pacing, const std::string& message, std::chrono::milliseconds jitter_sample);

/*
  Sends a reply the way a person would: typing indicator on, wait
  proportional to the reply length, send, short pause, typing off.
  Waits are cut short when the context is cancelled.
*/
class ReplyPacer {
 public:
  ReplyPacer(ReplyPacing pacing, EngineControlClient& engine, util::Context ctx);

  // Returns the typing wait that was applied.
  std::chrono::milliseconds ReplyWithTyping(const std::string& chat, const std::string& message);

  const ReplyPacing& Pacing() const {
    return pacing_;
  }

 private:
  std::chrono::milliseconds SampleJitter();

  ReplyPacing          pacing_;
  EngineControlClient& engine_;
  util::Context        ctx_;

  std::mutex   rng_mutex_;
  std::mt19937 rng_{std::random_device{}()};
};

} // namespace chatrelay::ingest
