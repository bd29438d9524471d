#include "reply_pacer.hpp"

#include <algorithm>

#include "internal/util/text.hpp"

namespace chatrelay::ingest {

std::chrono::milliseconds TypingWait(const ReplyPacing& pacing, const std::string& message, std::chrono::milliseconds jitter_sample) {
  const auto runes = static_cast<std::chrono::milliseconds::rep>(util::RuneCount(message));
  const auto wait  = pacing.base_wait + pacing.per_char * runes + jitter_sample;
  return std::min(wait, pacing.max_wait);
}

ReplyPacer::ReplyPacer(ReplyPacing pacing, EngineControlClient& engine, util::Context ctx) : pacing_(pacing), engine_(engine), ctx_(std::move(ctx)) {}

std::chrono::milliseconds ReplyPacer::SampleJitter() {
  if (pacing_.jitter.count() <= 0) return std::chrono::milliseconds(0);

  std::lock_guard                                              lock(rng_mutex_);
  std::uniform_int_distribution<std::chrono::milliseconds::rep> dist(0, pacing_.jitter.count() - 1);
  return std::chrono::milliseconds(dist(rng_));
}

std::chrono::milliseconds ReplyPacer::ReplyWithTyping(const std::string& chat, const std::string& message) {
  engine_.SetTyping(chat, true, "text");

  const auto wait = TypingWait(pacing_, message, SampleJitter());
  if (!ctx_.WaitFor(wait)) return wait;

  engine_.Send(chat, message);

  ctx_.WaitFor(pacing_.typing_pause);
  engine_.SetTyping(chat, false, "text");
  return wait;
}

} // namespace chatrelay::ingest
