#pragma once

#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "internal/aggregation/aggregator.hpp"
#include "internal/ingest/business_client.hpp"
#include "internal/ingest/reply_pacer.hpp"
#include "internal/model/envelope.hpp"
#include "internal/profile/profile_store.hpp"
#include "internal/util/context.hpp"

namespace chatrelay::ingest {

struct EnvelopeFilter {
  std::string_view                             name;
  std::function<bool(const model::Envelope&)> pass;
};

// not_out, require_sender
std::vector<EnvelopeFilter> DefaultFilters();

// composing/typing/recording states, a truthy "typing" extra, or a composing receipt.
bool IsTypingEvent(const model::Envelope& env);

std::string FallbackReply(int count);

struct RouterOptions {
  std::chrono::milliseconds typing_debounce{700};
  std::chrono::milliseconds pre_reply_delay{500};
};

/*
  Routes accepted envelopes of the ingestion process.

  Messages update the profile (inbound or outbound), capture media, pass
  the filter chain, touch the aggregation window and the last-seen maps.
  Typing signals are mapped to the chat the sender last wrote in (or the
  last active chat) and extend that chat's window at most once per
  debounce interval. A flush asks the business backend about the last
  buffered text and replies with typing pacing, or sends the fallback.
*/
class EventRouter {
 public:
  EventRouter(RouterOptions options, profile::ProfileStore& profiles, BusinessClient& business, ReplyPacer& pacer, util::Context ctx,
              std::vector<EnvelopeFilter> filters = DefaultFilters());

  // Must be set before the first Route.
  void AttachAggregator(aggregation::Aggregator* aggregator);

  void Route(const model::Envelope& env);

  void OnMessage(const model::Envelope& env);
  void OnReceipt(const model::Envelope& env);
  void OnAny(const model::Envelope& env);

  void OnFlush(const std::string& chat, int count);
  void OnWindowReset(const std::string& chat, std::string_view reason, int count, std::chrono::milliseconds window);

  std::optional<model::Envelope> LastByChat(const std::string& chat) const;
  std::string                    LastActiveChat() const;
  std::string                    ChatForSender(const std::string& sender) const;

 private:
  bool        Pass(const model::Envelope& env) const;
  std::string TypingTarget(const model::Envelope& env) const;

  RouterOptions               options_;
  profile::ProfileStore&      profiles_;
  BusinessClient&             business_;
  ReplyPacer&                 pacer_;
  util::Context               ctx_;
  std::vector<EnvelopeFilter> filters_;
  aggregation::Aggregator*    aggregator_ = nullptr;

  mutable std::mutex                               last_mutex_;
  std::unordered_map<std::string, model::Envelope> last_by_chat_;
  std::string                                      last_active_chat_;

  mutable std::mutex                                                      map_mutex_;
  std::unordered_map<std::string, std::string>                            chat_by_sender_;
  std::unordered_map<std::string, std::chrono::steady_clock::time_point> last_typing_at_;
};

} // namespace chatrelay::ingest
