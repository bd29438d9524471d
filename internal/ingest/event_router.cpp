#include "event_router.hpp"

#include "internal/identity/chat_id.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/text.hpp"
#include "internal/util/time.hpp"

namespace chatrelay::ingest {

using observability::IntField;
using observability::StringField;

namespace {

constexpr std::size_t kLogPreview = 120;

bool IsTypingState(std::string_view state) {
  const auto s = util::ToLower(util::Trim(state));
  return s == "composing" || s == "typing" || s == "recording";
}

bool TruthyTyping(const model::Envelope& env) {
  const auto& fields = env.extra().fields();
  auto        it     = fields.find("typing");
  if (it == fields.end()) return false;

  if (it->second.kind_case() == google::protobuf::Value::kBoolValue) return it->second.bool_value();
  if (it->second.kind_case() == google::protobuf::Value::kStringValue) {
    const auto& s = it->second.string_value();
    return util::EqualsIgnoreCase(s, "true") || s == "1";
  }
  return false;
}

} // namespace

std::vector<EnvelopeFilter> DefaultFilters() {
  return {
      {"not_out", [](const model::Envelope& env) { return !model::IsOutbound(env); }},
      {"require_sender", [](const model::Envelope& env) { return !util::Trim(env.sender_id()).empty(); }},
  };
}

bool IsTypingEvent(const model::Envelope& env) {
  const auto type = util::ToLower(util::Trim(env.event_type()));

  if (type == model::event_type::kChatPresence) {
    if (auto state = model::ExtraString(env, "state")) return IsTypingState(*state);
  }
  if (type == model::event_type::kTyping || type == model::event_type::kPresence) {
    if (auto state = model::ExtraString(env, "state")) return IsTypingState(*state);
    if (TruthyTyping(env)) return true;
  }

  const auto receipt = util::ToLower(util::Trim(env.receipt_type()));
  return receipt == "composing" || receipt == "typing";
}

std::string FallbackReply(int count) {
  return "Llegaron " + std::to_string(count) + " mensaje(s) en la ventana.";
}

EventRouter::EventRouter(RouterOptions options, profile::ProfileStore& profiles, BusinessClient& business, ReplyPacer& pacer, util::Context ctx,
                         std::vector<EnvelopeFilter> filters)
    : options_(options), profiles_(profiles), business_(business), pacer_(pacer), ctx_(std::move(ctx)), filters_(std::move(filters)) {}

void EventRouter::AttachAggregator(aggregation::Aggregator* aggregator) {
  aggregator_ = aggregator;
}

bool EventRouter::Pass(const model::Envelope& env) const {
  for (const auto& filter : filters_) {
    if (!filter.pass(env)) {
      CHATRELAY_LOG_INFO("filtered", {StringField("reason", filter.name), StringField("dir", env.direction()), StringField("chat", env.chat_id()),
                                      StringField("from", env.sender_id())});
      return false;
    }
  }
  return true;
}

void EventRouter::Route(const model::Envelope& env) {
  if (model::IsMessage(env)) {
    OnMessage(env);
  } else if (env.event_type() == model::event_type::kReceipt) {
    OnReceipt(env);
  } else {
    OnAny(env);
  }
}

// ------------------------------------------------------------------
// Messages
// ------------------------------------------------------------------

void EventRouter::OnMessage(const model::Envelope& raw) {
  model::Envelope env = raw;
  env.set_chat_id(identity::CanonicalChatId(raw.chat_id()));
  env.set_sender_id(identity::CanonicalChatId(raw.sender_id()));

  const auto& chat = env.chat_id();
  const auto  now  = util::Now();

  if (model::IsOutbound(env)) {
    if (!chat.empty()) {
      if (env.has_media()) profiles_.AppendMedia(chat, env);
      profiles_.RecordOutbound(chat, now);
    }
    CHATRELAY_LOG_INFO("filtered", {StringField("reason", "direction_out"), StringField("chat", chat)});
    return;
  }

  // profile first, so metrics and sink paths survive the filters
  try {
    profiles_.TouchInbound(env, now);
  } catch (const util::ValidationError& e) {
    CHATRELAY_LOG_WARN("profile_touch_skipped", {StringField("error", e.what())});
  }
  if (!chat.empty() && env.has_media()) profiles_.AppendMedia(chat, env);

  if (!Pass(env)) return;

  {
    std::lock_guard lock(map_mutex_);
    if (!chat.empty()) chat_by_sender_[env.sender_id()] = chat;
  }
  if (!chat.empty()) {
    std::lock_guard lock(last_mutex_);
    last_active_chat_ = chat;
  }

  if (aggregator_ && !chat.empty()) aggregator_->TouchMessage(chat);

  // linked-device senders in 1:1 chats still open a window, but their text
  // is not kept for the business call
  if (raw.sender_id().find("@lid") != std::string::npos && !identity::IsGroup(chat)) {
    CHATRELAY_LOG_INFO("last_skipped", {StringField("reason", "lid_sender"), StringField("chat", chat)});
    return;
  }

  {
    std::lock_guard lock(last_mutex_);
    last_by_chat_[chat] = env;
  }

  CHATRELAY_LOG_INFO("message", {StringField("chat", chat), StringField("from", env.sender_id()), StringField("text", util::Preview(env.text(), kLogPreview)),
                                 IntField("text_len", static_cast<std::int64_t>(util::RuneCount(util::Trim(env.text()))))});
}

void EventRouter::OnReceipt(const model::Envelope& env) {
  if (!Pass(env)) return;
  if (env.message_ids_size() == 0) return;
  CHATRELAY_LOG_INFO("receipt", {StringField("chat", env.chat_id()), IntField("count", env.message_ids_size()),
                                 StringField("type", util::Trim(env.receipt_type()))});
}

void EventRouter::OnAny(const model::Envelope& env) {
  if (IsTypingEvent(env)) {
    const auto chat = TypingTarget(env);
    if (chat.empty() || !aggregator_) return;

    if (!LastByChat(chat)) return;

    const auto now   = std::chrono::steady_clock::now();
    bool       touch = false;
    {
      std::lock_guard lock(map_mutex_);
      auto            it = last_typing_at_.find(chat);
      if (it == last_typing_at_.end() || now - it->second >= options_.typing_debounce) {
        last_typing_at_[chat] = now;
        touch                 = true;
      }
    }
    if (touch) aggregator_->TouchTyping(chat);
    return;
  }

  if (!Pass(env)) return;
  CHATRELAY_LOG_INFO("event_any", {StringField("type", util::Trim(env.event_type())), StringField("chat", env.chat_id()), StringField("from", env.sender_id())});
}

std::string EventRouter::TypingTarget(const model::Envelope& env) const {
  const auto raw    = identity::CanonicalChatId(env.chat_id());
  const auto mapped = ChatForSender(identity::CanonicalChatId(env.sender_id()));

  // the sender's last conversation wins over a global chat id
  std::string chat = raw;
  if (!mapped.empty() && mapped != raw) chat = mapped;
  if (chat.empty()) chat = LastActiveChat();
  return chat;
}

// ------------------------------------------------------------------
// Aggregation callbacks
// ------------------------------------------------------------------

void EventRouter::OnFlush(const std::string& chat, int count) {
  if (!ctx_.WaitFor(options_.pre_reply_delay)) return;

  const auto last = LastByChat(chat);
  if (last && !util::Trim(last->text()).empty()) {
    if (auto reply = business_.Ask(last->sender_id(), last->text())) {
      const auto wait = pacer_.ReplyWithTyping(chat, reply->reply());
      CHATRELAY_LOG_INFO("reply_business", {StringField("chat", chat), IntField("count", count),
                                            IntField("reply_len", static_cast<std::int64_t>(util::RuneCount(reply->reply()))),
                                            StringField("reply_preview", util::Preview(reply->reply(), kLogPreview)),
                                            IntField("t_pre_delay_ms", options_.pre_reply_delay.count()), IntField("t_typing_ms", wait.count())});
      return;
    }
  }

  const auto text = FallbackReply(count);
  const auto wait = pacer_.ReplyWithTyping(chat, text);
  CHATRELAY_LOG_INFO("reply_fallback", {StringField("chat", chat), IntField("count", count), IntField("t_typing_ms", wait.count())});
}

void EventRouter::OnWindowReset(const std::string& chat, std::string_view reason, int count, std::chrono::milliseconds window) {
  const auto secs = std::chrono::duration_cast<std::chrono::seconds>(window).count();

  std::string event = "agg_window_start";
  if (reason == aggregation::kReasonMessage) event = "agg_window_reset_message";
  if (reason == aggregation::kReasonTyping) event = "agg_window_reset_typing";

  CHATRELAY_LOG_INFO(event, {StringField("chat", chat), IntField("window_s", secs), IntField("count", count)});
}

// ------------------------------------------------------------------
// Last-seen maps
// ------------------------------------------------------------------

std::optional<model::Envelope> EventRouter::LastByChat(const std::string& chat) const {
  std::lock_guard lock(last_mutex_);
  auto            it = last_by_chat_.find(chat);
  if (it == last_by_chat_.end()) return std::nullopt;
  return it->second;
}

std::string EventRouter::LastActiveChat() const {
  std::lock_guard lock(last_mutex_);
  return last_active_chat_;
}

std::string EventRouter::ChatForSender(const std::string& sender) const {
  std::lock_guard lock(map_mutex_);
  auto            it = chat_by_sender_.find(sender);
  return it == chat_by_sender_.end() ? std::string() : it->second;
}

} // namespace chatrelay::ingest
