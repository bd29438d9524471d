#include "engine.hpp"

#include <algorithm>
#include <sstream>

#include "internal/engine/chat_names.hpp"
#include "internal/engine/normalizer.hpp"
#include "internal/identity/chat_id.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/text.hpp"
#include "internal/util/time.hpp"

namespace chatrelay::engine {

using observability::BoolField;
using observability::IntField;
using observability::StringField;
using ratelimit::OperationClass;

namespace {

constexpr std::size_t               kTextPreview = 80;
constexpr std::chrono::milliseconds kConnectStep{250};

std::string ChatKind(const std::string& chat) {
  if (identity::IsStatusBroadcast(chat)) return "status";
  return identity::IsGroup(chat) ? "group" : "contact";
}

std::string JoinIds(const model::Envelope& env) {
  std::ostringstream out;
  for (int i = 0; i < env.message_ids_size(); ++i) {
    if (i > 0) out << ',';
    out << env.message_ids(i);
  }
  return out.str();
}

} // namespace

Engine::Engine(EngineOptions options, std::shared_ptr<protocol::ProtocolClient> client, std::shared_ptr<history::HistoryStore> history,
               std::shared_ptr<sink::FolderSink> sink, std::shared_ptr<webhook::WebhookDelivery> webhook, std::shared_ptr<ratelimit::RateLimiter> limiter,
               runtime::TaskExecutor& executor, util::Context ctx)
    : options_(options),
      client_(std::move(client)),
      history_(std::move(history)),
      sink_(std::move(sink)),
      webhook_(std::move(webhook)),
      limiter_(std::move(limiter)),
      executor_(executor),
      ctx_(std::move(ctx)),
      receipts_(options.receipt_dedupe_window, options.receipt_dedupe_window) {}

Engine::~Engine() {
  Stop();
}

void Engine::SetHandlers(EngineHandlers handlers) {
  handlers_ = std::move(handlers);
}

// ------------------------------------------------------------------
// Lifecycle
// ------------------------------------------------------------------

void Engine::Start() {
  receipts_.StartSweeper();
  ConnectWithRetry();
  if (options_.announce_presence) AnnouncePresence();
}

void Engine::Stop() {
  client_->Disconnect();
  receipts_.Stop();
}

void Engine::ConnectWithRetry() {
  const int attempts = std::max(1, options_.connect_attempts);

  for (int i = 0;; ++i) {
    ctx_.ThrowIfDone();
    try {
      client_->Connect([this](const protocol::RawEvent& raw) { Dispatch(raw); });
      if (client_->IsConnected()) {
        CHATRELAY_LOG_INFO("engine_connected", {IntField("attempt", i + 1), StringField("own_id", client_->OwnId())});
        return;
      }
    } catch (const util::TransportError& e) {
      if (i + 1 >= attempts) throw;
      CHATRELAY_LOG_WARN("engine_connect_failed", {IntField("attempt", i + 1), StringField("error", e.what())});
    }
    if (i + 1 >= attempts) throw util::TransportError("protocol client did not connect");

    if (!ctx_.WaitFor(options_.connect_base_delay + kConnectStep * i)) {
      throw util::Cancelled("connect cancelled");
    }
  }
}

void Engine::AnnouncePresence() {
  try {
    limiter_->Run(OperationClass::Status, ctx_, [this](const util::Context&) { client_->SendPresence(true); });
    CHATRELAY_LOG_INFO("presence_available");
  } catch (const std::exception& e) {
    CHATRELAY_LOG_WARN("presence_announce_failed", {StringField("error", e.what())});
  }
}

void Engine::Dispatch(const protocol::RawEvent& raw) {
  if (!executor_.Submit([this, raw] { HandleEvent(raw); })) {
    CHATRELAY_LOG_WARN("engine_event_dropped", {StringField("reason", "executor_stopped")});
  }
}

// ------------------------------------------------------------------
// Inbound
// ------------------------------------------------------------------

void Engine::HandleEvent(const protocol::RawEvent& raw) {
  namespace et = model::event_type;

  auto              env  = Normalize(raw, client_.get());
  const std::string type = env.event_type();

  if (type == et::kMessage) {
    if (model::IsOutbound(env)) {
      // own message echoed by the session: forwarded, never surfaced as inbound
      CHATRELAY_LOG_INFO("msg_echo", {StringField("chat", env.chat_id()), StringField("id", env.message_id())});
      Forward(std::move(env));
      return;
    }
    HandleInbound(raw, std::move(env));
    return;
  }

  if (type == et::kReceipt) {
    if (!FirstReceipt(env)) return;
    CHATRELAY_LOG_INFO("receipt", {StringField("kind", ChatKind(env.chat_id())), StringField("chat", env.chat_id()), StringField("type", env.receipt_type()),
                                   IntField("ids", env.message_ids_size())});
    Forward(env);
    Notify(handlers_.on_receipt, "on_receipt", env);
    return;
  }

  if (type == et::kChatPresence) {
    CHATRELAY_LOG_INFO("chat_presence", {StringField("chat", env.chat_id()), StringField("state", model::ExtraString(env, "state").value_or("")),
                                         StringField("media", model::ExtraString(env, "media").value_or(""))});
    Forward(std::move(env));
    return;
  }

  if (type == et::kPresence) {
    CHATRELAY_LOG_INFO("presence", {StringField("from", env.sender_id()), BoolField("unavailable", model::ExtraBool(env, "unavailable").value_or(false))});
    Forward(env);
    Notify(handlers_.on_presence, "on_presence", env);
    return;
  }

  if (type == et::kGroupUpdate) {
    CHATRELAY_LOG_INFO("group_update", {StringField("group", env.chat_id())});
    Forward(env);
    Notify(handlers_.on_group_update, "on_group_update", env);
    return;
  }

  if (type == et::kConnected) {
    CHATRELAY_LOG_INFO("session_connected");
    if (options_.announce_presence) AnnouncePresence();
  } else if (type == et::kLoggedOut) {
    CHATRELAY_LOG_WARN("session_logged_out", {StringField("reason", model::ExtraString(env, "reason").value_or(""))});
  } else {
    CHATRELAY_LOG_INFO("event", {StringField("type", type), StringField("chat", env.chat_id())});
  }
  Forward(std::move(env));
}

void Engine::HandleInbound(const protocol::RawEvent& raw, model::Envelope env) {
  const auto& info = raw.message().info();

  history::HistoryMessage row;
  row.message_id = env.message_id();
  row.chat_id    = env.chat_id();
  row.sender     = env.sender_id();
  row.content    = env.text();
  row.timestamp  = info.has_timestamp() ? util::FromProto(info.timestamp()) : util::Now();
  row.is_from_me = false;
  if (env.has_media()) {
    row.media_type = env.media().type();
    row.filename   = env.media().title();
    row.url        = env.media().url();
  }
  StoreHistory(row, env.chat_name());

  if (env.has_media()) {
    CHATRELAY_LOG_INFO("msg_in", {StringField("kind", ChatKind(env.chat_id())), StringField("chat", env.chat_id()), StringField("from", env.sender_id()),
                                  StringField("id", env.message_id()), StringField("media", env.media().type()),
                                  StringField("caption", util::Preview(env.text(), kTextPreview))});
  } else {
    CHATRELAY_LOG_INFO("msg_in", {StringField("kind", ChatKind(env.chat_id())), StringField("chat", env.chat_id()), StringField("from", env.sender_id()),
                                  StringField("id", env.message_id()), StringField("text", util::Preview(env.text(), kTextPreview))});
  }

  Forward(env);
  Notify(handlers_.on_message, "on_message", env);
}

bool Engine::FirstReceipt(const model::Envelope& env) {
  const auto key = env.chat_id() + "|" + env.receipt_type() + "|" + JoinIds(env);
  return !receipts_.Seen(key);
}

void Engine::StoreHistory(const history::HistoryMessage& row, const std::string& chat_name) {
  try {
    if (auto r = history_->UpsertChat(row.chat_id, chat_name, row.timestamp); !r) {
      ReportError("history", r.message);
    }
    if (auto r = history_->StoreMessage(row); !r) {
      ReportError("history", r.message);
    }
  } catch (const std::exception& e) {
    ReportError("history", e.what());
  }
}

void Engine::Forward(model::Envelope env) {
  model::StampIfUnset(env, util::Now());

  if (sink_) {
    try {
      sink_->Append(env);
    } catch (const std::exception& e) {
      ReportError("sink", e.what());
    }
  }
  if (webhook_) webhook_->Enqueue(std::move(env));
}

void Engine::Notify(const std::function<void(const model::Envelope&)>& fn, std::string_view name, const model::Envelope& env) {
  if (!fn) return;
  try {
    fn(env);
  } catch (const std::exception& e) {
    CHATRELAY_LOG_ERROR("handler_failed", {StringField("handler", name), StringField("error", e.what())});
  }
}

void Engine::ReportError(std::string_view stage, const std::string& error) {
  CHATRELAY_LOG_ERROR("engine_side_effect_failed", {StringField("stage", stage), StringField("error", error)});
  if (!handlers_.on_error) return;
  try {
    handlers_.on_error(stage, error);
  } catch (const std::exception& e) {
    CHATRELAY_LOG_ERROR("handler_failed", {StringField("handler", "on_error"), StringField("error", e.what())});
  }
}

// ------------------------------------------------------------------
// Outbound
// ------------------------------------------------------------------

std::string Engine::ChatNameFor(const std::string& chat) const {
  ChatNameInput input;
  input.names   = client_.get();
  input.chat_id = chat;
  return ResolveChatName(input);
}

void Engine::RecordOutbound(const std::string& chat, const std::string& id, const std::string& text, const model::MediaTicket* media) {
  const auto now = util::Now();

  history::HistoryMessage row;
  row.message_id = id;
  row.chat_id    = chat;
  row.sender     = "me";
  row.content    = text;
  row.timestamp  = now;
  row.is_from_me = true;
  if (media) {
    row.media_type = media->type();
    row.filename   = media->title();
  }
  StoreHistory(row, {});

  model::Envelope env;
  env.set_event_type(std::string(model::event_type::kMessage));
  env.set_direction(std::string(model::kDirectionOut));
  env.set_chat_id(chat);
  env.set_chat_name(ChatNameFor(chat));
  env.set_message_id(id);
  env.set_text(text);
  if (media) *env.mutable_media() = *media;
  *env.mutable_at() = util::ToProto(now);
  Forward(std::move(env));
}

std::string Engine::SendText(const util::Context& ctx, const std::string& to, const std::string& text) {
  const auto chat = identity::CanonicalChatId(to);
  if (chat.empty()) throw util::ValidationError("recipient is required");

  auto id = limiter_->Run(OperationClass::Text, ctx, [&](const util::Context&) { return client_->SendText(chat, text); });

  CHATRELAY_LOG_INFO("msg_out", {StringField("kind", ChatKind(chat)), StringField("to", chat), StringField("id", id),
                                 StringField("text", util::Preview(text, kTextPreview))});
  RecordOutbound(chat, id, text, nullptr);
  return id;
}

std::string Engine::SendMedia(const util::Context& ctx, const std::string& to, const MediaInput& media) {
  const auto chat = identity::CanonicalChatId(to);
  if (chat.empty()) throw util::ValidationError("recipient is required");
  if (media.data.empty()) throw util::ValidationError("media is empty");

  protocol::UploadResult upload;
  protocol::SendMediaCommand command;

  auto id = limiter_->Run(OperationClass::Media, ctx, [&](const util::Context&) {
    upload = client_->Upload(media.data, media.kind);

    command.Clear();
    command.set_to(chat);
    command.set_kind(media.kind);
    command.set_mimetype(media.mimetype);
    command.set_caption(media.caption);
    *command.mutable_upload() = upload;

    if (media.kind == "audio") {
      const auto mime    = util::ToLower(media.mimetype);
      std::uint32_t secs = 0;
      if (mime.find("ogg") != std::string::npos || mime.find("opus") != std::string::npos) {
        secs = OggDurationSeconds(media.data).value_or(0);
      }
      if (secs == 0) secs = kDefaultAudioSeconds;
      command.set_seconds(secs);
      command.set_waveform(PlaceholderWaveform(secs));
      command.set_ptt(true);
    } else if (media.kind == "document") {
      command.set_title(media.filename);
    }
    return client_->SendMedia(command);
  });

  model::MediaTicket ticket;
  ticket.set_direction(std::string(model::kDirectionOut));
  ticket.set_chat_id(chat);
  ticket.set_message_id(id);
  ticket.set_type(media.kind);
  ticket.set_mimetype(media.mimetype);
  ticket.set_title(media.filename);
  ticket.set_caption(media.caption);
  ticket.set_url(upload.url());
  ticket.set_direct_path(upload.direct_path());
  ticket.set_media_key(upload.media_key());
  ticket.set_file_hash(upload.file_sha256());
  ticket.set_encrypted_file_hash(upload.file_enc_sha256());
  ticket.set_file_length(upload.file_length());
  ticket.set_seconds(command.seconds());
  *ticket.mutable_at() = util::ToProto(util::Now());

  CHATRELAY_LOG_INFO("msg_out", {StringField("kind", ChatKind(chat)), StringField("to", chat), StringField("id", id), StringField("media", media.kind),
                                 StringField("caption", util::Preview(media.caption, kTextPreview))});
  RecordOutbound(chat, id, media.caption, &ticket);
  return id;
}

void Engine::SetTyping(const util::Context& ctx, const std::string& to, bool typing, const std::string& media) {
  const auto chat = identity::CanonicalChatId(to);
  if (chat.empty()) throw util::ValidationError("recipient is required");

  const std::string state = typing ? "composing" : "paused";
  const std::string kind  = util::EqualsIgnoreCase(util::Trim(media), "audio") ? "audio" : "";

  limiter_->Run(OperationClass::Status, ctx, [&](const util::Context&) { client_->SendChatPresence(chat, state, kind); });
  CHATRELAY_LOG_DEBUG("typing", {StringField("to", chat), StringField("state", state), StringField("media", kind)});
}

void Engine::MarkRead(const util::Context& ctx, const std::string& chat, const std::vector<std::string>& message_ids, const std::string& sender,
                      const std::string& receipt_type) {
  const auto canonical = identity::CanonicalChatId(chat);
  if (canonical.empty()) throw util::ValidationError("recipient is required");

  protocol::MarkReadCommand command;
  command.set_chat(canonical);
  command.set_sender(identity::CanonicalChatId(sender));
  for (const auto& id : message_ids) {
    if (!id.empty()) command.add_message_ids(id);
  }
  if (command.message_ids_size() == 0) return;

  command.set_type(util::EqualsIgnoreCase(util::Trim(receipt_type), "played") ? "played" : "read");
  *command.mutable_at() = util::ToProto(util::Now());

  limiter_->Run(OperationClass::Status, ctx, [&](const util::Context&) { client_->MarkRead(command); });
  CHATRELAY_LOG_INFO("markread_ok", {StringField("chat", canonical), StringField("type", command.type()), IntField("ids", command.message_ids_size())});
}

std::vector<history::HistoryMessage> Engine::RecentMessages(const std::string& chat, int limit) const {
  return history_->RecentMessages(identity::CanonicalChatId(chat), limit);
}

} // namespace chatrelay::engine
