#include "normalizer.hpp"

#include "internal/engine/chat_names.hpp"
#include "internal/identity/chat_id.hpp"
#include "internal/util/time.hpp"

namespace chatrelay::engine {

using chatrelay::protocol::v1::MediaAttachment;
using chatrelay::protocol::v1::MessageContent;
using chatrelay::protocol::v1::MessageEvent;
using protocol::RawEvent;

namespace {

void FillTicket(const MediaAttachment& in, std::string_view type, model::MediaTicket& out) {
  out.set_type(std::string(type));
  out.set_mimetype(in.mimetype());
  out.set_url(in.url());
  out.set_caption(in.caption());
  out.set_direct_path(in.direct_path());
  out.set_media_key(in.media_key());
  out.set_file_hash(in.file_sha256());
  out.set_encrypted_file_hash(in.file_enc_sha256());
  out.set_file_length(in.file_length());
}

void NormalizeMessage(const MessageEvent& msg, const protocol::NameDirectory* names, model::Envelope& env) {
  const auto& info = msg.info();

  env.set_direction(std::string(info.is_from_me() ? model::kDirectionOut : model::kDirectionIn));
  env.set_chat_id(identity::CanonicalChatId(info.chat()));
  env.set_sender_id(identity::CanonicalChatId(info.sender()));
  env.set_message_id(info.id());
  env.set_text(ExtractText(msg.content()));

  ChatNameInput input;
  input.event     = &msg;
  input.names     = names;
  input.chat_id   = env.chat_id();
  input.sender_id = env.sender_id();
  env.set_chat_name(ResolveChatName(input));

  if (auto media = ExtractMedia(msg)) {
    *env.mutable_media() = std::move(*media);
  }
  if (!info.push_name().empty()) model::SetExtra(env, "push_name", info.push_name());
}

} // namespace

std::string ExtractText(const MessageContent& content) {
  if (!content.extended_text().empty()) return content.extended_text();
  if (!content.conversation().empty()) return content.conversation();
  if (content.has_image() && !content.image().caption().empty()) return content.image().caption();
  if (content.has_video() && !content.video().caption().empty()) return content.video().caption();
  return {};
}

std::optional<model::MediaTicket> ExtractMedia(const MessageEvent& event) {
  const auto&        content = event.content();
  model::MediaTicket ticket;

  if (content.has_image()) {
    FillTicket(content.image(), "image", ticket);
  } else if (content.has_audio()) {
    FillTicket(content.audio(), "audio", ticket);
    ticket.set_seconds(content.audio().seconds());
  } else if (content.has_video()) {
    FillTicket(content.video(), "video", ticket);
  } else if (content.has_document()) {
    FillTicket(content.document(), "document", ticket);
    ticket.set_title(content.document().title());
  } else {
    return std::nullopt;
  }

  const auto& info = event.info();
  ticket.set_direction(std::string(info.is_from_me() ? model::kDirectionOut : model::kDirectionIn));
  ticket.set_chat_id(identity::CanonicalChatId(info.chat()));
  ticket.set_sender_id(identity::CanonicalChatId(info.sender()));
  ticket.set_message_id(info.id());
  if (info.has_timestamp()) *ticket.mutable_at() = info.timestamp();
  return ticket;
}

model::Envelope Normalize(const RawEvent& raw, const protocol::NameDirectory* names) {
  namespace et = model::event_type;

  model::Envelope env;
  switch (raw.kind_case()) {
    case RawEvent::kMessage:
      env.set_event_type(std::string(et::kMessage));
      NormalizeMessage(raw.message(), names, env);
      break;

    case RawEvent::kReceipt: {
      const auto& r = raw.receipt();
      env.set_event_type(std::string(et::kReceipt));
      env.set_chat_id(identity::CanonicalChatId(r.chat()));
      env.set_sender_id(identity::CanonicalChatId(r.sender()));
      for (const auto& id : r.message_ids()) {
        if (!id.empty()) env.add_message_ids(id);
      }
      env.set_receipt_type(r.type());
      break;
    }

    case RawEvent::kChatPresence: {
      const auto& p = raw.chat_presence();
      env.set_event_type(std::string(et::kChatPresence));
      env.set_chat_id(identity::CanonicalChatId(p.chat()));
      env.set_sender_id(identity::CanonicalChatId(p.sender()));
      model::SetExtra(env, "state", p.state());
      model::SetExtra(env, "media", p.media());
      break;
    }

    case RawEvent::kPresence: {
      const auto& p = raw.presence();
      env.set_event_type(std::string(et::kPresence));
      env.set_sender_id(identity::CanonicalChatId(p.from()));
      model::SetExtraBool(env, "unavailable", p.unavailable());
      if (p.has_last_seen()) model::SetExtra(env, "last_seen", util::FormatRfc3339(util::FromProto(p.last_seen())));
      break;
    }

    case RawEvent::kGroupInfo:
      env.set_event_type(std::string(et::kGroupUpdate));
      env.set_chat_id(identity::CanonicalChatId(raw.group_info().jid()));
      env.set_sender_id(identity::CanonicalChatId(raw.group_info().sender()));
      env.set_chat_name(raw.group_info().name());
      break;

    case RawEvent::kJoinedGroup:
      env.set_event_type(std::string(et::kJoinedGroup));
      env.set_chat_id(identity::CanonicalChatId(raw.joined_group().jid()));
      env.set_chat_name(raw.joined_group().name());
      break;

    case RawEvent::kHistorySync:
      env.set_event_type(std::string(et::kHistorySync));
      model::SetExtraNumber(env, "conversations", raw.history_sync().conversations());
      break;

    case RawEvent::kConnected:
      env.set_event_type(std::string(et::kConnected));
      break;

    case RawEvent::kLoggedOut:
      env.set_event_type(std::string(et::kLoggedOut));
      if (!raw.logged_out().reason().empty()) model::SetExtra(env, "reason", raw.logged_out().reason());
      break;

    case RawEvent::kOfflineSyncCompleted:
      env.set_event_type(std::string(et::kOfflineSyncCompleted));
      model::SetExtraNumber(env, "count", raw.offline_sync_completed().count());
      break;

    case RawEvent::kIdentityChange:
      env.set_event_type(std::string(et::kIdentityChange));
      env.set_chat_id(identity::CanonicalChatId(raw.identity_change().jid()));
      model::SetExtraBool(env, "implicit", raw.identity_change().implicit());
      break;

    case RawEvent::kUnknown:
      env.set_event_type(raw.unknown().type().empty() ? "unknown" : raw.unknown().type());
      if (raw.unknown().has_payload()) *env.mutable_extra() = raw.unknown().payload();
      break;

    case RawEvent::KIND_NOT_SET:
      env.set_event_type("unknown");
      break;
  }
  return env;
}

} // namespace chatrelay::engine
