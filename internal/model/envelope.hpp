#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "chatrelay/v1.hpp"
#include "internal/util/time.hpp"

namespace chatrelay::model {

using Envelope    = chatrelay::v1::Envelope;
using MediaTicket = chatrelay::v1::MediaTicket;

namespace event_type {
inline constexpr std::string_view kMessage              = "message";
inline constexpr std::string_view kReceipt              = "receipt";
inline constexpr std::string_view kChatPresence         = "chat_presence";
inline constexpr std::string_view kPresence             = "presence";
inline constexpr std::string_view kGroupUpdate          = "group_update";
inline constexpr std::string_view kJoinedGroup          = "joined_group";
inline constexpr std::string_view kHistorySync          = "history_sync";
inline constexpr std::string_view kConnected            = "connected";
inline constexpr std::string_view kLoggedOut            = "logged_out";
inline constexpr std::string_view kOfflineSyncCompleted = "offline_sync_completed";
inline constexpr std::string_view kIdentityChange       = "identity_change";
inline constexpr std::string_view kTyping               = "typing";
} // namespace event_type

inline constexpr std::string_view kDirectionIn  = "in";
inline constexpr std::string_view kDirectionOut = "out";

bool IsMessage(const Envelope& env);
bool IsOutbound(const Envelope& env);

// Connection lifecycle and device events (partitioned per host by the sink).
bool IsDeviceEvent(std::string_view event_type);

/*
  Checks the id-carrier invariant: receipts never carry message_id, every
  other event type never carries message_ids. event_type must be set.

  Throws util::ValidationError.
*/
void Validate(const Envelope& env);

// Assigns `at` when it is unset.
void StampIfUnset(Envelope& env, util::TimePoint now);

// Compact single-line JSON.
std::string Serialize(const Envelope& env);

// Parses and validates. Throws util::ValidationError.
Envelope Parse(std::string_view json);

void SetExtra(Envelope& env, const std::string& key, const std::string& value);
void SetExtraBool(Envelope& env, const std::string& key, bool value);
void SetExtraNumber(Envelope& env, const std::string& key, double value);

std::optional<std::string> ExtraString(const Envelope& env, const std::string& key);
std::optional<bool>        ExtraBool(const Envelope& env, const std::string& key);

} // namespace chatrelay::model
