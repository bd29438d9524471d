#pragma once

#include <string>
#include <string_view>

namespace chatrelay::identity {

inline constexpr std::string_view kUserServer      = "s.whatsapp.net";
inline constexpr std::string_view kLidServer       = "lid";
inline constexpr std::string_view kGroupServer     = "g.us";
inline constexpr std::string_view kBroadcastServer = "broadcast";
inline constexpr std::string_view kStatusBroadcast = "status@broadcast";

/*
  Maps any addressing form of a conversation (contact id, linked/alias id,
  group id, broadcast id, bare phone number) to one stable storage key.

  Idempotent: CanonicalChatId(CanonicalChatId(x)) == CanonicalChatId(x).
*/
std::string CanonicalChatId(std::string_view raw);

bool IsGroup(std::string_view id);
bool IsStatusBroadcast(std::string_view id);

// The part before '@' (whole input when there is none).
std::string UserPart(std::string_view id);

// File-name safe key: [A-Za-z0-9._-] kept, everything else '_', empty -> "unknown".
std::string SanitizeKey(std::string_view key);

} // namespace chatrelay::identity
