#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace chatrelay::util {

/*
  UUID helpers

  Outbound message ids and sidecar command ids are RFC4122 v4 UUIDs,
  rendered upper-case without dashes.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

// 32 upper-case hex digits.
std::string NewMessageId();

} // namespace chatrelay::util
