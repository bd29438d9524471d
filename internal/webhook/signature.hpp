#pragma once

#include <chrono>
#include <string>
#include <string_view>

#include "internal/util/time.hpp"

namespace chatrelay::webhook {

inline constexpr std::string_view kSignatureHeader = "X-Chatrelay-Signature";
inline constexpr std::string_view kTimestampHeader = "X-Chatrelay-Timestamp";
inline constexpr std::string_view kSignaturePrefix = "sha256=";

// Lower-case hex HMAC-SHA256 of `body` keyed with `secret`.
std::string HmacSha256Hex(std::string_view secret, std::string_view body);

// "sha256=<hex>"
std::string SignBody(std::string_view secret, std::string_view body);

/*
  Constant-time check of a "sha256=<hex>" header against the HMAC of the
  raw body. An empty secret never verifies.
*/
bool VerifySignature(std::string_view secret, std::string_view body, std::string_view header);

// Header is RFC3339 or Unix seconds, within `skew` of `now` in either direction.
bool VerifyTimestamp(std::string_view header, util::TimePoint now, std::chrono::milliseconds skew);

} // namespace chatrelay::webhook
