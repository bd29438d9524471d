#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

#include "google/protobuf/duration.pb.h"
#include "google/protobuf/timestamp.pb.h"

namespace chatrelay::util {

/*
  Time utilities, single place to control clock source later.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

uint64_t ToUnixMillis(TimePoint tp);

// RFC3339 UTC with second precision, e.g. 2024-05-01T10:00:00Z.
std::string FormatRfc3339(TimePoint tp);

// Accepts RFC3339 (any offset, optional fraction) or integral Unix seconds.
std::optional<TimePoint> ParseTimestamp(std::string_view text);

// Local calendar day, YYYY-MM-DD.
std::string LocalDay(TimePoint tp);

// The local calendar day before `day` (YYYY-MM-DD), or empty when `day` does not parse.
std::string PreviousDay(const std::string& day);

// Duration field with a fallback for unset or non-positive values.
std::chrono::milliseconds DurationOr(const google::protobuf::Duration& d, std::chrono::milliseconds fallback);

} // namespace chatrelay::util
