#include "time.hpp"

#include <google/protobuf/util/time_util.h>

#include <cstdint>
#include <cstdio>
#include <ctime>
#include <stdexcept>

namespace chatrelay::util {

namespace {

// 2100-01-01; keeps parsed values and their distance to now inside the nanosecond clock range
constexpr int64_t kMaxAbsUnixSeconds = 4'102'444'800;

bool InClockRange(int64_t seconds) {
  return seconds >= -kMaxAbsUnixSeconds && seconds <= kMaxAbsUnixSeconds;
}

} // namespace

TimePoint Now() {
  return Clock::now();
}

google::protobuf::Timestamp ToProto(TimePoint tp) {
  auto sec   = std::chrono::time_point_cast<std::chrono::seconds>(tp);
  auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(tp - sec);
  if (nanos.count() < 0) {
    sec -= std::chrono::seconds(1);
    nanos += std::chrono::seconds(1);
  }

  google::protobuf::Timestamp ts;
  ts.set_seconds(sec.time_since_epoch().count());
  ts.set_nanos(static_cast<int32_t>(nanos.count()));
  return ts;
}

TimePoint FromProto(const google::protobuf::Timestamp& ts) {
  return TimePoint{} + std::chrono::duration_cast<Clock::duration>(std::chrono::seconds(ts.seconds()) + std::chrono::nanoseconds(ts.nanos()));
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::string FormatRfc3339(TimePoint tp) {
  google::protobuf::Timestamp ts;
  ts.set_seconds(std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count());
  return google::protobuf::util::TimeUtil::ToString(ts);
}

std::optional<TimePoint> ParseTimestamp(std::string_view text) {
  if (text.empty()) return std::nullopt;

  bool digits = true;
  for (std::size_t i = 0; i < text.size(); ++i) {
    const char c = text[i];
    if (c >= '0' && c <= '9') continue;
    if (i == 0 && c == '-' && text.size() > 1) continue;
    digits = false;
    break;
  }
  if (digits) {
    int64_t seconds = 0;
    try {
      seconds = std::stoll(std::string(text));
    } catch (const std::out_of_range&) {
      return std::nullopt;
    }
    if (!InClockRange(seconds)) return std::nullopt;
    return TimePoint{} + std::chrono::seconds(seconds);
  }

  google::protobuf::Timestamp ts;
  if (!google::protobuf::util::TimeUtil::FromString(std::string(text), &ts)) {
    return std::nullopt;
  }
  if (!InClockRange(ts.seconds())) return std::nullopt;
  return FromProto(ts);
}

std::string LocalDay(TimePoint tp) {
  const std::time_t t = Clock::to_time_t(tp);
  std::tm           local{};
  localtime_r(&t, &local);

  char buf[16];
  std::strftime(buf, sizeof(buf), "%Y-%m-%d", &local);
  return buf;
}

std::string PreviousDay(const std::string& day) {
  int y = 0, m = 0, d = 0;
  if (std::sscanf(day.c_str(), "%4d-%2d-%2d", &y, &m, &d) != 3) return {};

  // noon keeps DST transitions from moving the date
  std::tm local{};
  local.tm_year  = y - 1900;
  local.tm_mon   = m - 1;
  local.tm_mday  = d - 1;
  local.tm_hour  = 12;
  local.tm_isdst = -1;
  if (std::mktime(&local) == static_cast<std::time_t>(-1)) return {};

  char buf[16];
  std::strftime(buf, sizeof(buf), "%Y-%m-%d", &local);
  return buf;
}

std::chrono::milliseconds DurationOr(const google::protobuf::Duration& d, std::chrono::milliseconds fallback) {
  const auto ms = std::chrono::milliseconds(google::protobuf::util::TimeUtil::DurationToMilliseconds(d));
  if (ms.count() <= 0) return fallback;
  return ms;
}

} // namespace chatrelay::util
