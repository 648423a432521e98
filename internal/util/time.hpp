#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "google/protobuf/timestamp.pb.h"

namespace quire::util {

/*
  Time utilities: clock source and the textual layouts accepted
  from archives.
*/

// Microsecond resolution keeps every year from 0001 to 9999 in range.
using Clock     = std::chrono::system_clock;
using TimePoint = std::chrono::sys_time<std::chrono::microseconds>;

// 0001-01-01T00:00:00Z and 9999-12-31T23:59:59.999Z
constexpr int64_t kMinUnixMillis = -62135596800000;
constexpr int64_t kMaxUnixMillis = 253402300799999;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

int64_t   ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(int64_t ms);
TimePoint FromUnixSeconds(int64_t seconds);

// nullopt outside [kMinUnixMillis, kMaxUnixMillis].
std::optional<TimePoint> UnixMillisToTime(int64_t ms);

/*
  Epoch number -> time, disambiguated by magnitude:
    |v| >= 1e11  milliseconds
    |v| >= 1e8   seconds
    otherwise    not a timestamp

  The thresholds come from observed legacy exports; values between
  1e8 ms and 1e11 ms (1973..1976 as millis) classify as seconds.
  Results outside years 0001..9999 are nullopt.
*/
std::optional<TimePoint> UnixNumberToTime(double value);

/*
  Accepted layouts, tried in order:
    RFC3339 with or without fractional seconds ("2024-01-02T03:04:05.123+08:00")
    "YYYY-MM-DD HH:MM:SS[.fraction]"  (UTC)
    "YYYY-MM-DD"                      (UTC midnight)
*/
std::optional<TimePoint> ParseTimestamp(std::string_view raw);

// "YYYY-MM-DD HH:MM:SS[.mmm]" in UTC; the millisecond part is omitted when zero.
std::string FormatSqlTimestamp(TimePoint tp);

// "YYYY-MM-DDTHH:MM:SS[.mmm]Z"
std::string FormatRfc3339(TimePoint tp);

// strftime over the UTC calendar fields of tp.
std::string FormatUtc(TimePoint tp, const char* layout);

} // namespace quire::util
