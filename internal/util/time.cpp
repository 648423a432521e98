#include "internal/util/time.hpp"

#include <cmath>
#include <cstdio>
#include <ctime>

namespace quire::util {

namespace {

using std::chrono::hours;
using std::chrono::microseconds;
using std::chrono::milliseconds;
using std::chrono::minutes;
using std::chrono::nanoseconds;
using std::chrono::seconds;

bool ReadDigits(std::string_view s, std::size_t& pos, std::size_t count, int& out) {
  if (pos + count > s.size()) return false;
  int value = 0;
  for (std::size_t i = 0; i < count; ++i) {
    const char c = s[pos + i];
    if (c < '0' || c > '9') return false;
    value = value * 10 + (c - '0');
  }
  pos += count;
  out = value;
  return true;
}

bool Expect(std::string_view s, std::size_t& pos, char c) {
  if (pos >= s.size() || s[pos] != c) return false;
  ++pos;
  return true;
}

std::optional<TimePoint> MakeDate(int y, int m, int d) {
  const std::chrono::year_month_day ymd{std::chrono::year{y}, std::chrono::month{static_cast<unsigned>(m)},
                                        std::chrono::day{static_cast<unsigned>(d)}};
  if (!ymd.ok()) return std::nullopt;
  return TimePoint{std::chrono::sys_days{ymd}};
}

// HH:MM:SS[.fraction] starting at pos.
bool ReadClock(std::string_view s, std::size_t& pos, nanoseconds& out) {
  int h = 0, mi = 0, sec = 0;
  if (!ReadDigits(s, pos, 2, h) || !Expect(s, pos, ':') || !ReadDigits(s, pos, 2, mi) || !Expect(s, pos, ':') ||
      !ReadDigits(s, pos, 2, sec)) {
    return false;
  }
  if (h > 23 || mi > 59 || sec > 59) return false;

  nanoseconds frac{0};
  if (pos < s.size() && s[pos] == '.') {
    ++pos;
    std::size_t digits = 0;
    int64_t     value  = 0;
    while (pos < s.size() && s[pos] >= '0' && s[pos] <= '9') {
      if (digits < 9) {
        value = value * 10 + (s[pos] - '0');
        ++digits;
      }
      ++pos;
    }
    if (digits == 0) return false;
    for (std::size_t i = digits; i < 9; ++i) value *= 10;
    frac = nanoseconds{value};
  }

  out = hours{h} + minutes{mi} + seconds{sec} + frac;
  return true;
}

} // namespace

TimePoint Now() {
  return std::chrono::floor<microseconds>(Clock::now());
}

google::protobuf::Timestamp ToProto(TimePoint tp) {
  auto sec   = std::chrono::floor<seconds>(tp);
  auto nanos = std::chrono::duration_cast<nanoseconds>(tp - sec);

  google::protobuf::Timestamp ts;
  ts.set_seconds(sec.time_since_epoch().count());
  ts.set_nanos(static_cast<int32_t>(nanos.count()));
  return ts;
}

TimePoint FromProto(const google::protobuf::Timestamp& ts) {
  return TimePoint{seconds(ts.seconds())} + std::chrono::duration_cast<microseconds>(nanoseconds(ts.nanos()));
}

int64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::floor<milliseconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixMillis(int64_t ms) {
  return TimePoint{milliseconds{ms}};
}

TimePoint FromUnixSeconds(int64_t s) {
  return TimePoint{seconds{s}};
}

std::optional<TimePoint> UnixMillisToTime(int64_t ms) {
  if (ms < kMinUnixMillis || ms > kMaxUnixMillis) return std::nullopt;
  return FromUnixMillis(ms);
}

std::optional<TimePoint> UnixNumberToTime(double value) {
  if (std::isnan(value) || std::isinf(value)) {
    return std::nullopt;
  }
  const double abs = std::fabs(value);
  double       ms  = 0;
  if (abs >= 1e11) {
    ms = value;
  } else if (abs >= 1e8) {
    ms = std::trunc(value) * 1000;
  } else {
    return std::nullopt;
  }
  // range check precedes the int64 cast
  if (ms < static_cast<double>(kMinUnixMillis) || ms > static_cast<double>(kMaxUnixMillis)) {
    return std::nullopt;
  }
  return UnixMillisToTime(static_cast<int64_t>(ms));
}

std::optional<TimePoint> ParseTimestamp(std::string_view raw) {
  const auto first = raw.find_first_not_of(" \t\r\n");
  if (first == std::string_view::npos) return std::nullopt;
  const auto      last = raw.find_last_not_of(" \t\r\n");
  std::string_view s   = raw.substr(first, last - first + 1);

  std::size_t pos = 0;
  int         y = 0, m = 0, d = 0;
  if (!ReadDigits(s, pos, 4, y) || !Expect(s, pos, '-') || !ReadDigits(s, pos, 2, m) || !Expect(s, pos, '-') ||
      !ReadDigits(s, pos, 2, d)) {
    return std::nullopt;
  }
  auto date = MakeDate(y, m, d);
  if (!date) return std::nullopt;

  if (pos == s.size()) {
    return date;
  }

  const char sep = s[pos++];
  nanoseconds clock{0};
  if (!ReadClock(s, pos, clock)) return std::nullopt;

  if (sep == ' ') {
    if (pos != s.size()) return std::nullopt;
    return *date + std::chrono::duration_cast<microseconds>(clock);
  }
  if (sep != 'T' && sep != 't') return std::nullopt;

  // RFC3339 requires a zone designator
  if (pos >= s.size()) return std::nullopt;
  minutes offset{0};
  if (s[pos] == 'Z' || s[pos] == 'z') {
    ++pos;
  } else if (s[pos] == '+' || s[pos] == '-') {
    const int sign = s[pos] == '-' ? -1 : 1;
    ++pos;
    int oh = 0, om = 0;
    if (!ReadDigits(s, pos, 2, oh) || !Expect(s, pos, ':') || !ReadDigits(s, pos, 2, om)) return std::nullopt;
    if (oh > 23 || om > 59) return std::nullopt;
    offset = minutes{sign * (oh * 60 + om)};
  } else {
    return std::nullopt;
  }
  if (pos != s.size()) return std::nullopt;

  return *date + std::chrono::duration_cast<microseconds>(clock - offset);
}

std::string FormatUtc(TimePoint tp, const char* layout) {
  const std::time_t t = static_cast<std::time_t>(std::chrono::floor<seconds>(tp).time_since_epoch().count());
  std::tm           tm{};
  gmtime_r(&t, &tm);
  char buf[64];
  const std::size_t n = std::strftime(buf, sizeof(buf), layout, &tm);
  return std::string(buf, n);
}

std::string FormatSqlTimestamp(TimePoint tp) {
  std::string out = FormatUtc(tp, "%Y-%m-%d %H:%M:%S");
  const auto  ms  = ToUnixMillis(tp) - ToUnixMillis(std::chrono::floor<seconds>(tp));
  if (ms != 0) {
    char frac[8];
    std::snprintf(frac, sizeof(frac), ".%03lld", static_cast<long long>(ms));
    out += frac;
  }
  return out;
}

std::string FormatRfc3339(TimePoint tp) {
  std::string out = FormatUtc(tp, "%Y-%m-%dT%H:%M:%S");
  const auto  ms  = ToUnixMillis(tp) - ToUnixMillis(std::chrono::floor<seconds>(tp));
  if (ms != 0) {
    char frac[8];
    std::snprintf(frac, sizeof(frac), ".%03lld", static_cast<long long>(ms));
    out += frac;
  }
  out += 'Z';
  return out;
}

} // namespace quire::util
