#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace quire::db::model {

/*
  Loosely-typed cell value.

  Rows travel through decode -> normalize -> insert as maps of these.
  Backends only ever see the scalar alternatives plus Time; List, Map
  and Legacy are resolved by the normalizer before insert.
*/

struct Value;

using Bytes     = std::vector<std::uint8_t>;
using TimePoint = std::chrono::sys_time<std::chrono::microseconds>;
using List      = std::vector<Value>;
using Map       = std::map<std::string, Value>;
using Row       = Map;

// ---------------------------------------------------------------------
// Legacy document-database primitives
//
// Only produced while decoding older archives. Closed set; each one
// has exactly one row-value meaning, see Normalize().
// ---------------------------------------------------------------------

namespace legacy {

struct Undefined {
  bool operator==(const Undefined&) const = default;
};
struct MinKey {
  bool operator==(const MinKey&) const = default;
};
struct MaxKey {
  bool operator==(const MaxKey&) const = default;
};

struct ObjectId {
  std::array<std::uint8_t, 12> bytes{};

  bool operator==(const ObjectId&) const = default;
};

struct DateTime {
  int64_t millis = 0; // since unix epoch, UTC

  bool operator==(const DateTime&) const = default;
};

struct Timestamp {
  uint32_t seconds   = 0;
  uint32_t increment = 0;

  bool operator==(const Timestamp&) const = default;
};

struct Decimal128 {
  uint64_t low  = 0;
  uint64_t high = 0;

  bool operator==(const Decimal128&) const = default;
};

struct Regex {
  std::string pattern;
  std::string options;

  bool operator==(const Regex&) const = default;
};

struct JavaScript {
  std::string code;

  bool operator==(const JavaScript&) const = default;
};

struct Symbol {
  std::string name;

  bool operator==(const Symbol&) const = default;
};

struct Binary {
  uint8_t subtype = 0;
  Bytes   data;

  bool operator==(const Binary&) const = default;
};

} // namespace legacy

using LegacyValue = std::variant<legacy::Undefined, legacy::MinKey, legacy::MaxKey, legacy::ObjectId, legacy::DateTime,
                                 legacy::Timestamp, legacy::Decimal128, legacy::Regex, legacy::JavaScript, legacy::Symbol,
                                 legacy::Binary>;

enum class ValueKind { Null, Bool, Int, Float, Text, Bytes, Time, List, Map, Legacy };

struct Value {
  using Storage = std::variant<std::monostate, bool, int64_t, double, std::string, Bytes, TimePoint, List, Map, LegacyValue>;

  Storage data;

  Value() = default;
  Value(std::nullptr_t) {}
  Value(bool v) : data(v) {}
  Value(int v) : data(static_cast<int64_t>(v)) {}
  Value(int64_t v) : data(v) {}
  Value(double v) : data(v) {}
  Value(const char* v) : data(std::string(v)) {}
  Value(std::string v) : data(std::move(v)) {}
  Value(Bytes v) : data(std::move(v)) {}
  Value(TimePoint v) : data(v) {}
  Value(List v) : data(std::move(v)) {}
  Value(Map v) : data(std::move(v)) {}
  Value(LegacyValue v) : data(std::move(v)) {}

  ValueKind Kind() const {
    return static_cast<ValueKind>(data.index());
  }

  bool IsNull() const {
    return std::holds_alternative<std::monostate>(data);
  }

  template <typename T>
  const T* As() const {
    return std::get_if<T>(&data);
  }

  template <typename T>
  T* As() {
    return std::get_if<T>(&data);
  }

  bool operator==(const Value& other) const {
    return data == other.data;
  }
};

const char* KindName(ValueKind kind);

/*
  Resolve every Legacy alternative (recursively through List/Map):

    Undefined, MinKey, MaxKey -> Null
    ObjectId                  -> 24-char lowercase hex Text
    DateTime                  -> Time (Null outside years 0001..9999)
    Timestamp                 -> Time (seconds part)
    Decimal128                -> Text (canonical decimal string)
    Regex                     -> Text (pattern)
    JavaScript, Symbol        -> Text
    Binary                    -> Bytes
*/
Value Normalize(const Value& value);

std::string ObjectIdHex(const legacy::ObjectId& id);
std::string Decimal128ToString(const legacy::Decimal128& value);

} // namespace quire::db::model
