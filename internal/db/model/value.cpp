#include "internal/db/model/value.hpp"

#include <bson/bson.h>

#include "internal/util/time.hpp"

namespace quire::db::model {

namespace {

template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

Value NormalizeLegacy(const LegacyValue& legacy) {
  return std::visit(
      Overloaded{
          [](const legacy::Undefined&) -> Value { return Value{}; },
          [](const legacy::MinKey&) -> Value { return Value{}; },
          [](const legacy::MaxKey&) -> Value { return Value{}; },
          [](const legacy::ObjectId& v) -> Value { return Value{ObjectIdHex(v)}; },
          [](const legacy::DateTime& v) -> Value {
            const auto tp = util::UnixMillisToTime(v.millis);
            return tp ? Value{*tp} : Value{};
          },
          [](const legacy::Timestamp& v) -> Value {
            return Value{util::FromUnixSeconds(static_cast<int64_t>(v.seconds))};
          },
          [](const legacy::Decimal128& v) -> Value { return Value{Decimal128ToString(v)}; },
          [](const legacy::Regex& v) -> Value { return Value{v.pattern}; },
          [](const legacy::JavaScript& v) -> Value { return Value{v.code}; },
          [](const legacy::Symbol& v) -> Value { return Value{v.name}; },
          [](const legacy::Binary& v) -> Value { return Value{v.data}; },
      },
      legacy);
}

} // namespace

const char* KindName(ValueKind kind) {
  switch (kind) {
    case ValueKind::Null:
      return "null";
    case ValueKind::Bool:
      return "bool";
    case ValueKind::Int:
      return "int";
    case ValueKind::Float:
      return "float";
    case ValueKind::Text:
      return "text";
    case ValueKind::Bytes:
      return "bytes";
    case ValueKind::Time:
      return "time";
    case ValueKind::List:
      return "list";
    case ValueKind::Map:
      return "map";
    case ValueKind::Legacy:
      return "legacy";
  }
  return "unknown";
}

Value Normalize(const Value& value) {
  if (const auto* legacy = value.As<LegacyValue>()) {
    return NormalizeLegacy(*legacy);
  }
  if (const auto* list = value.As<List>()) {
    List out;
    out.reserve(list->size());
    for (const auto& item : *list) out.push_back(Normalize(item));
    return Value{std::move(out)};
  }
  if (const auto* map = value.As<Map>()) {
    Map out;
    for (const auto& [key, item] : *map) out.emplace(key, Normalize(item));
    return Value{std::move(out)};
  }
  return value;
}

std::string ObjectIdHex(const legacy::ObjectId& id) {
  bson_oid_t oid;
  bson_oid_init_from_data(&oid, id.bytes.data());
  char str[25];
  bson_oid_to_string(&oid, str);
  return str;
}

// Canonical to-scientific-string form, e.g. "1.5", "1E+3", "NaN".
std::string Decimal128ToString(const legacy::Decimal128& value) {
  bson_decimal128_t dec;
  dec.low  = value.low;
  dec.high = value.high;
  char str[BSON_DECIMAL128_STRING];
  bson_decimal128_to_string(&dec, str);
  return str;
}

} // namespace quire::db::model
