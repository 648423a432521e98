#include "internal/backup/row_normalizer.hpp"

#include <cerrno>
#include <cstdlib>
#include <initializer_list>
#include <stdexcept>

#include "internal/backup/table_registry.hpp"
#include "internal/codec/json_value.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/strings.hpp"
#include "internal/util/time.hpp"

namespace quire::backup {

namespace {

constexpr const char* kUpdatedAt = "updated_at";

std::optional<double> ParseNumber(const std::string& raw) {
  const std::string s = util::Trim(raw);
  if (s.empty()) return std::nullopt;
  errno      = 0;
  char* end  = nullptr;
  double val = std::strtod(s.c_str(), &end);
  if (end != s.c_str() + s.size() || errno == ERANGE) return std::nullopt;
  return val;
}

bool IsRefTypeColumn(std::string_view table, std::string_view column) {
  return (table == "comments" && column == "ref_type") || (table == "slug_trackers" && column == "type");
}

const model::Value* FindFirst(const model::Map& map, std::initializer_list<const char*> keys) {
  for (const char* key : keys) {
    auto it = map.find(key);
    if (it != map.end()) return &it->second;
  }
  return nullptr;
}

// count: {read|reads, like|likes} -> read_count / like_count
void MergeCount(const model::Value& value, model::Row& out, const ColumnMap& columns) {
  const auto* counts = value.As<model::Map>();
  if (counts == nullptr) return;

  if (columns.count("read_count") != 0) {
    if (const auto* read = FindFirst(*counts, {"read", "reads"})) {
      out["read_count"] = model::Normalize(*read);
    }
  }
  if (columns.count("like_count") != 0) {
    if (const auto* like = FindFirst(*counts, {"like", "likes"})) {
      out["like_count"] = model::Normalize(*like);
    }
  }
}

} // namespace

std::string NormalizeColumnName(std::string_view table, std::string_view field) {
  const std::string t     = util::ToLower(util::Trim(table));
  const std::string raw   = util::Trim(field);
  const std::string lower = util::ToLower(raw);
  if (lower.empty() || lower == "__v") {
    return {};
  }
  // options.id is auto-increment; a legacy object id cannot go there
  if (t == "options" && lower == "_id") {
    return {};
  }

  const std::string snake = util::CamelToSnake(raw);
  for (const auto& key : {lower, snake}) {
    if (auto mapped = LookupTableColumnAlias(t, key)) return *mapped;
  }
  for (const auto& key : {lower, snake}) {
    if (auto mapped = LookupGlobalColumnAlias(key)) return *mapped;
  }
  return snake.empty() ? lower : snake;
}

std::optional<model::TimePoint> CoerceTime(const model::Value& value) {
  switch (value.Kind()) {
    case model::ValueKind::Time:
      return *value.As<model::TimePoint>();
    case model::ValueKind::Int:
      return util::UnixNumberToTime(static_cast<double>(*value.As<int64_t>()));
    case model::ValueKind::Float:
      return util::UnixNumberToTime(*value.As<double>());
    case model::ValueKind::Text: {
      const auto& s = *value.As<std::string>();
      if (auto ts = util::ParseTimestamp(s)) return ts;
      if (auto n = ParseNumber(s)) return util::UnixNumberToTime(*n);
      return std::nullopt;
    }
    case model::ValueKind::Legacy:
      return CoerceTime(model::Normalize(value));
    default:
      return std::nullopt;
  }
}

bool IsZeroLikeTime(const model::Value& value) {
  switch (value.Kind()) {
    case model::ValueKind::Int:
      return *value.As<int64_t>() == 0;
    case model::ValueKind::Float:
      return *value.As<double>() == 0;
    case model::ValueKind::Text: {
      const std::string s = util::ToLower(util::Trim(*value.As<std::string>()));
      return s.empty() || s == "0" || s == "null" || s == "0000-00-00" || s == "0000-00-00 00:00:00";
    }
    case model::ValueKind::Time:
      return *value.As<model::TimePoint>() == model::TimePoint{};
    default:
      return false;
  }
}

std::optional<model::Value> NormalizeValue(std::string_view table, std::string_view column, const model::Value& raw,
                                           ColumnCategory category) {
  model::Value value = model::Normalize(raw);
  if (value.IsNull()) {
    return model::Value{};
  }

  if (category == ColumnCategory::TimeLike) {
    if (auto ts = CoerceTime(value)) {
      return model::Value{*ts};
    }
    if (util::ToLower(column) == kUpdatedAt || IsZeroLikeTime(value)) {
      return model::Value{};
    }
    return std::nullopt;
  }

  if (IsRefTypeColumn(table, column)) {
    if (const auto* s = value.As<std::string>()) {
      return model::Value{CanonicalRefType(*s)};
    }
  }

  const bool textual = category == ColumnCategory::JsonLike || category == ColumnCategory::TextLike;

  switch (value.Kind()) {
    case model::ValueKind::Map:
    case model::ValueKind::List:
      if (!textual) {
        return std::nullopt;
      }
      try {
        return model::Value{codec::ToJsonText(value)};
      } catch (const std::runtime_error& e) {
        QUIRE_LOG_WARN("dropping unencodable field",
                       {observability::StringField("table", table), observability::StringField("column", column),
                        observability::StringField("error", e.what())});
        return std::nullopt;
      }
    case model::ValueKind::Bytes:
      if (textual) {
        const auto& bytes = *value.As<model::Bytes>();
        return model::Value{std::string(bytes.begin(), bytes.end())};
      }
      return value;
    default:
      return value;
  }
}

std::optional<model::Row> NormalizeRow(std::string_view table, const model::Row& raw, const ColumnMap& columns) {
  if (raw.empty()) {
    return std::nullopt;
  }

  model::Row out;
  for (const auto& [field, value] : raw) {
    const std::string column = NormalizeColumnName(table, field);
    if (column.empty()) continue;

    if (column == "count") {
      MergeCount(value, out, columns);
      continue;
    }

    auto it = columns.find(column);
    if (it == columns.end()) continue;

    auto normalized = NormalizeValue(table, column, value, it->second);
    if (!normalized) continue;
    out[column] = std::move(*normalized);
  }

  // modification time is not carried across a restore
  if (auto it = out.find(kUpdatedAt); it != out.end()) {
    it->second = model::Value{};
  }

  if (out.empty()) {
    return std::nullopt;
  }
  return out;
}

} // namespace quire::backup
