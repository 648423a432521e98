#include "internal/backup/column_metadata.hpp"

#include <initializer_list>

#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"

namespace quire::backup {

namespace {

bool ContainsAny(const std::string& haystack, std::initializer_list<const char*> needles) {
  for (const char* needle : needles) {
    if (haystack.find(needle) != std::string::npos) return true;
  }
  return false;
}

} // namespace

const char* ColumnCategoryName(ColumnCategory category) {
  switch (category) {
    case ColumnCategory::TimeLike:
      return "time";
    case ColumnCategory::JsonLike:
      return "json";
    case ColumnCategory::TextLike:
      return "text";
    case ColumnCategory::Opaque:
      return "opaque";
  }
  return "unknown";
}

ColumnCategory ClassifyColumnType(std::string_view engine_type) {
  const std::string t = util::ToLower(engine_type);
  if (ContainsAny(t, {"time", "date", "year"})) return ColumnCategory::TimeLike;
  if (ContainsAny(t, {"json"})) return ColumnCategory::JsonLike;
  if (ContainsAny(t, {"char", "text", "clob", "enum", "set"})) return ColumnCategory::TextLike;
  return ColumnCategory::Opaque;
}

ColumnMap BuildColumnMap(const std::vector<db::ColumnInfo>& columns) {
  ColumnMap out;
  out.reserve(columns.size());
  for (const auto& column : columns) {
    out.emplace(util::ToLower(util::Trim(column.name)), ClassifyColumnType(column.type));
  }
  return out;
}

ColumnMap LoadColumns(db::Repository& repo, db::Transaction& tx, const std::string& table) {
  const auto columns = repo.ListColumns(tx, table);
  if (columns.empty()) {
    throw util::SchemaIntrospectionError("no columns reported for table " + table);
  }
  return BuildColumnMap(columns);
}

} // namespace quire::backup
