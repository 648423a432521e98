#pragma once

#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace quire::backup {

// How restore coerces values headed for a column.
enum class ColumnCategory {
  TimeLike,
  JsonLike,
  TextLike,
  Opaque,
};

const char* ColumnCategoryName(ColumnCategory category);

/*
  Classify an engine type string by substring, case-insensitively:

    time, date, year              -> TimeLike
    json                          -> JsonLike
    char, text, clob, enum, set   -> TextLike
    anything else                 -> Opaque

  Checked in that order, so "datetime_text" is TimeLike.
*/
ColumnCategory ClassifyColumnType(std::string_view engine_type);

// trimmed, lower-cased column name -> category
using ColumnMap = std::unordered_map<std::string, ColumnCategory>;

ColumnMap BuildColumnMap(const std::vector<db::ColumnInfo>& columns);

// Introspects the live table inside `tx`.
// Throws util::SchemaIntrospectionError.
ColumnMap LoadColumns(db::Repository& repo, db::Transaction& tx, const std::string& table);

} // namespace quire::backup
