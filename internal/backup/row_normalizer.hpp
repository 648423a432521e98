#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "internal/backup/column_metadata.hpp"
#include "internal/db/model/value.hpp"

namespace quire::backup {

namespace model = db::model;

/*
  Restore-side row normalization.

  Decoded archive rows carry whatever field names and value shapes the
  exporting version produced. NormalizeRow() maps them onto the live
  columns of the target table and coerces each value by the column's
  category. Fields that cannot be placed are dropped, never fatal.
*/

// Canonical column for a raw field name; empty means drop the field.
// Lookup order: per-table alias, global alias (each tried with the
// lower-cased then the snake_cased name), then snake_case, then lower-case.
std::string NormalizeColumnName(std::string_view table, std::string_view field);

// Time-like coercion: Time as-is, epoch numbers, and the accepted
// timestamp layouts (falling back to an epoch number inside a string).
std::optional<model::TimePoint> CoerceTime(const model::Value& value);

// 0, "", "0", "null", "0000-00-00", "0000-00-00 00:00:00", the zero TimePoint.
bool IsZeroLikeTime(const model::Value& value);

// std::nullopt drops the field; a Null value is kept as SQL NULL.
std::optional<model::Value> NormalizeValue(std::string_view table, std::string_view column, const model::Value& raw,
                                           ColumnCategory category);

// std::nullopt when the row is empty before or after normalization.
std::optional<model::Row> NormalizeRow(std::string_view table, const model::Row& raw, const ColumnMap& columns);

} // namespace quire::backup
