#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "internal/backup/option_store.hpp"
#include "internal/db/model/value.hpp"

namespace quire::backup {

/*
  Folds standalone legacy option rows ("MailOptions", "seo", ...) into
  the unified `configs` blob.

  Each matching row replaces its whole section; rows are visited in
  lexicographic name order, so the last name wins when two rows map to
  the same section. Nothing is written when no row matches.

  Returns the migrated section names in the order they were applied.
  Throws util::DatabaseError / util::RestoreError from the store.
*/
std::vector<std::string> MigrateLegacyOptions(OptionStore& options);

// JSON, then integer, then float, then boolean, else the trimmed text.
// Blank input yields "".
db::model::Value ParseLegacyOptionValue(std::string_view raw);

// Recursively snake_cases object keys; keys that normalize to "" are dropped.
db::model::Value NormalizeLegacyOptionValue(const db::model::Value& value);

} // namespace quire::backup
