#include "internal/db/sql/migrations.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/strings.hpp"

namespace quire::db::sql {

std::size_t ApplySchema(MigrationExecutor& executor, const std::vector<std::string>& statements) {
  std::size_t applied = 0;
  for (const auto& statement : statements) {
    if (util::Trim(statement).empty()) continue;
    executor.Execute(statement);
    ++applied;
  }
  QUIRE_LOG_DEBUG("schema applied", {observability::IntField("statements", static_cast<int64_t>(applied))});
  return applied;
}

} // namespace quire::db::sql
