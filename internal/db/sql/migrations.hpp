#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace quire::db::sql {

// Sink for schema DDL, bound to one open transaction.
class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  // Throws on failure.
  virtual void Execute(const std::string& statement) = 0;
};

/*
  Applies `statements` in order and returns how many ran. Blank entries
  are skipped. Every statement must be idempotent (CREATE ... IF NOT
  EXISTS) since bootstrap runs on each BuildRepository().
*/
std::size_t ApplySchema(MigrationExecutor& executor, const std::vector<std::string>& statements);

} // namespace quire::db::sql
