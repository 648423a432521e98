#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace quire::db::sqlite {

/*
  Repository over one SqliteDB connection.

  Statements are prepared per call. Constraint failures map to
  ConstraintViolation (UNIQUE, PRIMARY KEY) or IntegrityViolation
  (NOT NULL, CHECK, FOREIGN KEY) through the extended result code.
*/
class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  std::string Dialect() const override { return "sqlite"; }
  bool SupportsDeferredForeignKeys() const override { return true; }
  Result SetForeignKeyChecks(Transaction&, bool enabled) override;
  Result Exec(Transaction&, const std::string& sql) override;

  std::vector<ColumnInfo> ListColumns(Transaction&, const std::string& table) override;

  std::vector<model::Row> SelectAll(const std::string& table) override;
  std::vector<model::Row> SelectAll(Transaction&, const std::string& table) override;
  Result DeleteAll(Transaction&, const std::string& table) override;
  Result DeleteWhere(Transaction&, const std::string& table, const std::string& column,
                     const model::Value& value) override;
  Result Insert(Transaction&, const std::string& table, const model::Row& row) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(SqliteDB& db, int rc);
  static std::vector<model::Row> Select(SqliteDB& db, const std::string& table);
};

} // namespace quire::db::sqlite
