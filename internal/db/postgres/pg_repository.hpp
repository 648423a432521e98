#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace quire::db::postgres {

/*
  PostgreSQL repository.

  Every Insert() runs inside a savepoint (pqxx::subtransaction) so a
  unique_violation on one row leaves the outer transaction usable.
  Only DEFERRABLE foreign keys are affected by SetForeignKeyChecks().
*/
class PgRepository final : public db::Repository {
 public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

  std::unique_ptr<Transaction> Begin() override;

  std::string Dialect() const override {
    return "postgres";
  }
  bool SupportsDeferredForeignKeys() const override {
    return true;
  }
  Result SetForeignKeyChecks(Transaction&, bool enabled) override;
  Result Exec(Transaction&, const std::string& sql) override;

  std::vector<ColumnInfo> ListColumns(Transaction&, const std::string& table) override;

  std::vector<model::Row> SelectAll(const std::string& table) override;
  std::vector<model::Row> SelectAll(Transaction&, const std::string& table) override;
  Result                  DeleteAll(Transaction&, const std::string& table) override;
  Result                  DeleteWhere(Transaction&, const std::string& table, const std::string& column,
                                      const model::Value& value) override;
  Result                  Insert(Transaction&, const std::string& table, const model::Row& row) override;

 private:
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result         Translate(const std::exception& e);
};

} // namespace quire::db::postgres
