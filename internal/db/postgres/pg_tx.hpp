#pragma once

#include <memory>
#include <pqxx/pqxx>

#include "internal/db/api/transaction.hpp"
#include "pg_pool.hpp"

namespace quire::db::postgres {

/*
  pqxx::work on a pooled connection. The connection returns to the pool
  when this object is destroyed, after the work is committed or aborted.
*/
class PgTransaction final : public db::Transaction {
public:
  explicit PgTransaction(const std::shared_ptr<PgPool>& pool);
  ~PgTransaction() override;

  pqxx::work& Work() { return *work_; }

  void Commit() override;
  void Rollback() override;
  bool IsFinished() const override { return finished_; }

private:
  // declared first so it outlives work_
  std::shared_ptr<pqxx::connection> conn_;
  std::unique_ptr<pqxx::work> work_;
  bool finished_ = false;
};

} // namespace quire::db::postgres
