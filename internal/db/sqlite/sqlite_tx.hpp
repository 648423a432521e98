#pragma once

#include <memory>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace quire::db::sqlite {

/*
  BEGIN IMMEDIATE on construction, so the write lock is held before the
  first DELETE of a restore and a concurrent writer fails at Begin().
*/
class SqliteTransaction final : public db::Transaction {
public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction() override;

  SqliteDB& DB() const { return *db_; }

  void Commit() override;
  void Rollback() override;
  bool IsFinished() const override { return finished_; }

private:
  std::shared_ptr<SqliteDB> db_;
  bool finished_ = false;
};

} // namespace quire::db::sqlite
