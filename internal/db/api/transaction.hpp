#pragma once

namespace quire::db {

/*
  One unit of work on a Repository backend.

  A restore deletes and re-inserts every table it touches inside a
  single Transaction, so backends must honor:

  - nothing is visible to other connections before Commit()
  - Rollback() undoes DELETEs as well as INSERTs
  - the destructor rolls back when neither Commit() nor Rollback() ran

  SQLite uses BEGIN IMMEDIATE, Postgres a pqxx::work.
  Commit() and Rollback() throw util::TransactionError.
*/
class Transaction {
public:
  virtual ~Transaction() = default;

  virtual void Commit() = 0;
  virtual void Rollback() = 0;

  // true once Commit() or Rollback() has run
  virtual bool IsFinished() const = 0;
};

} // namespace quire::db
