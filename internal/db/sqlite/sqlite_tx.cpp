#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace quire::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
  try {
    db_->Exec("BEGIN IMMEDIATE;");
  } catch (const util::DatabaseError& e) {
    throw util::TransactionError(std::string("sqlite begin: ") + e.what());
  }
}

SqliteTransaction::~SqliteTransaction() {
  if (finished_) return;
  try {
    db_->Exec("ROLLBACK;");
  } catch (const util::DatabaseError& e) {
    QUIRE_LOG_ERROR("sqlite rollback in destructor failed", {observability::StringField("error", e.what())});
  }
}

void SqliteTransaction::Commit() {
  try {
    db_->Exec("COMMIT;");
  } catch (const util::DatabaseError& e) {
    throw util::TransactionError(std::string("sqlite commit: ") + e.what());
  }
  finished_ = true;
}

void SqliteTransaction::Rollback() {
  finished_ = true;
  try {
    db_->Exec("ROLLBACK;");
  } catch (const util::DatabaseError& e) {
    throw util::TransactionError(std::string("sqlite rollback: ") + e.what());
  }
}

} // namespace quire::db::sqlite
