#include "pg_tx.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace quire::db::postgres {

PgTransaction::PgTransaction(const std::shared_ptr<PgPool>& pool) : conn_(pool->Acquire()) {
  try {
    work_ = std::make_unique<pqxx::work>(*conn_, "quire");
  } catch (const pqxx::failure& e) {
    throw util::TransactionError(std::string("postgres begin: ") + e.what());
  }
}

PgTransaction::~PgTransaction() {
  if (finished_ || !work_) return;
  try {
    work_->abort();
  } catch (const pqxx::failure& e) {
    QUIRE_LOG_ERROR("postgres rollback in destructor failed", {observability::StringField("error", e.what())});
  }
}

void PgTransaction::Commit() {
  // pqxx::work cannot be retried after a failed commit
  finished_ = true;
  try {
    work_->commit();
  } catch (const pqxx::failure& e) {
    throw util::TransactionError(std::string("postgres commit: ") + e.what());
  }
}

void PgTransaction::Rollback() {
  finished_ = true;
  try {
    work_->abort();
  } catch (const pqxx::failure& e) {
    throw util::TransactionError(std::string("postgres rollback: ") + e.what());
  }
}

} // namespace quire::db::postgres
