#include "sqlite_db.hpp"

#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace quire::db::sqlite {

namespace {

constexpr int kBusyTimeoutMs = 5000;

void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    throw util::DatabaseError(std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

} // namespace

Statement::~Statement() {
  Reset();
}

Statement::Statement(Statement&& other) noexcept : st_(std::exchange(other.st_, nullptr)) {
}

Statement& Statement::operator=(Statement&& other) noexcept {
  if (this != &other) {
    Reset();
    st_ = std::exchange(other.st_, nullptr);
  }
  return *this;
}

void Statement::Reset() {
  if (st_) sqlite3_finalize(st_);
  st_ = nullptr;
}

SqliteDB::SqliteDB(std::string path) : path_(std::move(path)) {
  const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
  const int rc    = sqlite3_open_v2(path_.c_str(), &db_, flags, nullptr);
  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
    sqlite3_close(db_);
    db_ = nullptr;
    throw util::DatabaseError("sqlite open " + path_ + ": " + msg);
  }

  try {
    Configure();
  } catch (const util::DatabaseError&) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }

  QUIRE_LOG_DEBUG("sqlite database opened", {observability::StringField("path", path_)});
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

std::string SqliteDB::LastError() const {
  return sqlite3_errmsg(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : sqlite3_errstr(rc);
    sqlite3_free(err);
    throw util::DatabaseError(msg);
  }
}

int SqliteDB::Prepare(const std::string& sql, Statement& out) {
  return sqlite3_prepare_v2(db_, sql.c_str(), -1, out.out(), nullptr);
}

void SqliteDB::Configure() {
  // UNIQUE vs NOT NULL violations are told apart by extended codes
  ThrowIf(sqlite3_extended_result_codes(db_, 1), db_, "extended_result_codes");
  ThrowIf(sqlite3_busy_timeout(db_, kBusyTimeoutMs), db_, "busy_timeout");

  if (!InMemory()) {
    Exec("PRAGMA journal_mode=WAL;");
    Exec("PRAGMA synchronous=NORMAL;");
  }

  // off by default in sqlite; restores defer them per transaction
  Exec("PRAGMA foreign_keys=ON;");
}

} // namespace quire::db::sqlite
