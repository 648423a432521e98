#pragma once

#include <sqlite3.h>

#include <string>

namespace quire::db::sqlite {

// Owns one prepared statement; finalized on destruction.
class Statement {
 public:
  Statement() = default;
  ~Statement();

  Statement(Statement&& other) noexcept;
  Statement& operator=(Statement&& other) noexcept;

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  sqlite3_stmt* get() const {
    return st_;
  }

  sqlite3_stmt** out() {
    Reset();
    return &st_;
  }

 private:
  void Reset();

  sqlite3_stmt* st_ = nullptr;
};

/*
  One sqlite3* connection, opened read-write (created if missing).

  ":memory:" is accepted; the database then lives as long as this
  object, which is how the integration tests run. Transactions and the
  repository share this single connection.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  bool InMemory() const {
    return path_ == ":memory:" || path_.empty();
  }

  std::string LastError() const;

  // DDL, pragmas, BEGIN/COMMIT. Throws util::DatabaseError.
  void Exec(const std::string& sql);

  // Returns the sqlite result code; `out` is left empty on failure.
  int Prepare(const std::string& sql, Statement& out);

 private:
  void Configure();

  sqlite3*    db_ = nullptr;
  std::string path_;
};

} // namespace quire::db::sqlite
