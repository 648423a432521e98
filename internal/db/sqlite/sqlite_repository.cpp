#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"
#include "internal/util/time.hpp"

namespace quire::db::sqlite {

using quire::db::ErrorCode;
using quire::db::Result;

namespace {

int BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  return sqlite3_bind_text(st, idx, s.c_str(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

Result BindValue(SqliteDB& db, sqlite3_stmt* st, int idx, const model::Value& v) {
  int rc = SQLITE_OK;
  switch (v.Kind()) {
    case model::ValueKind::Null:
      rc = sqlite3_bind_null(st, idx);
      break;
    case model::ValueKind::Bool:
      rc = sqlite3_bind_int(st, idx, *v.As<bool>() ? 1 : 0);
      break;
    case model::ValueKind::Int:
      rc = sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(*v.As<int64_t>()));
      break;
    case model::ValueKind::Float:
      rc = sqlite3_bind_double(st, idx, *v.As<double>());
      break;
    case model::ValueKind::Text:
      rc = BindText(st, idx, *v.As<std::string>());
      break;
    case model::ValueKind::Bytes: {
      const auto& bytes = *v.As<model::Bytes>();
      rc = sqlite3_bind_blob(st, idx, bytes.data(), static_cast<int>(bytes.size()), SQLITE_TRANSIENT);
      break;
    }
    case model::ValueKind::Time:
      rc = BindText(st, idx, util::FormatSqlTimestamp(*v.As<model::TimePoint>()));
      break;
    case model::ValueKind::List:
    case model::ValueKind::Map:
    case model::ValueKind::Legacy:
      return Result::Err(ErrorCode::Unsupported,
                         std::string("cannot bind ") + model::KindName(v.Kind()) + " value at parameter " + std::to_string(idx));
  }
  if (rc != SQLITE_OK) return Result::Err(ErrorCode::InternalError, db.LastError());
  return Result::Ok();
}

model::Value ColumnValue(sqlite3_stmt* st, int col) {
  switch (sqlite3_column_type(st, col)) {
    case SQLITE_INTEGER:
      return model::Value{static_cast<int64_t>(sqlite3_column_int64(st, col))};
    case SQLITE_FLOAT:
      return model::Value{sqlite3_column_double(st, col)};
    case SQLITE_TEXT: {
      const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(st, col));
      const int   size = sqlite3_column_bytes(st, col);
      return model::Value{std::string(text ? text : "", static_cast<std::size_t>(size))};
    }
    case SQLITE_BLOB: {
      const auto* data = static_cast<const std::uint8_t*>(sqlite3_column_blob(st, col));
      const int   size = sqlite3_column_bytes(st, col);
      return model::Value{model::Bytes(data, data + size)};
    }
    default:
      return model::Value{};
  }
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(SqliteDB& db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
    return Result::Ok();

  const int extended = sqlite3_extended_errcode(db.Handle());
  switch (rc & 0xFF) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, db.LastError());
    case SQLITE_CONSTRAINT:
      if (extended == SQLITE_CONSTRAINT_UNIQUE || extended == SQLITE_CONSTRAINT_PRIMARYKEY)
        return Result::Err(ErrorCode::ConstraintViolation, db.LastError());
      return Result::Err(ErrorCode::IntegrityViolation, db.LastError());
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, db.LastError());
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, db.LastError());
    default:
      return Result::Err(ErrorCode::InternalError, db.LastError());
  }
}

// ------------------------------------------------------------------
// Session
// ------------------------------------------------------------------

Result SqliteRepository::SetForeignKeyChecks(Transaction& t, bool enabled) {
  // Deferred violations are still checked at COMMIT.
  return Exec(t, enabled ? "PRAGMA defer_foreign_keys=OFF;" : "PRAGMA defer_foreign_keys=ON;");
}

Result SqliteRepository::Exec(Transaction& t, const std::string& sql) {
  auto& db = TX(t).DB();
  return Translate(db, sqlite3_exec(db.Handle(), sql.c_str(), nullptr, nullptr, nullptr));
}

// ------------------------------------------------------------------
// Introspection
// ------------------------------------------------------------------

std::vector<ColumnInfo> SqliteRepository::ListColumns(Transaction& t, const std::string& table) {
  auto& db = TX(t).DB();

  Statement stmt;
  if (db.Prepare("PRAGMA table_info(" + util::QuoteIdentifier(table) + ");", stmt) != SQLITE_OK)
    throw util::SchemaIntrospectionError("table_info " + table + ": " + db.LastError());

  std::vector<ColumnInfo> out;
  int rc = SQLITE_OK;
  while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
    // cid, name, type, notnull, dflt_value, pk
    const auto* name = reinterpret_cast<const char*>(sqlite3_column_text(stmt.get(), 1));
    const auto* type = reinterpret_cast<const char*>(sqlite3_column_text(stmt.get(), 2));
    out.push_back(ColumnInfo{name ? name : "", type ? type : ""});
  }
  if (rc != SQLITE_DONE)
    throw util::SchemaIntrospectionError("table_info " + table + ": " + db.LastError());

  if (out.empty())
    throw util::SchemaIntrospectionError("table " + table + " has no columns");

  return out;
}

// ------------------------------------------------------------------
// Rows
// ------------------------------------------------------------------

std::vector<model::Row> SqliteRepository::Select(SqliteDB& db, const std::string& table) {
  Statement stmt;
  if (db.Prepare("SELECT * FROM " + util::QuoteIdentifier(table) + ";", stmt) != SQLITE_OK)
    throw util::DatabaseError("select " + table + ": " + db.LastError());

  const int columns = sqlite3_column_count(stmt.get());

  std::vector<model::Row> out;
  int rc = SQLITE_OK;
  while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
    model::Row row;
    for (int i = 0; i < columns; ++i) {
      row.emplace(sqlite3_column_name(stmt.get(), i), ColumnValue(stmt.get(), i));
    }
    out.push_back(std::move(row));
  }
  if (rc != SQLITE_DONE)
    throw util::DatabaseError("select " + table + ": " + db.LastError());

  return out;
}

std::vector<model::Row> SqliteRepository::SelectAll(const std::string& table) {
  return Select(*db_, table);
}

std::vector<model::Row> SqliteRepository::SelectAll(Transaction& t, const std::string& table) {
  return Select(TX(t).DB(), table);
}

Result SqliteRepository::DeleteAll(Transaction& t, const std::string& table) {
  return Exec(t, "DELETE FROM " + util::QuoteIdentifier(table) + ";");
}

Result SqliteRepository::DeleteWhere(Transaction& t, const std::string& table, const std::string& column,
                                     const model::Value& value) {
  auto& db = TX(t).DB();

  const std::string sql =
      "DELETE FROM " + util::QuoteIdentifier(table) + " WHERE " + util::QuoteIdentifier(column) + "=?;";

  Statement stmt;
  if (int rc = db.Prepare(sql, stmt); rc != SQLITE_OK) return Translate(db, rc);

  if (auto bound = BindValue(db, stmt.get(), 1, value); !bound) return bound;

  return Translate(db, sqlite3_step(stmt.get()));
}

Result SqliteRepository::Insert(Transaction& t, const std::string& table, const model::Row& row) {
  auto& db = TX(t).DB();

  std::string sql = "INSERT INTO " + util::QuoteIdentifier(table);
  if (row.empty()) {
    sql += " DEFAULT VALUES;";
  } else {
    std::string columns;
    std::string params;
    for (const auto& [name, value] : row) {
      if (!columns.empty()) {
        columns += ',';
        params += ',';
      }
      columns += util::QuoteIdentifier(name);
      params += '?';
    }
    sql += "(" + columns + ") VALUES(" + params + ");";
  }

  // an unknown column fails here, not at step
  Statement stmt;
  if (int rc = db.Prepare(sql, stmt); rc != SQLITE_OK) return Translate(db, rc);

  int idx = 1;
  for (const auto& [name, value] : row) {
    if (auto bound = BindValue(db, stmt.get(), idx++, value); !bound) {
      bound.message = name + ": " + bound.message;
      return bound;
    }
  }

  return Translate(db, sqlite3_step(stmt.get()));
}

} // namespace quire::db::sqlite
