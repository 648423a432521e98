#pragma once

#include <string>
#include <vector>

namespace quire::db::sql {

/*
  Bundled DDL for the CMS datastore.

  One spec per canonical table; RenderCmsSchema() turns the specs into
  idempotent CREATE TABLE statements for the requested dialect. The
  result is fed to ApplySchema() at bootstrap.
*/

enum class SqlDialect { Sqlite, Postgres };

enum class ColumnType {
  Id,        // uuid text primary key
  Serial,    // auto-increment integer primary key
  String,    // short text
  LongText,
  Json,
  Integer,
  Boolean,
  Timestamp,
  Blob,
};

enum ColumnFlags : unsigned {
  kNone    = 0,
  kNotNull = 1u << 0,
  kUnique  = 1u << 1,
};

struct ColumnSpec {
  std::string name;
  ColumnType  type;
  unsigned    flags = kNone;
  std::string default_sql;   // literal, valid in both dialects
  std::string references;    // "table(column)"
};

struct TableSpec {
  std::string              name;
  std::vector<ColumnSpec>  columns;
  std::vector<std::string> unique_together;
};

const std::vector<TableSpec>& CmsTables();

std::vector<std::string> RenderCmsSchema(SqlDialect dialect);

std::string RenderCreateTable(const TableSpec& table, SqlDialect dialect);

} // namespace quire::db::sql
