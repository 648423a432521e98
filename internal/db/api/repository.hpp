#pragma once

#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/value.hpp"

namespace quire::db {

// Live column definition as reported by the target engine.
struct ColumnInfo {
  std::string name;
  std::string type; // raw engine type string, e.g. "TIMESTAMP", "varchar(255)"
};

/*
  Repository abstraction over a relational CMS datastore.

  Rows are generic column->value maps; table and column names are
  quoted by the backend, so callers pass them unquoted.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - Insert() reports a unique/primary-key collision as
    ErrorCode::ConstraintViolation and nothing else as such
  - Read failures throw util::DatabaseError
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  // Throws util::TransactionError when BEGIN fails.
  virtual std::unique_ptr<Transaction> Begin() = 0;

  // "sqlite", "postgres"
  virtual std::string Dialect() const = 0;

  // True when foreign-key enforcement can be suspended inside a transaction.
  virtual bool SupportsDeferredForeignKeys() const = 0;

  // enabled=false suspends enforcement until re-enabled or commit.
  virtual Result SetForeignKeyChecks(Transaction&, bool enabled) = 0;

  virtual Result Exec(Transaction&, const std::string& sql) = 0;

  // ---------------------------------------------------------------------
  // Introspection
  // ---------------------------------------------------------------------

  // Throws util::SchemaIntrospectionError when the table has no columns.
  virtual std::vector<ColumnInfo> ListColumns(Transaction&, const std::string& table) = 0;

  // ---------------------------------------------------------------------
  // Rows
  // ---------------------------------------------------------------------

  // Outside any transaction; used by export.
  virtual std::vector<model::Row> SelectAll(const std::string& table) = 0;

  virtual std::vector<model::Row> SelectAll(Transaction&, const std::string& table) = 0;

  virtual Result DeleteAll(Transaction&, const std::string& table) = 0;

  virtual Result DeleteWhere(Transaction&, const std::string& table, const std::string& column,
                             const model::Value& value) = 0;

  // Row values must be normalized: Null, Bool, Int, Float, Text, Bytes or Time.
  virtual Result Insert(Transaction&, const std::string& table, const model::Row& row) = 0;
};

} // namespace quire::db
