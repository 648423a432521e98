#include "pg_repository.hpp"

#include <cstddef>

#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"
#include "internal/util/time.hpp"

namespace quire::db::postgres {

namespace {

// pg_type oids
constexpr pqxx::oid kBoolOid        = 16;
constexpr pqxx::oid kByteaOid       = 17;
constexpr pqxx::oid kInt8Oid        = 20;
constexpr pqxx::oid kInt2Oid        = 21;
constexpr pqxx::oid kInt4Oid        = 23;
constexpr pqxx::oid kFloat4Oid      = 700;
constexpr pqxx::oid kFloat8Oid      = 701;
constexpr pqxx::oid kTimestampOid   = 1114;
constexpr pqxx::oid kTimestamptzOid = 1184;

Result AppendParam(pqxx::params& params, const model::Value& v) {
  switch (v.Kind()) {
    case model::ValueKind::Null:
      params.append();
      return Result::Ok();
    case model::ValueKind::Bool:
      params.append(*v.As<bool>());
      return Result::Ok();
    case model::ValueKind::Int:
      params.append(*v.As<int64_t>());
      return Result::Ok();
    case model::ValueKind::Float:
      params.append(*v.As<double>());
      return Result::Ok();
    case model::ValueKind::Text:
      params.append(*v.As<std::string>());
      return Result::Ok();
    case model::ValueKind::Bytes: {
      const auto&                  bytes = *v.As<model::Bytes>();
      std::basic_string<std::byte> binary(reinterpret_cast<const std::byte*>(bytes.data()), bytes.size());
      params.append(binary);
      return Result::Ok();
    }
    case model::ValueKind::Time:
      params.append(util::FormatSqlTimestamp(*v.As<model::TimePoint>()));
      return Result::Ok();
    case model::ValueKind::List:
    case model::ValueKind::Map:
    case model::ValueKind::Legacy:
      break;
  }
  return Result::Err(ErrorCode::Unsupported, std::string("cannot bind ") + model::KindName(v.Kind()) + " value");
}

model::Value FieldValue(const pqxx::field& field, pqxx::oid type) {
  if (field.is_null()) return model::Value{};

  switch (type) {
    case kBoolOid:
      return model::Value{field.as<bool>()};
    case kInt2Oid:
    case kInt4Oid:
    case kInt8Oid:
      return model::Value{field.as<int64_t>()};
    case kFloat4Oid:
    case kFloat8Oid:
      return model::Value{field.as<double>()};
    case kByteaOid: {
      const auto binary = field.as<std::basic_string<std::byte>>();
      const auto* data  = reinterpret_cast<const std::uint8_t*>(binary.data());
      return model::Value{model::Bytes(data, data + binary.size())};
    }
    case kTimestampOid:
    case kTimestamptzOid: {
      // session is UTC; timestamptz text carries a "+00" suffix
      std::string text = field.c_str();
      if (const auto plus = text.rfind('+'); plus != std::string::npos && plus > 10) {
        text.resize(plus);
      }
      if (auto tp = util::ParseTimestamp(text)) return model::Value{*tp};
      return model::Value{std::string(field.c_str())};
    }
    default:
      return model::Value{std::string(field.c_str())};
  }
}

std::vector<model::Row> ToRows(const pqxx::result& res) {
  std::vector<model::Row> rows;
  rows.reserve(res.size());
  for (const auto& r : res) {
    model::Row row;
    for (pqxx::row::size_type i = 0; i < r.size(); ++i) {
      row.emplace(res.column_name(i), FieldValue(r[i], res.column_type(i)));
    }
    rows.push_back(std::move(row));
  }
  return rows;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::IntegrityViolation, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  if (dynamic_cast<const pqxx::undefined_table*>(&e)) {
    return Result::Err(ErrorCode::NotFound, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

Result PgRepository::SetForeignKeyChecks(Transaction& t, bool enabled) {
  return Exec(t, enabled ? "SET CONSTRAINTS ALL IMMEDIATE" : "SET CONSTRAINTS ALL DEFERRED");
}

Result PgRepository::Exec(Transaction& t, const std::string& sql) {
  try {
    TX(t).Work().exec(sql);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<ColumnInfo> PgRepository::ListColumns(Transaction& t, const std::string& table) {
  pqxx::result res;
  try {
    res = TX(t).Work().exec_params(
        "SELECT column_name, data_type FROM information_schema.columns "
        "WHERE table_schema = current_schema() AND table_name = $1 ORDER BY ordinal_position;",
        table);
  } catch (const std::exception& e) {
    throw util::SchemaIntrospectionError("columns of " + table + ": " + e.what());
  }

  std::vector<ColumnInfo> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ColumnInfo{row[0].c_str(), row[1].c_str()});
  }
  if (out.empty()) {
    throw util::SchemaIntrospectionError("table " + table + " has no columns");
  }
  return out;
}

std::vector<model::Row> PgRepository::SelectAll(const std::string& table) {
  try {
    auto               conn = pool_->Acquire();
    pqxx::read_transaction tx(*conn);
    return ToRows(tx.exec("SELECT * FROM " + util::QuoteIdentifier(table)));
  } catch (const pqxx::failure& e) {
    throw util::DatabaseError("select " + table + ": " + e.what());
  }
}

std::vector<model::Row> PgRepository::SelectAll(Transaction& t, const std::string& table) {
  try {
    return ToRows(TX(t).Work().exec("SELECT * FROM " + util::QuoteIdentifier(table)));
  } catch (const pqxx::failure& e) {
    throw util::DatabaseError("select " + table + ": " + e.what());
  }
}

Result PgRepository::DeleteAll(Transaction& t, const std::string& table) {
  return Exec(t, "DELETE FROM " + util::QuoteIdentifier(table));
}

Result PgRepository::DeleteWhere(Transaction& t, const std::string& table, const std::string& column,
                                 const model::Value& value) {
  pqxx::params params;
  if (auto bound = AppendParam(params, value); !bound) return bound;

  try {
    TX(t).Work().exec_params(
        "DELETE FROM " + util::QuoteIdentifier(table) + " WHERE " + util::QuoteIdentifier(column) + " = $1", params);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::Insert(Transaction& t, const std::string& table, const model::Row& row) {
  std::string  columns;
  std::string  placeholders;
  pqxx::params params;
  int          idx = 1;
  for (const auto& [name, value] : row) {
    if (auto bound = AppendParam(params, value); !bound) {
      bound.message = name + ": " + bound.message;
      return bound;
    }
    if (!columns.empty()) {
      columns += ',';
      placeholders += ',';
    }
    columns += util::QuoteIdentifier(name);
    placeholders += "$" + std::to_string(idx++);
  }

  const std::string sql = row.empty()
                              ? "INSERT INTO " + util::QuoteIdentifier(table) + " DEFAULT VALUES"
                              : "INSERT INTO " + util::QuoteIdentifier(table) + "(" + columns + ") VALUES(" + placeholders + ")";

  try {
    pqxx::subtransaction savepoint(TX(t).Work(), "insert_row");
    savepoint.exec_params(sql, params);
    savepoint.commit();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

} // namespace quire::db::postgres
