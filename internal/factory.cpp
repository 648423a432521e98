#include "internal/factory.hpp"

#include <chrono>
#include <stdexcept>
#include <string>

#include "internal/db/sql/cms_schema.hpp"
#include "internal/db/sql/migrations.hpp"
#include "internal/util/errors.hpp"
#if QUIRE_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if QUIRE_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace quire::factory {

namespace {

// Runs schema statements through the repository inside one transaction.
class RepositoryMigrationExecutor final : public db::sql::MigrationExecutor {
 public:
  RepositoryMigrationExecutor(db::Repository& repo, db::Transaction& tx) : repo_(repo), tx_(tx) {
  }

  void Execute(const std::string& sql) override {
    auto r = repo_.Exec(tx_, sql);
    if (!r) {
      throw util::DatabaseError("schema statement failed: " + r.ToString());
    }
  }

 private:
  db::Repository&  repo_;
  db::Transaction& tx_;
};

db::sql::SqlDialect DialectOf(const db::Repository& repo) {
  const std::string name = repo.Dialect();
  if (name == "sqlite") return db::sql::SqlDialect::Sqlite;
  if (name == "postgres") return db::sql::SqlDialect::Postgres;
  throw std::runtime_error("no bundled schema for dialect " + name);
}

} // namespace

void BootstrapSchema(db::Repository& repo) {
  const auto statements = db::sql::RenderCmsSchema(DialectOf(repo));

  auto                        tx = repo.Begin();
  RepositoryMigrationExecutor executor(repo, *tx);
  db::sql::ApplySchema(executor, statements);
  tx->Commit();
}

std::shared_ptr<db::Repository> BuildRepository(const quire::runtime::config::RuntimeConfig& config) {
  std::shared_ptr<db::Repository> repo;

  const auto& database = config.database();
  if (database.has_sqlite()) {
#if QUIRE_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path());
    repo           = std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  } else if (database.has_postgres()) {
#if QUIRE_DB_POSTGRES
    const auto&                 pg = database.postgres();
    db::postgres::PgPoolOptions options;
    options.conninfo          = pg.connection_uri();
    options.max_connections   = pg.max_connections();
    options.statement_timeout = std::chrono::milliseconds(pg.statement_timeout_ms());
    options.acquire_timeout   = std::chrono::milliseconds(pg.acquire_timeout_ms());
    repo = std::make_shared<db::postgres::PgRepository>(std::make_shared<db::postgres::PgPool>(std::move(options)));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  } else {
    throw std::runtime_error("no database backend configured");
  }

  BootstrapSchema(*repo);
  return repo;
}

} // namespace quire::factory
