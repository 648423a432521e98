#include "pg_pool.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace quire::db::postgres {

PgPool::PgPool(PgPoolOptions options) : options_(std::move(options)) {
  if (options_.max_connections == 0) options_.max_connections = 1;
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  const auto deadline = std::chrono::steady_clock::now() + options_.acquire_timeout;
  const auto ready    = [this] { return !idle_.empty() || live_connections_ < options_.max_connections; };

  std::unique_lock lock(mutex_);
  for (;;) {
    while (!idle_.empty()) {
      auto conn = std::move(idle_.back());
      idle_.pop_back();
      if (conn->is_open()) {
        return Wrap(std::move(conn));
      }
      // dropped by the server
      --live_connections_;
    }

    if (live_connections_ < options_.max_connections) {
      ++live_connections_;
      lock.unlock();
      try {
        return Wrap(Connect());
      } catch (const util::DatabaseError&) {
        lock.lock();
        --live_connections_;
        cv_.notify_one();
        throw;
      }
    }

    if (options_.acquire_timeout.count() == 0) {
      cv_.wait(lock, ready);
    } else if (!cv_.wait_until(lock, deadline, ready)) {
      throw util::DatabaseError("postgres pool: no connection available within " +
                                std::to_string(options_.acquire_timeout.count()) + "ms");
    }
  }
}

std::unique_ptr<pqxx::connection> PgPool::Connect() {
  try {
    auto conn = std::make_unique<pqxx::connection>(options_.conninfo);
    ConfigureSession(*conn);
    QUIRE_LOG_DEBUG("postgres connection opened", {observability::StringField("db", conn->dbname())});
    return conn;
  } catch (const std::exception& e) {
    throw util::DatabaseError(std::string("postgres connect: ") + e.what());
  }
}

void PgPool::ConfigureSession(pqxx::connection& conn) const {
  pqxx::nontransaction tx(conn);
  tx.exec0("SET TIME ZONE 'UTC'");
  if (options_.statement_timeout.count() > 0) {
    tx.exec0("SET statement_timeout = " + std::to_string(options_.statement_timeout.count()));
  }
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(std::unique_ptr<pqxx::connection> conn) {
  std::weak_ptr<PgPool> weak_self = weak_from_this();
  return std::shared_ptr<pqxx::connection>(conn.release(), [weak_self](pqxx::connection* released) {
    if (auto self = weak_self.lock()) {
      self->Release(released);
      return;
    }
    delete released;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace quire::db::postgres
