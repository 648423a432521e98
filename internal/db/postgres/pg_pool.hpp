#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>
#include <vector>

namespace quire::db::postgres {

struct PgPoolOptions {
  std::string               conninfo;
  std::size_t               max_connections = 4;
  std::chrono::milliseconds statement_timeout{0}; // 0: server default
  std::chrono::milliseconds acquire_timeout{0};   // 0: wait forever
};

/*
  Bounded set of libpqxx connections shared by PgRepository.

  A transaction holds one connection for its whole life; a restore
  therefore pins a single connection until commit or rollback.
  Connections are not thread-safe and are never shared between
  holders. Every session runs in UTC with the configured
  statement_timeout.
*/
class PgPool : public std::enable_shared_from_this<PgPool> {
 public:
  explicit PgPool(PgPoolOptions options);

  // Blocks while the pool is exhausted. Throws util::DatabaseError on
  // connect failure or when acquire_timeout elapses.
  std::shared_ptr<pqxx::connection> Acquire();

 private:
  void                              ConfigureSession(pqxx::connection& conn) const;
  std::unique_ptr<pqxx::connection> Connect();
  std::shared_ptr<pqxx::connection> Wrap(std::unique_ptr<pqxx::connection> conn);
  void                              Release(pqxx::connection* conn);

  PgPoolOptions options_;

  std::mutex                                     mutex_;
  std::condition_variable                        cv_;
  std::vector<std::unique_ptr<pqxx::connection>> idle_;
  std::size_t                                    live_connections_ = 0;
};

} // namespace quire::db::postgres
