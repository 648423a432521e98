#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"

namespace quire::factory {

/*
  Composition root: the only place that knows concrete backend types.

  The returned repository has the bundled CMS schema applied
  (idempotent), so export and restore can run against a fresh database.
  Throws std::runtime_error when no backend is configured or the
  configured one was not compiled in.
*/
std::shared_ptr<db::Repository> BuildRepository(const quire::runtime::config::RuntimeConfig& config);

// Applies the bundled CMS schema in one transaction, using the
// repository's dialect. Throws util::DatabaseError on a failing statement.
void BootstrapSchema(db::Repository& repo);

} // namespace quire::factory
