#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace quire::backup {

struct OptionRecord {
  std::string name;
  std::string value;
};

/*
  Key -> string view over the `options` table, bound to one transaction.

  Reads throw util::DatabaseError; writes throw util::RestoreError.
*/
class OptionStore {
 public:
  OptionStore(db::Repository& repo, db::Transaction& tx);

  // NULL values read back as "".
  std::vector<OptionRecord> All();

  std::optional<std::string> Get(const std::string& name);

  // Replaces any existing row with this name (delete, then insert).
  void Put(const std::string& name, const std::string& value);

 private:
  db::Repository&  repo_;
  db::Transaction& tx_;
};

} // namespace quire::backup
