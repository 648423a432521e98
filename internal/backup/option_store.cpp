#include "internal/backup/option_store.hpp"

#include "internal/util/errors.hpp"

namespace quire::backup {

namespace {

constexpr const char* kOptionsTable = "options";

std::string TextOf(const db::model::Row& row, const char* column) {
  auto it = row.find(column);
  if (it == row.end()) return {};
  if (const auto* s = it->second.As<std::string>()) return *s;
  if (const auto* b = it->second.As<db::model::Bytes>()) return std::string(b->begin(), b->end());
  return {};
}

} // namespace

OptionStore::OptionStore(db::Repository& repo, db::Transaction& tx) : repo_(repo), tx_(tx) {
}

std::vector<OptionRecord> OptionStore::All() {
  std::vector<OptionRecord> out;
  for (const auto& row : repo_.SelectAll(tx_, kOptionsTable)) {
    out.push_back(OptionRecord{TextOf(row, "name"), TextOf(row, "value")});
  }
  return out;
}

std::optional<std::string> OptionStore::Get(const std::string& name) {
  for (auto& record : All()) {
    if (record.name == name) return std::move(record.value);
  }
  return std::nullopt;
}

void OptionStore::Put(const std::string& name, const std::string& value) {
  auto removed = repo_.DeleteWhere(tx_, kOptionsTable, "name", db::model::Value{name});
  if (!removed) {
    throw util::RestoreError("delete option " + name + ": " + removed.ToString());
  }

  db::model::Row row;
  row["name"]  = db::model::Value{name};
  row["value"] = db::model::Value{value};
  auto inserted = repo_.Insert(tx_, kOptionsTable, row);
  if (!inserted) {
    throw util::RestoreError("insert option " + name + ": " + inserted.ToString());
  }
}

} // namespace quire::backup
