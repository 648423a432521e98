#include "internal/backup/restore_orchestrator.hpp"

#include <memory>

#include "internal/backup/column_metadata.hpp"
#include "internal/backup/legacy_asset_importer.hpp"
#include "internal/backup/legacy_config_migrator.hpp"
#include "internal/backup/option_store.hpp"
#include "internal/backup/row_normalizer.hpp"
#include "internal/backup/table_registry.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"

namespace quire::backup {

namespace {

using observability::IntField;
using observability::StringField;

bool EndsWith(std::string_view s, std::string_view suffix) {
  return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

/*
  Suspends foreign-key enforcement for the import phase when the backend
  supports it. Restore() re-enables it explicitly; the destructor covers
  the error path.
*/
class ForeignKeyGuard {
 public:
  ForeignKeyGuard(db::Repository& repo, db::Transaction& tx) : repo_(repo), tx_(tx) {
    if (!repo_.SupportsDeferredForeignKeys()) return;
    auto r = repo_.SetForeignKeyChecks(tx_, false);
    if (!r) {
      throw util::RestoreError("disable foreign key checks: " + r.ToString());
    }
    disabled_ = true;
  }

  ~ForeignKeyGuard() {
    if (!disabled_ || tx_.IsFinished()) return;
    auto r = repo_.SetForeignKeyChecks(tx_, true);
    if (!r) {
      QUIRE_LOG_ERROR("re-enable foreign key checks failed", {StringField("error", r.ToString())});
    }
  }

  ForeignKeyGuard(const ForeignKeyGuard&)            = delete;
  ForeignKeyGuard& operator=(const ForeignKeyGuard&) = delete;

  void Restore() {
    if (!disabled_) return;
    auto r = repo_.SetForeignKeyChecks(tx_, true);
    if (!r) {
      throw util::RestoreError("re-enable foreign key checks: " + r.ToString());
    }
    disabled_ = false;
  }

 private:
  db::Repository&  repo_;
  db::Transaction& tx_;
  bool             disabled_ = false;
};

} // namespace

const char* RestoreStateName(RestoreState state) {
  switch (state) {
    case RestoreState::Idle:
      return "idle";
    case RestoreState::Scanning:
      return "scanning";
    case RestoreState::Importing:
      return "importing";
    case RestoreState::LegacyConfigMigration:
      return "legacy_config_migration";
    case RestoreState::LegacyAssetImport:
      return "legacy_asset_import";
    case RestoreState::Committed:
      return "committed";
    case RestoreState::RolledBack:
      return "rolled_back";
  }
  return "unknown";
}

std::optional<ParsedEntry> ParseBackupEntry(std::string_view entry_name) {
  std::string name(entry_name);
  const auto  slash = name.find_last_of('/');
  if (slash != std::string::npos) name = name.substr(slash + 1);

  const std::string base = util::ToLower(util::Trim(name));
  if (base.empty() || base == "prelude.json" || base == "manifest.json" || EndsWith(base, ".metadata.json")) {
    return std::nullopt;
  }

  for (auto format : {codec::RowFormat::Bson, codec::RowFormat::Json}) {
    const std::string_view ext = codec::RowFormatExtension(format);
    if (EndsWith(base, ext)) {
      std::string table = base.substr(0, base.size() - ext.size());
      if (table.empty()) return std::nullopt;
      return ParsedEntry{std::move(table), format};
    }
  }
  return std::nullopt;
}

std::map<std::string, TableCandidate> ScanArchive(const std::vector<archive::ZipEntry>& entries) {
  std::map<std::string, TableCandidate> out;
  for (const auto& entry : entries) {
    auto parsed = ParseBackupEntry(entry.name);
    if (!parsed) continue;

    auto table = ResolveTableName(parsed->table);
    if (!table) continue;

    auto it = out.find(*table);
    if (it == out.end() || (it->second.format != codec::RowFormat::Bson && parsed->format == codec::RowFormat::Bson)) {
      out[*table] = TableCandidate{*table, parsed->format, &entry};
    }
  }
  return out;
}

bool IsDuplicateKeyError(const db::Result& result) {
  if (result.code == db::ErrorCode::ConstraintViolation) return true;
  if (result) return false;
  return util::ContainsIgnoreCase(result.message, "duplicate entry") ||
         util::ContainsIgnoreCase(result.message, "duplicate key") ||
         util::ContainsIgnoreCase(result.message, "unique constraint");
}

RestoreOrchestrator::RestoreOrchestrator(db::Repository& repo) : repo_(repo) {
}

void RestoreOrchestrator::Transition(RestoreState next) {
  QUIRE_LOG_DEBUG("restore state",
                  {StringField("from", RestoreStateName(state_)), StringField("to", RestoreStateName(next))});
  state_ = next;
}

RestoreReport RestoreOrchestrator::RestoreArchive(std::string_view zip_bytes) {
  const auto entries = archive::ReadZipArchive(zip_bytes);
  return Restore(entries);
}

RestoreReport RestoreOrchestrator::Restore(const std::vector<archive::ZipEntry>& entries) {
  Transition(RestoreState::Scanning);
  const auto candidates = ScanArchive(entries);

  RestoreReport                    report;
  std::unique_ptr<db::Transaction> tx;
  try {
    tx = repo_.Begin();
  } catch (const std::exception& e) {
    QUIRE_LOG_ERROR("restore could not begin", {StringField("error", e.what())});
    state_ = RestoreState::RolledBack;
    throw;
  }

  try {
    {
      ForeignKeyGuard fk(repo_, *tx);

      Transition(RestoreState::Importing);
      for (const auto& table : CanonicalTables()) {
        auto it = candidates.find(table);
        if (it == candidates.end()) continue;
        report.tables.push_back(ImportTable(*tx, it->second));
      }

      fk.Restore();
    }

    OptionStore options(repo_, *tx);

    Transition(RestoreState::LegacyConfigMigration);
    report.migrated_sections = MigrateLegacyOptions(options);

    Transition(RestoreState::LegacyAssetImport);
    report.imported_templates = ImportLegacyEmailTemplates(entries, options);

    tx->Commit();
  } catch (const std::exception& e) {
    QUIRE_LOG_ERROR("restore rolled back",
                    {StringField("state", RestoreStateName(state_)), StringField("error", e.what())});
    if (!tx->IsFinished()) {
      try {
        tx->Rollback();
      } catch (const util::TransactionError& rollback_error) {
        QUIRE_LOG_ERROR("rollback failed", {StringField("error", rollback_error.what())});
      }
    }
    state_ = RestoreState::RolledBack;
    throw;
  }

  Transition(RestoreState::Committed);
  QUIRE_LOG_INFO("restore committed",
                 {IntField("tables", static_cast<std::int64_t>(report.tables.size())),
                  IntField("config_sections", static_cast<std::int64_t>(report.migrated_sections.size())),
                  IntField("templates", static_cast<std::int64_t>(report.imported_templates.size()))});
  return report;
}

TableImportStats RestoreOrchestrator::ImportTable(db::Transaction& tx, const TableCandidate& candidate) {
  const std::string& table = candidate.table;

  TableImportStats stats;
  stats.table  = table;
  stats.format = candidate.format;

  if (!candidate.entry->Readable()) {
    throw util::DecodeError("read entry " + candidate.entry->name + ": " + candidate.entry->error);
  }

  std::vector<model::Row> rows;
  try {
    rows = codec::DecodeRows(candidate.entry->data, candidate.format);
  } catch (const util::DecodeError& e) {
    throw util::DecodeError("decode rows for table " + table + ": " + e.what());
  }
  stats.decoded = rows.size();

  const ColumnMap columns = LoadColumns(repo_, tx, table);

  std::vector<model::Row> normalized;
  normalized.reserve(rows.size());
  for (const auto& row : rows) {
    auto out = NormalizeRow(table, row, columns);
    if (!out) {
      ++stats.dropped;
      continue;
    }
    normalized.push_back(std::move(*out));
  }

  auto cleared = repo_.DeleteAll(tx, table);
  if (!cleared) {
    throw util::RestoreError("clear table " + table + ": " + cleared.ToString());
  }

  for (std::size_t i = 0; i < normalized.size(); ++i) {
    auto r = repo_.Insert(tx, table, normalized[i]);
    if (r) {
      ++stats.inserted;
      continue;
    }
    if (IsDuplicateKeyError(r)) {
      ++stats.skipped;
      QUIRE_LOG_WARN("skipping duplicate row", {StringField("table", table),
                                                IntField("row", static_cast<std::int64_t>(i + 1)),
                                                StringField("error", r.message)});
      continue;
    }
    throw util::RestoreError("insert row #" + std::to_string(i + 1) + " into " + table + ": " + r.ToString());
  }

  QUIRE_LOG_INFO("restored table", {StringField("table", table),
                                    StringField("format", codec::RowFormatExtension(candidate.format)),
                                    IntField("inserted", static_cast<std::int64_t>(stats.inserted)),
                                    IntField("skipped", static_cast<std::int64_t>(stats.skipped)),
                                    IntField("dropped", static_cast<std::int64_t>(stats.dropped))});
  return stats;
}

} // namespace quire::backup
