#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/archive/zip_archive.hpp"
#include "internal/codec/row_codec.hpp"
#include "internal/db/api/repository.hpp"

namespace quire::backup {

enum class RestoreState {
  Idle,
  Scanning,
  Importing,
  LegacyConfigMigration,
  LegacyAssetImport,
  Committed,
  RolledBack,
};

const char* RestoreStateName(RestoreState state);

// One table payload picked from the archive.
struct TableCandidate {
  std::string              table;
  codec::RowFormat         format = codec::RowFormat::Bson;
  const archive::ZipEntry* entry  = nullptr;
};

struct TableImportStats {
  std::string      table;
  codec::RowFormat format   = codec::RowFormat::Bson;
  std::size_t      decoded  = 0;
  std::size_t      dropped  = 0; // empty after normalization
  std::size_t      inserted = 0;
  std::size_t      skipped  = 0; // duplicate key
};

struct RestoreReport {
  std::vector<TableImportStats> tables;
  std::vector<std::string>      migrated_sections;
  std::vector<std::string>      imported_templates;
};

/*
  Table name and payload format of an archive entry, from its base name.

  manifest.json, prelude.json, *.metadata.json and anything that is not
  .bson/.json yield std::nullopt. The table part is not resolved.
*/
struct ParsedEntry {
  std::string      table;
  codec::RowFormat format;
};
std::optional<ParsedEntry> ParseBackupEntry(std::string_view entry_name);

// Canonical table -> chosen entry; .bson wins over .json for one table.
std::map<std::string, TableCandidate> ScanArchive(const std::vector<archive::ZipEntry>& entries);

// ConstraintViolation, or a driver message naming a duplicate/unique conflict.
bool IsDuplicateKeyError(const db::Result& result);

/*
  Transactional restore:

    Scanning -> Importing -> LegacyConfigMigration -> LegacyAssetImport -> Committed

  Any exception rolls back every write of the run (state RolledBack)
  and is rethrown unchanged. Duplicate-key inserts are skipped.

  Tables are imported in registry order. Each imported table is emptied
  first, tables absent from the archive are left alone.
*/
class RestoreOrchestrator {
 public:
  explicit RestoreOrchestrator(db::Repository& repo);

  // Throws util::ArchiveFormatError before opening a transaction when
  // the container is unreadable.
  RestoreReport RestoreArchive(std::string_view zip_bytes);

  RestoreReport Restore(const std::vector<archive::ZipEntry>& entries);

  RestoreState State() const {
    return state_;
  }

 private:
  TableImportStats ImportTable(db::Transaction& tx, const TableCandidate& candidate);
  void             Transition(RestoreState next);

  db::Repository& repo_;
  RestoreState    state_ = RestoreState::Idle;
};

} // namespace quire::backup
