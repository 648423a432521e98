#pragma once

#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"
#include "quire/backup/v1/manifest.pb.h"

namespace quire::backup {

struct ExportResult {
  std::string              archive; // zip bytes
  std::vector<std::string> tables;  // written, in registry order
  std::vector<std::string> skipped; // query or encode failed
};

quire::backup::v1::BackupManifest BuildManifest(const std::string& engine, util::TimePoint created_at,
                                                const std::vector<std::string>& tables);

// {"format", "version", "engine", "created_at", "tables"}; created_at is RFC3339 UTC.
std::string RenderManifestJson(const quire::backup::v1::BackupManifest& manifest);

/*
  Dumps every canonical table into one zip archive.

  Not transactional: tables are read one after another outside any
  transaction. A table that cannot be read or encoded is logged and
  left out of both the archive and the manifest; an empty table still
  gets an (empty) entry.
*/
class ExportPipeline {
 public:
  explicit ExportPipeline(db::Repository& repo);

  // Throws util::ArchiveFormatError when the container cannot be written.
  ExportResult Export(util::TimePoint now);

 private:
  db::Repository& repo_;
};

} // namespace quire::backup
