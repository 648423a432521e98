#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/backup/restore_orchestrator.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"

namespace quire::backup {

struct BackupFileInfo {
  std::string    filename;
  std::uintmax_t size_bytes = 0;
  std::string    size; // "1.50 MB", "12.00 KB", "512 B"
};

/*
  Backup archives kept on local disk.

  Only plain "*.zip" names directly inside the directory are ever
  touched; any path components in a caller-supplied name are stripped.
  The directory is created on first use.
*/
class LocalBackupStore {
 public:
  explicit LocalBackupStore(std::filesystem::path directory);

  const std::filesystem::path& Directory() const {
    return directory_;
  }

  // "backup-YYYY-MM-DDTHH-MM-SS.zip" (UTC)
  static std::string BackupFilename(util::TimePoint now);

  static std::string FormatSize(std::uintmax_t bytes);

  // Base name of `name` when it is an acceptable archive file name.
  static std::optional<std::string> SanitizeFilename(std::string_view name);

  // Exports the database and writes the archive; returns its path.
  std::filesystem::path CreateBackup(db::Repository& repo, util::TimePoint now);

  // *.zip regular files, sorted by name.
  std::vector<BackupFileInfo> List();

  // Throws util::NotFound when the file does not exist or the name is invalid.
  std::string Read(const std::string& filename) const;

  // Invalid names and missing files are ignored. Returns the number removed.
  std::size_t Remove(const std::vector<std::string>& filenames);

  RestoreReport RestoreFile(db::Repository& repo, const std::string& filename);

 private:
  void EnsureDirectory();

  std::filesystem::path directory_;
};

} // namespace quire::backup
