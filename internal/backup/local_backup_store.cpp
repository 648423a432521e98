#include "internal/backup/local_backup_store.hpp"

#include <algorithm>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <stdexcept>

#include "internal/backup/export_pipeline.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"

namespace quire::backup {

namespace fs = std::filesystem;

using observability::StringField;

namespace {

constexpr std::string_view kArchiveExtension = ".zip";

} // namespace

LocalBackupStore::LocalBackupStore(fs::path directory) : directory_(std::move(directory)) {
}

std::string LocalBackupStore::BackupFilename(util::TimePoint now) {
  return util::FormatUtc(now, "backup-%Y-%m-%dT%H-%M-%S.zip");
}

std::string LocalBackupStore::FormatSize(std::uintmax_t bytes) {
  constexpr std::uintmax_t kKiB = 1u << 10;
  constexpr std::uintmax_t kMiB = 1u << 20;

  char buf[64];
  if (bytes >= kMiB) {
    std::snprintf(buf, sizeof(buf), "%.2f MB", static_cast<double>(bytes) / static_cast<double>(kMiB));
  } else if (bytes >= kKiB) {
    std::snprintf(buf, sizeof(buf), "%.2f KB", static_cast<double>(bytes) / static_cast<double>(kKiB));
  } else {
    std::snprintf(buf, sizeof(buf), "%ju B", bytes);
  }
  return buf;
}

std::optional<std::string> LocalBackupStore::SanitizeFilename(std::string_view name) {
  std::string s(name);
  std::replace(s.begin(), s.end(), '\\', '/');
  const auto slash = s.find_last_of('/');
  if (slash != std::string::npos) s = s.substr(slash + 1);
  s = util::Trim(s);

  if (s.size() <= kArchiveExtension.size() ||
      s.compare(s.size() - kArchiveExtension.size(), kArchiveExtension.size(), kArchiveExtension) != 0) {
    return std::nullopt;
  }
  return s;
}

void LocalBackupStore::EnsureDirectory() {
  fs::create_directories(directory_);
}

fs::path LocalBackupStore::CreateBackup(db::Repository& repo, util::TimePoint now) {
  ExportPipeline pipeline(repo);
  const auto     exported = pipeline.Export(now);

  EnsureDirectory();
  const fs::path path = directory_ / BackupFilename(now);

  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    throw std::runtime_error("cannot open " + path.string() + " for writing");
  }
  out.write(exported.archive.data(), static_cast<std::streamsize>(exported.archive.size()));
  out.close();
  if (!out) {
    throw std::runtime_error("write failed for " + path.string());
  }

  QUIRE_LOG_INFO("backup written", {StringField("path", path.string())});
  return path;
}

std::vector<BackupFileInfo> LocalBackupStore::List() {
  EnsureDirectory();

  std::vector<BackupFileInfo> out;
  for (const auto& entry : fs::directory_iterator(directory_)) {
    if (!entry.is_regular_file()) continue;
    const std::string name = entry.path().filename().string();
    if (name.size() < kArchiveExtension.size() ||
        name.compare(name.size() - kArchiveExtension.size(), kArchiveExtension.size(), kArchiveExtension) != 0) {
      continue;
    }

    std::error_code ec;
    const auto      size = entry.file_size(ec);
    if (ec) continue;
    out.push_back(BackupFileInfo{name, size, FormatSize(size)});
  }

  std::sort(out.begin(), out.end(),
            [](const BackupFileInfo& a, const BackupFileInfo& b) { return a.filename < b.filename; });
  return out;
}

std::string LocalBackupStore::Read(const std::string& filename) const {
  auto name = SanitizeFilename(filename);
  if (!name) {
    throw util::NotFound("invalid backup filename: " + filename);
  }

  const fs::path path = directory_ / *name;
  std::ifstream  in(path, std::ios::binary);
  if (!in) {
    throw util::NotFound("backup not found: " + *name);
  }
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

std::size_t LocalBackupStore::Remove(const std::vector<std::string>& filenames) {
  std::size_t removed = 0;
  for (const auto& raw : filenames) {
    auto name = SanitizeFilename(raw);
    if (!name) continue;

    std::error_code ec;
    if (fs::remove(directory_ / *name, ec)) {
      ++removed;
      QUIRE_LOG_INFO("backup removed", {StringField("file", *name)});
    } else if (ec) {
      QUIRE_LOG_WARN("backup remove failed", {StringField("file", *name), StringField("error", ec.message())});
    }
  }
  return removed;
}

RestoreReport LocalBackupStore::RestoreFile(db::Repository& repo, const std::string& filename) {
  const std::string   bytes = Read(filename);
  RestoreOrchestrator orchestrator(repo);
  return orchestrator.RestoreArchive(bytes);
}

} // namespace quire::backup
