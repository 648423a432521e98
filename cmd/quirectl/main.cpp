#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>
#include <vector>

#include "internal/backup/export_pipeline.hpp"
#include "internal/backup/local_backup_store.hpp"
#include "internal/backup/object_key.hpp"
#include "internal/backup/restore_orchestrator.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

using quire::observability::StringField;

namespace fs = std::filesystem;

static void Usage() {
  std::cout << "Usage:\n"
            << "  quirectl [--config <config.yaml>] export <db> [out.zip]\n"
            << "  quirectl [--config <config.yaml>] restore <db> <archive.zip>\n"
            << "  quirectl [--config <config.yaml>] list\n"
            << "  quirectl [--config <config.yaml>] delete <name.zip>[,<name.zip>...]\n"
            << "  quirectl [--config <config.yaml>] init-schema <db>\n"
            << "\n"
            << "<db> is a SQLite path, or '-' for the database named in the config file.\n"
            << "export without out.zip writes backup-<timestamp>.zip into the backup directory.\n";
}

static std::vector<std::string> SplitList(const std::string& raw) {
  std::vector<std::string> out;
  std::stringstream        ss(raw);
  std::string              item;
  while (std::getline(ss, item, ',')) {
    if (!item.empty()) out.push_back(item);
  }
  return out;
}

static std::string ReadFile(const fs::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw std::runtime_error("cannot open " + path.string());
  }
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

static void WriteFile(const fs::path& path, const std::string& bytes) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
  out.close();
  if (!out) {
    throw std::runtime_error("cannot write " + path.string());
  }
}

// A positional <db> other than "-" selects a SQLite file.
static void SelectDatabase(quire::runtime::config::RuntimeConfig& config, const std::string& db) {
  if (db == "-") return;
  config.mutable_database()->mutable_sqlite()->set_path(db);
}

static void PrintReport(const quire::backup::RestoreReport& report) {
  for (const auto& t : report.tables) {
    std::cout << t.table << ": inserted=" << t.inserted << " skipped=" << t.skipped << " dropped=" << t.dropped
              << "\n";
  }
  for (const auto& section : report.migrated_sections) {
    std::cout << "config section: " << section << "\n";
  }
  for (const auto& option : report.imported_templates) {
    std::cout << "template: " << option << "\n";
  }
}

int main(int argc, char** argv) {
  std::vector<std::string> args(argv + 1, argv + argc);

  std::string config_path;
  if (args.size() >= 2 && args[0] == "--config") {
    config_path = args[1];
    args.erase(args.begin(), args.begin() + 2);
  }
  if (args.empty()) {
    Usage();
    return 1;
  }

  const std::string cmd = args[0];

  try {
    auto config = config_path.empty() ? quire::config::ConfigLoader::Defaults()
                                      : quire::config::ConfigLoader::LoadFromYaml(config_path);
    quire::observability::InitializeLogging(config);

    quire::backup::LocalBackupStore store(config.backup().directory());

    if (cmd == "list") {
      for (const auto& item : store.List()) {
        std::cout << item.filename << "\t" << item.size << "\n";
      }
    } else if (cmd == "delete" && args.size() == 2) {
      std::cout << "removed " << store.Remove(SplitList(args[1])) << "\n";
    } else if (cmd == "init-schema" && args.size() == 2) {
      SelectDatabase(config, args[1]);
      quire::factory::BuildRepository(config);
      std::cout << "schema ready\n";
    } else if (cmd == "export" && (args.size() == 2 || args.size() == 3)) {
      SelectDatabase(config, args[1]);
      auto       repo = quire::factory::BuildRepository(config);
      const auto now  = quire::util::Now();

      if (args.size() == 3) {
        quire::backup::ExportPipeline pipeline(*repo);
        auto                          result = pipeline.Export(now);
        WriteFile(args[2], result.archive);
        std::cout << args[2] << "\n";
      } else {
        const auto path = store.CreateBackup(*repo, now);
        const auto key = quire::backup::RenderBackupObjectKey(config.backup().object_key_template(),
                                                              path.filename().string(), now);
        QUIRE_LOG_INFO("backup ready", {StringField("path", path.string()), StringField("object_key", key)});
        std::cout << path.string() << "\n";
      }
    } else if (cmd == "restore" && args.size() == 3) {
      SelectDatabase(config, args[1]);
      auto repo = quire::factory::BuildRepository(config);

      quire::backup::RestoreReport report;
      if (fs::exists(args[2])) {
        quire::backup::RestoreOrchestrator orchestrator(*repo);
        report = orchestrator.RestoreArchive(ReadFile(args[2]));
      } else {
        report = store.RestoreFile(*repo, args[2]);
      }
      PrintReport(report);
    } else {
      Usage();
      quire::observability::ShutdownLogging();
      return 1;
    }
  } catch (const std::exception& e) {
    QUIRE_LOG_ERROR("quirectl failed", {StringField("command", cmd), StringField("error", e.what())});
    quire::observability::ShutdownLogging();
    return 2;
  }

  quire::observability::ShutdownLogging();
  return 0;
}
