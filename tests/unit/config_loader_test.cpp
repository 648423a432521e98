#include "internal/config/config_loader.hpp"

#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using quire::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "quire_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestFullConfig() {
  const auto yaml_path = WriteYaml("full",
                                   R"(database:
  sqlite:
    path: "/var/lib/quire/cms.db"
backup:
  directory: "/var/backups/quire"
  object_key_template: "site/{Y}/{filename}"
logging:
  level: debug
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().path() == "/var/lib/quire/cms.db");
  assert(config.backup().directory() == "/var/backups/quire");
  assert(config.backup().object_key_template() == "site/{Y}/{filename}");
  assert(config.logging().level() == "debug");
}

void TestQuotedScalarsStayStrings() {
  auto config = ConfigLoader::LoadFromYamlString(R"(database:
  sqlite:
    path: "12345"
)");
  assert(config.database().sqlite().path() == "12345");
}

void TestDefaultsApplied() {
  auto empty = ConfigLoader::LoadFromYamlString("");
  assert(empty.backup().directory() == quire::config::kDefaultBackupDirectory);
  assert(empty.backup().object_key_template() == quire::config::kDefaultObjectKeyTemplate);
  assert(!empty.database().has_sqlite() && !empty.database().has_postgres());

  auto defaults = ConfigLoader::Defaults();
  assert(defaults.backup().directory() == quire::config::kDefaultBackupDirectory);

  auto pg = ConfigLoader::LoadFromYamlString(R"(database:
  postgres:
    connection_uri: "postgresql://localhost/cms"
)");
  assert(pg.database().has_postgres());
  assert(pg.database().postgres().max_connections() == 4);
}

void TestEnvironmentOverridesDirectory() {
  setenv("QUIRE_BACKUP_DIR", "/tmp/quire-env-backups", 1);
  auto config = ConfigLoader::LoadFromYamlString(R"(backup:
  directory: "/ignored"
)");
  unsetenv("QUIRE_BACKUP_DIR");
  assert(config.backup().directory() == "/tmp/quire-env-backups");
}

void TestUnknownFieldsAreRejected() {
  bool threw = false;
  try {
    ConfigLoader::LoadFromYamlString(R"(backup:
  directory: "/tmp"
unknown_field: 123
)");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestMissingFileIsRejected() {
  bool threw = false;
  try {
    ConfigLoader::LoadFromYaml((std::filesystem::temp_directory_path() / "quire_no_such_config.yaml").string());
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  unsetenv("QUIRE_BACKUP_DIR");

  TestFullConfig();
  TestQuotedScalarsStayStrings();
  TestDefaultsApplied();
  TestEnvironmentOverridesDirectory();
  TestUnknownFieldsAreRejected();
  TestMissingFileIsRejected();

  std::cout << "quire_unit_config_loader: pass\n";
  return 0;
}
