#pragma once

#include <string>

#include "config/config.pb.h"

namespace quire::config {

inline constexpr const char* kDefaultBackupDirectory   = "backups";
inline constexpr const char* kDefaultObjectKeyTemplate = "backups/{Y}/{m}/{filename}";

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf; unknown keys
  are rejected. Defaults and environment overrides (QUIRE_BACKUP_DIR)
  are applied after parsing.
*/
class ConfigLoader {
 public:
  static quire::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static quire::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  // Config with no file: defaults plus environment overrides.
  static quire::runtime::config::RuntimeConfig Defaults();

  static void ApplyDefaults(quire::runtime::config::RuntimeConfig& config);
};

} // namespace quire::config
