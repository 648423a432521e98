#include "internal/backup/legacy_config_migrator.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <optional>

#include "internal/backup/table_registry.hpp"
#include "internal/backup/unified_config.hpp"
#include "internal/codec/json_value.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/strings.hpp"

namespace quire::backup {

namespace model = db::model;

namespace {

std::optional<int64_t> ParseInt(const std::string& s) {
  errno         = 0;
  char*   end   = nullptr;
  int64_t value = std::strtoll(s.c_str(), &end, 10);
  if (end != s.c_str() + s.size() || errno == ERANGE) return std::nullopt;
  return value;
}

std::optional<double> ParseFloat(const std::string& s) {
  errno        = 0;
  char*  end   = nullptr;
  double value = std::strtod(s.c_str(), &end);
  if (end != s.c_str() + s.size() || errno == ERANGE) return std::nullopt;
  return value;
}

std::optional<bool> ParseBool(const std::string& s) {
  const std::string lower = util::ToLower(s);
  if (lower == "1" || lower == "t" || lower == "true") return true;
  if (lower == "0" || lower == "f" || lower == "false") return false;
  return std::nullopt;
}

} // namespace

model::Value ParseLegacyOptionValue(std::string_view raw) {
  const std::string s = util::Trim(raw);
  if (s.empty()) {
    return model::Value{std::string()};
  }
  if (auto json = codec::ParseJson(s)) {
    return codec::FromProtoValue(*json);
  }
  if (auto i = ParseInt(s)) return model::Value{*i};
  if (auto f = ParseFloat(s)) return model::Value{*f};
  if (auto b = ParseBool(s)) return model::Value{*b};
  return model::Value{s};
}

model::Value NormalizeLegacyOptionValue(const model::Value& value) {
  if (const auto* map = value.As<model::Map>()) {
    model::Map out;
    for (const auto& [key, item] : *map) {
      std::string normalized = util::CamelToSnake(key);
      if (normalized.empty()) continue;
      out[std::move(normalized)] = NormalizeLegacyOptionValue(item);
    }
    return model::Value{std::move(out)};
  }
  if (const auto* list = value.As<model::List>()) {
    model::List out;
    out.reserve(list->size());
    for (const auto& item : *list) out.push_back(NormalizeLegacyOptionValue(item));
    return model::Value{std::move(out)};
  }
  return value;
}

std::vector<std::string> MigrateLegacyOptions(OptionStore& options) {
  auto rows = options.All();
  if (rows.empty()) {
    return {};
  }
  std::stable_sort(rows.begin(), rows.end(),
                   [](const OptionRecord& a, const OptionRecord& b) { return a.name < b.name; });

  std::vector<std::string> applied;
  model::Map               sections;
  for (const auto& row : rows) {
    auto section = LegacyConfigSection(row.name);
    if (!section) continue;
    sections[*section] = NormalizeLegacyOptionValue(ParseLegacyOptionValue(row.value));
    applied.erase(std::remove(applied.begin(), applied.end(), *section), applied.end());
    applied.push_back(*section);
  }
  if (sections.empty()) {
    return {};
  }

  model::Map merged = DefaultUnifiedConfig();
  for (const auto& row : rows) {
    if (row.name != kUnifiedConfigOption) continue;
    auto stored = codec::ParseJson(row.value);
    if (stored && stored->kind_case() == google::protobuf::Value::kStructValue) {
      auto value = codec::FromProtoValue(*stored);
      for (auto& [key, item] : *value.As<model::Map>()) {
        merged[key] = std::move(item);
      }
    } else {
      QUIRE_LOG_WARN("stored unified config is not a JSON object; starting from defaults");
    }
  }

  for (auto& [key, value] : sections) {
    merged[key] = std::move(value);
  }

  options.Put(kUnifiedConfigOption, codec::ToJsonText(model::Value{std::move(merged)}));

  for (const auto& section : applied) {
    QUIRE_LOG_INFO("migrated legacy config section", {observability::StringField("section", section)});
  }
  return applied;
}

} // namespace quire::backup
