#include "internal/backup/table_registry.hpp"

#include <string>
#include <unordered_map>
#include <unordered_set>

#include "internal/util/strings.hpp"

namespace quire::backup {

namespace {

using AliasMap = std::unordered_map<std::string, std::string>;

struct Catalog {
  std::vector<std::string>                  tables;
  std::unordered_set<std::string>           table_set;
  AliasMap                                  table_aliases;
  AliasMap                                  column_aliases;
  std::unordered_map<std::string, AliasMap> column_aliases_by_table;
  AliasMap                                  ref_type_aliases;
  AliasMap                                  config_section_aliases;
};

Catalog BuildCatalog() {
  Catalog c;

  c.tables = {
      "users",         "user_sessions",   "api_tokens",      "oauth2_tokens",  "authn_credentials",   "readers",
      "categories",    "topics",          "posts",           "notes",          "pages",               "comments",
      "recentlies",    "drafts",          "draft_histories", "ai_summaries",   "ai_deep_readings",    "analyzes",
      "activities",    "slug_trackers",   "file_references", "webhooks",       "webhook_events",      "snippets",
      "projects",      "links",           "says",            "subscribes",     "meta_presets",        "serverless_storages",
      "options",
  };
  c.table_set.insert(c.tables.begin(), c.tables.end());

  c.table_aliases = {
      {"metapresets", "meta_presets"},
      {"sessions", "user_sessions"},
      {"serverlessstorages", "serverless_storages"},
      {"authns", "authn_credentials"},
      {"analyze_logs", "analyzes"},
      {"recently", "recentlies"},
      {"subscribers", "subscribes"},
  };

  c.column_aliases = {
      {"_id", "id"},
      {"created", "created_at"},
      {"modified", "updated_at"},
      {"createdat", "created_at"},
      {"updatedat", "updated_at"},
      {"userid", "user_id"},
      {"ipaddress", "ip"},
      {"useragent", "ua"},
      {"reftype", "ref_type"},
      {"refid", "ref_id"},
      {"ref", "ref_id"},
      {"parent", "parent_id"},
      {"targetid", "target_id"},
      {"commentsindex", "comments_index"},
      {"iswhispers", "is_whispers"},
      {"parentid", "parent_id"},
      {"readerid", "reader_id"},
      {"publicat", "public_at"},
      {"topicid", "topic_id"},
      {"categoryid", "category_id"},
      {"pinorder", "pin_order"},
      {"readcount", "read_count"},
      {"likecount", "like_count"},
      {"nid", "n_id"},
  };

  c.column_aliases_by_table = {
      {"notes", {{"password", "password_hash"}}},
  };

  c.ref_type_aliases = {
      {"posts", "post"},   {"post", "post"},         {"notes", "note"},          {"note", "note"},
      {"pages", "page"},   {"page", "page"},         {"recently", "recently"},   {"recentlies", "recently"},
  };

  c.config_section_aliases = {
      {"seo", "seo"},
      {"url", "url"},
      {"mailoptions", "mail_options"},
      {"commentoptions", "comment_options"},
      {"backupoptions", "backup_options"},
      {"baidusearchoptions", "baidu_search_options"},
      {"algoliasearchoptions", "algolia_search_options"},
      {"adminextra", "admin_extra"},
      {"friendlinkoptions", "friend_link_options"},
      {"s3options", "s3_options"},
      {"imagebedoptions", "image_bed_options"},
      {"imagestorageoptions", "image_storage_options"},
      {"textoptions", "text_options"},
      {"bingsearchoptions", "bing_search_options"},
      {"meilisearchoptions", "meili_search_options"},
      {"featurelist", "feature_list"},
      {"barkoptions", "bark_options"},
      {"authsecurity", "auth_security"},
      {"ai", "ai"},
      {"oauth", "oauth"},
      {"thirdpartyserviceintegration", "third_party_service_integration"},
  };

  return c;
}

const Catalog& GetCatalog() {
  static const Catalog kCatalog = BuildCatalog();
  return kCatalog;
}

std::optional<std::string> Find(const AliasMap& map, const std::string& key) {
  auto it = map.find(key);
  if (it == map.end()) return std::nullopt;
  return it->second;
}

} // namespace

const std::vector<std::string>& CanonicalTables() {
  return GetCatalog().tables;
}

bool IsCanonicalTable(std::string_view name) {
  return GetCatalog().table_set.count(std::string(name)) > 0;
}

std::optional<std::string> ResolveTableName(std::string_view raw) {
  std::string name = util::ToLower(util::Trim(raw));
  if (name.empty()) return std::nullopt;

  if (auto mapped = Find(GetCatalog().table_aliases, name)) {
    name = *mapped;
  }
  if (!IsCanonicalTable(name)) return std::nullopt;
  return name;
}

std::optional<std::string> LookupTableColumnAlias(std::string_view table, std::string_view key) {
  const auto& by_table = GetCatalog().column_aliases_by_table;
  auto        it       = by_table.find(std::string(table));
  if (it == by_table.end()) return std::nullopt;
  return Find(it->second, std::string(key));
}

std::optional<std::string> LookupGlobalColumnAlias(std::string_view key) {
  return Find(GetCatalog().column_aliases, std::string(key));
}

std::string CanonicalRefType(std::string_view raw) {
  std::string key = util::ToLower(util::Trim(raw));
  if (auto mapped = Find(GetCatalog().ref_type_aliases, key)) return *mapped;
  return key;
}

std::optional<std::string> LegacyConfigSection(std::string_view option_name) {
  const std::string trimmed = util::Trim(option_name);
  if (trimmed.empty()) return std::nullopt;

  const std::string snake = util::ToLower(util::CamelToSnake(trimmed));
  std::string       squashed;
  squashed.reserve(snake.size());
  for (char ch : snake) {
    if (ch != '_') squashed.push_back(ch);
  }

  const auto& aliases = GetCatalog().config_section_aliases;
  if (auto section = Find(aliases, snake)) return section;
  return Find(aliases, squashed);
}

std::string TableEntryPath(std::string_view table) {
  return std::string(kArchiveDbDir) + "/" + std::string(table) + ".bson";
}

} // namespace quire::backup
