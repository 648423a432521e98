#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace quire::backup {

/*
  Canonical table catalog and the legacy alias tables.

  Everything here is immutable process-wide data built on first use.
  Restore never writes to a table outside CanonicalTables().
*/

// archive layout
inline constexpr const char* kArchiveRoot    = "quire";
inline constexpr const char* kArchiveDbDir   = "quire/db";
inline constexpr const char* kManifestPath   = "quire/manifest.json";
inline constexpr const char* kArchiveFormat  = "quire-bson";
inline constexpr int         kArchiveVersion = 1;

// Registry order; export and import both walk tables in this order.
const std::vector<std::string>& CanonicalTables();

bool IsCanonicalTable(std::string_view name);

// Lower-case + trim, apply table aliases, verify membership.
std::optional<std::string> ResolveTableName(std::string_view raw);

// Column aliases; `key` is the lower-cased or snake_cased field name.
std::optional<std::string> LookupTableColumnAlias(std::string_view table, std::string_view key);
std::optional<std::string> LookupGlobalColumnAlias(std::string_view key);

// "Posts" -> "post"; unknown values come back lower-cased and trimmed.
std::string CanonicalRefType(std::string_view raw);

// Legacy option name -> unified config section ("MailOptions" -> "mail_options").
std::optional<std::string> LegacyConfigSection(std::string_view option_name);

// "<root>/db/<table>.bson"
std::string TableEntryPath(std::string_view table);

} // namespace quire::backup
