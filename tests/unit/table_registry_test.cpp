#include "internal/backup/table_registry.hpp"

#include <cassert>
#include <iostream>
#include <set>
#include <string>

namespace {

using namespace quire::backup;

void TestCanonicalTables() {
  const auto& tables = CanonicalTables();
  assert(tables.size() == 31);
  assert(tables.front() == "users");
  assert(tables.back() == "options");

  std::set<std::string> unique(tables.begin(), tables.end());
  assert(unique.size() == tables.size() && "table names are unique");

  assert(IsCanonicalTable("posts"));
  assert(!IsCanonicalTable("Posts"));
  assert(!IsCanonicalTable("sessions"));
}

void TestResolveTableName() {
  assert(ResolveTableName("posts") == "posts");
  assert(ResolveTableName(" Sessions ") == "user_sessions");
  assert(ResolveTableName("metapresets") == "meta_presets");
  assert(ResolveTableName("recently") == "recentlies");
  assert(ResolveTableName("subscribers") == "subscribes");
  assert(!ResolveTableName("widgets"));
  assert(!ResolveTableName(""));
}

void TestColumnAliases() {
  assert(LookupGlobalColumnAlias("createdat") == "created_at");
  assert(LookupGlobalColumnAlias("_id") == "id");
  assert(LookupGlobalColumnAlias("ipaddress") == "ip");
  assert(!LookupGlobalColumnAlias("title"));

  assert(LookupTableColumnAlias("notes", "password") == "password_hash");
  assert(!LookupTableColumnAlias("users", "password"));
}

void TestRefTypes() {
  assert(CanonicalRefType("Posts") == "post");
  assert(CanonicalRefType(" notes ") == "note");
  assert(CanonicalRefType("Recentlies") == "recently");
  assert(CanonicalRefType("Widget") == "widget");
}

void TestLegacyConfigSections() {
  assert(LegacyConfigSection("MailOptions") == "mail_options");
  assert(LegacyConfigSection("mailOptions") == "mail_options");
  assert(LegacyConfigSection("seo") == "seo");
  assert(LegacyConfigSection("S3Options") == "s3_options");
  assert(LegacyConfigSection("thirdPartyServiceIntegration") == "third_party_service_integration");
  assert(!LegacyConfigSection("configs"));
  assert(!LegacyConfigSection("email_template_owner"));
  assert(!LegacyConfigSection("  "));
}

void TestEntryPath() {
  assert(TableEntryPath("posts") == "quire/db/posts.bson");
}

} // namespace

int main() {
  TestCanonicalTables();
  TestResolveTableName();
  TestColumnAliases();
  TestRefTypes();
  TestLegacyConfigSections();
  TestEntryPath();

  std::cout << "quire_unit_table_registry: pass\n";
  return 0;
}
