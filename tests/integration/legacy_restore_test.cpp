#include <cassert>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "internal/backup/legacy_asset_importer.hpp"
#include "internal/backup/legacy_config_migrator.hpp"
#include "internal/backup/option_store.hpp"
#include "internal/backup/restore_orchestrator.hpp"
#include "internal/codec/json_value.hpp"
#include "internal/codec/row_codec.hpp"
#include "internal/util/time.hpp"
#include "support/sqlite_fixture.hpp"

#if QUIRE_DB_SQLITE

namespace {

namespace model  = quire::db::model;
namespace legacy = quire::db::model::legacy;
using quire::backup::OptionStore;
using quire::backup::RestoreOrchestrator;
using quire::testing::CountRows;
using quire::testing::MakeEntries;
using quire::testing::MakeSqliteRepository;
using quire::testing::MakeZip;
using quire::testing::TextField;

std::optional<std::string> ReadOption(quire::db::Repository& repo, const std::string& name) {
  std::optional<std::string> out;
  for (const auto& row : repo.SelectAll("options")) {
    if (TextField(row, "name") != name) continue;
    assert(!out.has_value() && "option names are unique");
    out = TextField(row, "value");
  }
  return out;
}

model::Map ReadUnifiedConfig(quire::db::Repository& repo) {
  const auto raw = ReadOption(repo, "configs");
  assert(raw.has_value());
  const auto parsed = quire::codec::ParseJson(*raw);
  assert(parsed.has_value());
  const auto value = quire::codec::FromProtoValue(*parsed);
  assert(value.As<model::Map>() != nullptr);
  return *value.As<model::Map>();
}

const model::Map& Section(const model::Map& config, const std::string& name) {
  const auto* section = config.at(name).As<model::Map>();
  assert(section != nullptr);
  return *section;
}

void SeedOption(quire::db::Repository& repo, const std::string& name, const std::string& value) {
  auto        tx = repo.Begin();
  OptionStore store(repo, *tx);
  store.Put(name, value);
  tx->Commit();
}

std::string OptionsJson(const std::vector<std::pair<std::string, std::string>>& options) {
  model::List rows;
  int         n = 0;
  for (const auto& [name, value] : options) {
    model::Map row;
    row["_id"]   = model::Value{"legacy-" + std::to_string(n++)};
    row["name"]  = model::Value{name};
    row["value"] = model::Value{value};
    rows.push_back(model::Value{std::move(row)});
  }
  return quire::codec::ToJsonText(model::Value{std::move(rows)});
}

void TestLegacyOptionsFoldIntoConfigs() {
  auto repo = MakeSqliteRepository();

  const auto zip = MakeZip({{"backup_data/options.json",
                             OptionsJson({
                                 {"seo", R"({"title":"T"})"},
                                 {"configs", R"({"custom":{"x":1},"url":{"webUrl":"https://site"}})"},
                                 {"MailOptions", R"({"enable":true,"smtpHost":"mail.local"})"},
                             })}});

  RestoreOrchestrator orchestrator(*repo);
  const auto          report = orchestrator.RestoreArchive(zip);
  assert((report.migrated_sections == std::vector<std::string>{"mail_options", "seo"}));

  const auto config = ReadUnifiedConfig(*repo);
  const auto& mail  = Section(config, "mail_options");
  assert(mail.at("enable") == model::Value{true});
  assert(mail.at("smtp_host") == model::Value{"mail.local"});
  assert(mail.count("provider") == 0 && "a migrated section replaces the whole default");

  assert(Section(config, "seo").at("title") == model::Value{"T"});
  assert(Section(config, "custom").at("x") == model::Value{1});
  // stored sections are taken as they are; only legacy rows get key normalization
  assert(Section(config, "url").count("webUrl") == 1);
  assert(config.count("comment_options") == 1 && "untouched sections keep their defaults");

  assert(CountRows(*repo, "options") == 3);
}

void TestNoLegacyRowsWritesNothing() {
  auto repo = MakeSqliteRepository();

  const auto zip = MakeZip({{"options.json", OptionsJson({{"site_title", "hello"}})}});

  RestoreOrchestrator orchestrator(*repo);
  const auto          report = orchestrator.RestoreArchive(zip);
  assert(report.migrated_sections.empty());
  assert(!ReadOption(*repo, "configs").has_value());
  assert(ReadOption(*repo, "site_title") == "hello");
}

void TestNonObjectConfigsStartsFromDefaults() {
  auto repo = MakeSqliteRepository();
  SeedOption(*repo, "configs", "[1,2]");
  SeedOption(*repo, "featureList", R"({"emailSubscribe":true})");

  RestoreOrchestrator orchestrator(*repo);
  const auto          report = orchestrator.RestoreArchive(MakeZip({{"readme.txt", "no tables"}}));
  assert((report.migrated_sections == std::vector<std::string>{"feature_list"}));

  const auto config = ReadUnifiedConfig(*repo);
  assert(Section(config, "feature_list").at("email_subscribe") == model::Value{true});
  assert(Section(config, "seo").at("title") == model::Value{"My little world"});
}

void TestLastNameWinsPerSection() {
  auto repo = MakeSqliteRepository();
  SeedOption(*repo, "mailOptions", R"({"from":"lower@site"})");
  SeedOption(*repo, "MailOptions", R"({"from":"upper@site"})");

  RestoreOrchestrator orchestrator(*repo);
  const auto          report = orchestrator.RestoreArchive(MakeZip({{"readme.txt", ""}}));
  assert((report.migrated_sections == std::vector<std::string>{"mail_options"}));

  // "MailOptions" sorts before "mailOptions"
  const auto config = ReadUnifiedConfig(*repo);
  assert(Section(config, "mail_options").at("from") == model::Value{"lower@site"});
}

void TestEmailTemplatesAreImported() {
  auto repo = MakeSqliteRepository();
  SeedOption(*repo, "email_template_owner", "stale");

  const auto zip = MakeZip({
      {"backup_data/assets/email-template/owner.template.ejs", "  <p>owner</p>\n"},
      {"Backup_Data\\Assets\\Email-Template\\Guest.template.ejs", "<p>guest</p>"},
      {"backup_data/assets/email-template/newsletter.template.ejs", " \n\t "},
      {"backup_data/assets/email-template/other.ejs", "<p>ignored</p>"},
      {"backup_data/assets/images/owner.template.ejs", "<p>wrong dir</p>"},
  });

  RestoreOrchestrator orchestrator(*repo);
  const auto          report = orchestrator.RestoreArchive(zip);
  assert((report.imported_templates == std::vector<std::string>{"email_template_owner", "email_template_guest"}));

  assert(ReadOption(*repo, "email_template_owner") == "<p>owner</p>");
  assert(ReadOption(*repo, "email_template_guest") == "<p>guest</p>");
  assert(!ReadOption(*repo, "email_template_newsletter").has_value());
}

void TestUnreadableTemplateIsSkipped() {
  auto repo    = MakeSqliteRepository();
  auto entries = MakeEntries({{"backup_data/assets/email-template/owner.template.ejs", ""}});
  entries[0].error = "crc mismatch";

  auto        tx = repo->Begin();
  OptionStore store(*repo, *tx);
  assert(quire::backup::ImportLegacyEmailTemplates(entries, store).empty());
  assert(!store.Get("email_template_owner").has_value());
  tx->Rollback();
}

void TestLegacyDocumentPrimitives() {
  auto repo = MakeSqliteRepository();

  legacy::ObjectId category_id;
  legacy::ObjectId post_id;
  for (std::size_t i = 0; i < 12; ++i) {
    category_id.bytes[i] = static_cast<uint8_t>(0xc0 + i);
    post_id.bytes[i]     = static_cast<uint8_t>(0x10 + i);
  }

  model::Row category;
  category["_id"]     = model::Value{model::LegacyValue{category_id}};
  category["name"]    = model::Value{"Tech"};
  category["slug"]    = model::Value{"tech"};
  category["created"] = model::Value{model::LegacyValue{legacy::DateTime{1704164645000}}};
  category["__v"]     = model::Value{0};

  model::Map counts;
  counts["read"] = model::Value{5};
  counts["like"] = model::Value{2};

  model::Row post;
  post["_id"]         = model::Value{model::LegacyValue{post_id}};
  post["title"]       = model::Value{"Hello"};
  post["slug"]        = model::Value{"hello"};
  post["categoryId"]  = model::Value{model::LegacyValue{category_id}};
  post["createdAt"]   = model::Value{model::LegacyValue{legacy::DateTime{1704164645000}}};
  post["modified"]    = model::Value{model::LegacyValue{legacy::DateTime{1704164645000}}};
  post["deletedAt"]   = model::Value{model::LegacyValue{legacy::Undefined{}}};
  post["count"]       = model::Value{counts};
  post["isPublished"] = model::Value{true};
  post["tags"]        = model::Value{model::List{model::Value{"a"}, model::Value{"b"}}};
  post["__v"]         = model::Value{3};

  const auto zip = MakeZip({
      {"backup_data/categories.bson", quire::codec::EncodeBsonRows({category})},
      {"backup_data/posts.bson", quire::codec::EncodeBsonRows({post})},
  });

  RestoreOrchestrator orchestrator(*repo);
  orchestrator.RestoreArchive(zip);

  const auto posts = repo->SelectAll("posts");
  assert(posts.size() == 1);
  const auto& row = posts[0];
  assert(TextField(row, "id") == "101112131415161718191a1b");
  assert(TextField(row, "category_id") == "c0c1c2c3c4c5c6c7c8c9cacb");
  assert(TextField(row, "created_at") == "2024-01-02 03:04:05");
  assert(row.at("updated_at").IsNull());
  assert(row.at("deleted_at").IsNull());
  assert(row.at("read_count") == model::Value{5});
  assert(row.at("like_count") == model::Value{2});
  assert(row.at("is_published") == model::Value{1});

  const auto tags = quire::codec::ParseJson(TextField(row, "tags"));
  assert(tags.has_value());
  assert(quire::codec::FromProtoValue(*tags) == (model::Value{model::List{model::Value{"a"}, model::Value{"b"}}}));

  const auto categories = repo->SelectAll("categories");
  assert(categories.size() == 1);
  assert(TextField(categories[0], "created_at") == "2024-01-02 03:04:05");
}

} // namespace

int main() {
  TestLegacyOptionsFoldIntoConfigs();
  TestNoLegacyRowsWritesNothing();
  TestNonObjectConfigsStartsFromDefaults();
  TestLastNameWinsPerSection();
  TestEmailTemplatesAreImported();
  TestUnreadableTemplateIsSkipped();
  TestLegacyDocumentPrimitives();

  std::cout << "quire_integration_legacy_restore: pass\n";
  return 0;
}

#else

int main() {
  std::cout << "quire_integration_legacy_restore: skipped (sqlite backend disabled)\n";
  return 0;
}

#endif
