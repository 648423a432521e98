#include <algorithm>
#include <cassert>
#include <iostream>
#include <map>
#include <string>
#include <vector>

#include "internal/archive/zip_archive.hpp"
#include "internal/backup/export_pipeline.hpp"
#include "internal/backup/restore_orchestrator.hpp"
#include "internal/backup/table_registry.hpp"
#include "internal/codec/json_value.hpp"
#include "internal/codec/row_codec.hpp"
#include "internal/util/time.hpp"
#include "support/sqlite_fixture.hpp"

#if QUIRE_DB_SQLITE

namespace {

namespace model = quire::db::model;
using quire::testing::CountRows;
using quire::testing::MakeSqliteRepository;
using quire::testing::TextField;

// 2024-01-02T03:04:05Z
const auto kNow = quire::util::FromUnixSeconds(1704164645);

void Seed(quire::db::Repository& repo) {
  auto tx = repo.Begin();

  model::Row category;
  category["id"]         = model::Value{"c1"};
  category["name"]       = model::Value{"Tech"};
  category["slug"]       = model::Value{"tech"};
  category["created_at"] = model::Value{quire::util::FromUnixSeconds(1700000000)};
  assert(repo.Insert(*tx, "categories", category));

  for (int i = 0; i < 2; ++i) {
    model::Row post;
    post["id"]          = model::Value{"p" + std::to_string(i)};
    post["title"]       = model::Value{"Post " + std::to_string(i)};
    post["slug"]        = model::Value{"post-" + std::to_string(i)};
    post["text"]        = model::Value{"body"};
    post["tags"]        = model::Value{R"(["c++","db"])"};
    post["category_id"] = model::Value{"c1"};
    post["read_count"]  = model::Value{10 + i};
    post["created_at"]  = model::Value{quire::util::FromUnixMillis(1704164645123 + i)};
    assert(repo.Insert(*tx, "posts", post));
  }

  model::Row option;
  option["name"]  = model::Value{"configs"};
  option["value"] = model::Value{R"({"seo":{"title":"Mine"}})"};
  assert(repo.Insert(*tx, "options", option));

  tx->Commit();
}

std::map<std::string, std::string> EntriesByName(const std::string& archive) {
  std::map<std::string, std::string> out;
  for (const auto& entry : quire::archive::ReadZipArchive(archive)) {
    assert(entry.Readable());
    out[entry.name] = entry.data;
  }
  return out;
}

void TestExportWritesEveryTable() {
  auto repo = MakeSqliteRepository();
  Seed(*repo);

  quire::backup::ExportPipeline pipeline(*repo);
  const auto                    result = pipeline.Export(kNow);

  const auto& tables = quire::backup::CanonicalTables();
  assert(result.tables == tables);
  assert(result.skipped.empty());

  const auto entries = EntriesByName(result.archive);
  assert(entries.size() == tables.size() + 1);
  for (const auto& table : tables) {
    assert(entries.count(quire::backup::TableEntryPath(table)) == 1);
  }

  assert(entries.at("quire/db/comments.bson").empty() && "empty tables still get an entry");

  const auto posts = quire::codec::DecodeBsonRows(entries.at("quire/db/posts.bson"));
  assert(posts.size() == 2);
  assert(TextField(posts[0], "title") == "Post 0" || TextField(posts[1], "title") == "Post 0");
}

void TestMissingTableIsSkipped() {
  auto repo = MakeSqliteRepository();
  Seed(*repo);
  {
    auto tx = repo->Begin();
    assert(repo->Exec(*tx, "DROP TABLE comments;"));
    tx->Commit();
  }

  quire::backup::ExportPipeline pipeline(*repo);
  const auto                    result = pipeline.Export(kNow);

  assert(result.skipped == std::vector<std::string>{"comments"});
  assert(result.tables.size() == quire::backup::CanonicalTables().size() - 1);
  assert(std::find(result.tables.begin(), result.tables.end(), "comments") == result.tables.end());

  const auto entries = EntriesByName(result.archive);
  assert(entries.count("quire/db/comments.bson") == 0);
  assert(entries.count("quire/db/posts.bson") == 1);

  const auto parsed = quire::codec::ParseJson(entries.at(quire::backup::kManifestPath));
  assert(parsed.has_value());
  const auto  value  = quire::codec::FromProtoValue(*parsed);
  const auto* listed = value.As<model::Map>()->at("tables").As<model::List>();
  assert(listed != nullptr && listed->size() == result.tables.size());
  for (const auto& table : *listed) assert(!(table == model::Value{"comments"}));
}

void TestManifest() {
  auto repo = MakeSqliteRepository();

  quire::backup::ExportPipeline pipeline(*repo);
  const auto                    result  = pipeline.Export(kNow);
  const auto                    entries = EntriesByName(result.archive);

  const auto parsed = quire::codec::ParseJson(entries.at(quire::backup::kManifestPath));
  assert(parsed.has_value());
  const auto  value    = quire::codec::FromProtoValue(*parsed);
  const auto* manifest = value.As<model::Map>();
  assert(manifest != nullptr);
  assert(manifest->at("format") == model::Value{"quire-bson"});
  assert(manifest->at("version") == model::Value{1});
  assert(manifest->at("engine") == model::Value{"sqlite"});
  assert(manifest->at("created_at") == model::Value{"2024-01-02T03:04:05Z"});
  const auto* listed = manifest->at("tables").As<model::List>();
  assert(listed != nullptr && listed->size() == quire::backup::CanonicalTables().size());

  const auto empty = quire::backup::RenderManifestJson(quire::backup::BuildManifest("postgres", kNow, {}));
  assert(empty.find("\"tables\":[]") != std::string::npos);
}

void TestExportThenRestoreIntoFreshDatabase() {
  auto source = MakeSqliteRepository();
  Seed(*source);
  quire::backup::ExportPipeline pipeline(*source);
  const auto                    archive = pipeline.Export(kNow).archive;

  auto target = MakeSqliteRepository();
  {
    // stale rows in the target are replaced
    auto       tx = target->Begin();
    model::Row stale;
    stale["id"]    = model::Value{"old"};
    stale["title"] = model::Value{"Old"};
    stale["slug"]  = model::Value{"old"};
    assert(target->Insert(*tx, "posts", stale));
    tx->Commit();
  }

  quire::backup::RestoreOrchestrator orchestrator(*target);
  const auto                         report = orchestrator.RestoreArchive(archive);
  assert(orchestrator.State() == quire::backup::RestoreState::Committed);
  assert(report.tables.size() == quire::backup::CanonicalTables().size());

  assert(CountRows(*target, "categories") == 1);
  assert(CountRows(*target, "posts") == 2);
  assert(CountRows(*target, "options") == 1);

  for (const auto& row : target->SelectAll("posts")) {
    assert(TextField(row, "id") != "old");
    assert(TextField(row, "tags") == R"(["c++","db"])");
    assert(TextField(row, "category_id") == "c1");
    assert(row.at("updated_at").IsNull());
  }
  std::map<std::string, std::string> created;
  for (const auto& row : target->SelectAll("posts")) created[TextField(row, "id")] = TextField(row, "created_at");
  assert(created.size() == 2);
  assert(created.at("p0") == "2024-01-02 03:04:05.123");
  assert(created.at("p1") == "2024-01-02 03:04:05.124");

  const auto category = target->SelectAll("categories").at(0);
  assert(TextField(category, "created_at") == quire::util::FormatSqlTimestamp(quire::util::FromUnixSeconds(1700000000)));

  const auto option = target->SelectAll("options").at(0);
  assert(TextField(option, "value") == R"({"seo":{"title":"Mine"}})");

  // a second restore replaces rather than accumulates
  orchestrator.RestoreArchive(archive);
  assert(CountRows(*target, "categories") == 1);
  assert(CountRows(*target, "posts") == 2);
  assert(CountRows(*target, "options") == 1);
}

} // namespace

int main() {
  TestExportWritesEveryTable();
  TestMissingTableIsSkipped();
  TestManifest();
  TestExportThenRestoreIntoFreshDatabase();

  std::cout << "quire_integration_export_pipeline: pass\n";
  return 0;
}

#else

int main() {
  std::cout << "quire_integration_export_pipeline: skipped (sqlite backend disabled)\n";
  return 0;
}

#endif
