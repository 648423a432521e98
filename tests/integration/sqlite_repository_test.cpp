#include <cassert>
#include <iostream>
#include <string>

#include "internal/backup/column_metadata.hpp"
#include "internal/backup/table_registry.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "support/sqlite_fixture.hpp"

#if QUIRE_DB_SQLITE

namespace {

namespace model = quire::db::model;
using quire::db::ErrorCode;
using quire::testing::CountRows;
using quire::testing::MakeSqliteRepository;
using quire::testing::TextField;

model::Row Category(const std::string& id, const std::string& slug) {
  model::Row row;
  row["id"]   = model::Value{id};
  row["name"] = model::Value{"name-" + slug};
  row["slug"] = model::Value{slug};
  return row;
}

void TestSchemaCoversEveryCanonicalTable() {
  auto repo = MakeSqliteRepository();
  quire::factory::BootstrapSchema(*repo); // idempotent

  auto tx = repo->Begin();
  for (const auto& table : quire::backup::CanonicalTables()) {
    const auto columns = quire::backup::LoadColumns(*repo, *tx, table);
    assert(!columns.empty());
    if (table != "options") {
      assert(columns.at("created_at") == quire::backup::ColumnCategory::TimeLike);
      assert(columns.at("id") == quire::backup::ColumnCategory::TextLike);
    }
  }

  const auto posts = quire::backup::LoadColumns(*repo, *tx, "posts");
  assert(posts.at("tags") == quire::backup::ColumnCategory::JsonLike);
  assert(posts.at("read_count") == quire::backup::ColumnCategory::Opaque);
  tx->Rollback();

  assert(repo->Dialect() == "sqlite");
  assert(repo->SupportsDeferredForeignKeys());
}

void TestMissingTableFailsIntrospection() {
  auto repo = MakeSqliteRepository();
  auto tx   = repo->Begin();
  bool threw = false;
  try {
    repo->ListColumns(*tx, "no_such_table");
  } catch (const quire::util::SchemaIntrospectionError&) {
    threw = true;
  }
  assert(threw);
}

void TestInsertSelectAndTimes() {
  auto repo = MakeSqliteRepository();
  auto tx   = repo->Begin();

  auto row          = Category("c1", "tech");
  row["created_at"] = model::Value{quire::util::FromUnixMillis(1704164645123)};
  row["type"]       = model::Value{1};
  assert(repo->Insert(*tx, "categories", row));
  tx->Commit();

  const auto rows = repo->SelectAll("categories");
  assert(rows.size() == 1);
  assert(TextField(rows[0], "slug") == "tech");
  assert(TextField(rows[0], "created_at") == "2024-01-02 03:04:05.123");
  assert(rows[0].at("type") == model::Value{1});
  assert(rows[0].at("updated_at").IsNull());
}

void TestErrorClassification() {
  auto repo = MakeSqliteRepository();
  auto tx   = repo->Begin();

  assert(repo->Insert(*tx, "categories", Category("c1", "tech")));

  auto dup_pk = repo->Insert(*tx, "categories", Category("c1", "other"));
  assert(dup_pk.code == ErrorCode::ConstraintViolation);

  auto dup_slug = repo->Insert(*tx, "categories", Category("c2", "tech"));
  assert(dup_slug.code == ErrorCode::ConstraintViolation);

  model::Row missing_name;
  missing_name["id"]   = model::Value{"c3"};
  missing_name["slug"] = model::Value{"empty"};
  auto not_null        = repo->Insert(*tx, "categories", missing_name);
  assert(not_null.code == ErrorCode::IntegrityViolation);

  auto unbindable    = Category("c4", "list");
  unbindable["name"] = model::Value{model::List{model::Value{"x"}}};
  auto unsupported   = repo->Insert(*tx, "categories", unbindable);
  assert(unsupported.code == ErrorCode::Unsupported);
  tx->Rollback();
}

void TestRollbackDiscardsDeletes() {
  auto repo = MakeSqliteRepository();
  {
    auto tx = repo->Begin();
    assert(repo->Insert(*tx, "categories", Category("c1", "a")));
    assert(repo->Insert(*tx, "categories", Category("c2", "b")));
    tx->Commit();
  }
  {
    auto tx = repo->Begin();
    assert(repo->DeleteWhere(*tx, "categories", "slug", model::Value{"a"}));
    assert(repo->SelectAll(*tx, "categories").size() == 1);
    assert(repo->DeleteAll(*tx, "categories"));
    assert(repo->SelectAll(*tx, "categories").empty());
    tx->Rollback();
  }
  assert(CountRows(*repo, "categories") == 2);

  {
    // destructor rolls back an unfinished transaction
    auto tx = repo->Begin();
    assert(repo->DeleteAll(*tx, "categories"));
  }
  assert(CountRows(*repo, "categories") == 2);
}

void TestDeferredForeignKeys() {
  auto repo = MakeSqliteRepository();

  model::Row post;
  post["id"]          = model::Value{"p1"};
  post["title"]       = model::Value{"t"};
  post["slug"]        = model::Value{"s"};
  post["category_id"] = model::Value{"c1"};

  {
    auto tx = repo->Begin();
    auto r  = repo->Insert(*tx, "posts", post);
    assert(r.code == ErrorCode::IntegrityViolation && "immediate checks reject a dangling reference");
    tx->Rollback();
  }
  {
    auto tx = repo->Begin();
    assert(repo->SetForeignKeyChecks(*tx, false));
    assert(repo->Insert(*tx, "posts", post));
    assert(repo->Insert(*tx, "categories", Category("c1", "tech")));
    assert(repo->SetForeignKeyChecks(*tx, true));
    tx->Commit();
  }
  assert(CountRows(*repo, "posts") == 1);
}

} // namespace

int main() {
  TestSchemaCoversEveryCanonicalTable();
  TestMissingTableFailsIntrospection();
  TestInsertSelectAndTimes();
  TestErrorClassification();
  TestRollbackDiscardsDeletes();
  TestDeferredForeignKeys();

  std::cout << "quire_integration_sqlite_repository: pass\n";
  return 0;
}

#else

int main() {
  std::cout << "quire_integration_sqlite_repository: skipped (sqlite backend disabled)\n";
  return 0;
}

#endif
