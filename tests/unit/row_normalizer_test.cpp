#include "internal/backup/row_normalizer.hpp"

#include <cassert>
#include <cstdint>
#include <iostream>
#include <string>

#include "internal/codec/json_value.hpp"
#include "internal/util/time.hpp"

namespace {

namespace model  = quire::db::model;
namespace legacy = quire::db::model::legacy;
using namespace quire::backup;

ColumnMap PostColumns() {
  return {
      {"id", ColumnCategory::TextLike},          {"created_at", ColumnCategory::TimeLike},
      {"updated_at", ColumnCategory::TimeLike},  {"deleted_at", ColumnCategory::TimeLike},
      {"title", ColumnCategory::TextLike},       {"slug", ColumnCategory::TextLike},
      {"tags", ColumnCategory::JsonLike},        {"category_id", ColumnCategory::TextLike},
      {"read_count", ColumnCategory::Opaque},    {"like_count", ColumnCategory::Opaque},
      {"is_published", ColumnCategory::Opaque},  {"pin_order", ColumnCategory::Opaque},
  };
}

void TestColumnNames() {
  assert(NormalizeColumnName("posts", "_id") == "id");
  assert(NormalizeColumnName("posts", "createdAt") == "created_at");
  assert(NormalizeColumnName("posts", "created") == "created_at");
  assert(NormalizeColumnName("posts", "modified") == "updated_at");
  assert(NormalizeColumnName("posts", "categoryId") == "category_id");
  assert(NormalizeColumnName("posts", "isPublished") == "is_published");
  assert(NormalizeColumnName("notes", "password") == "password_hash");
  assert(NormalizeColumnName("users", "password") == "password");
  assert(NormalizeColumnName("posts", "__v").empty());
  assert(NormalizeColumnName("posts", "  ").empty());
  assert(NormalizeColumnName("options", "_id").empty() && "options keeps its own ids");
}

void TestCoerceTime() {
  const auto expected = quire::util::FromUnixSeconds(1704164645);

  assert(CoerceTime(model::Value{expected}) == expected);
  assert(CoerceTime(model::Value{int64_t{1704164645}}) == expected);
  assert(CoerceTime(model::Value{int64_t{1704164645000}}) == expected);
  assert(CoerceTime(model::Value{1704164645.0}) == expected);
  assert(CoerceTime(model::Value{"2024-01-02T03:04:05Z"}) == expected);
  assert(CoerceTime(model::Value{"2024-01-02 03:04:05"}) == expected);
  assert(CoerceTime(model::Value{" 1704164645 "}) == expected);
  assert(CoerceTime(model::Value{model::LegacyValue{legacy::DateTime{1704164645000}}}) == expected);

  assert(!CoerceTime(model::Value{"soon"}));
  assert(!CoerceTime(model::Value{int64_t{42}}));
  assert(!CoerceTime(model::Value{true}));
}

void TestZeroLikeTimes() {
  assert(IsZeroLikeTime(model::Value{0}));
  assert(IsZeroLikeTime(model::Value{0.0}));
  assert(IsZeroLikeTime(model::Value{""}));
  assert(IsZeroLikeTime(model::Value{"0"}));
  assert(IsZeroLikeTime(model::Value{"NULL"}));
  assert(IsZeroLikeTime(model::Value{"0000-00-00"}));
  assert(IsZeroLikeTime(model::Value{"0000-00-00 00:00:00"}));
  assert(IsZeroLikeTime(model::Value{model::TimePoint{}}));
  assert(!IsZeroLikeTime(model::Value{"garbage"}));
  assert(!IsZeroLikeTime(model::Value{7}));
}

void TestTimeColumns() {
  auto zero = NormalizeValue("posts", "deleted_at", model::Value{"0000-00-00 00:00:00"}, ColumnCategory::TimeLike);
  assert(zero && zero->IsNull());

  auto garbage = NormalizeValue("posts", "deleted_at", model::Value{"garbage"}, ColumnCategory::TimeLike);
  assert(!garbage && "unparseable times are dropped");

  auto modified = NormalizeValue("posts", "updated_at", model::Value{"garbage"}, ColumnCategory::TimeLike);
  assert(modified && modified->IsNull());

  auto parsed = NormalizeValue("posts", "created_at", model::Value{int64_t{1704164645}}, ColumnCategory::TimeLike);
  assert(parsed && *parsed == model::Value{quire::util::FromUnixSeconds(1704164645)});
}

void TestFarFutureTimes() {
  auto far = NormalizeValue("posts", "created_at", model::Value{"2300-01-01"}, ColumnCategory::TimeLike);
  assert(far && far->As<model::TimePoint>() != nullptr);
  assert(quire::util::FormatSqlTimestamp(*far->As<model::TimePoint>()) == "2300-01-01 00:00:00");

  auto last = NormalizeValue("posts", "created_at", model::Value{"9999-12-31 23:59:59"}, ColumnCategory::TimeLike);
  assert(last && last->As<model::TimePoint>() != nullptr);
  assert(quire::util::FormatSqlTimestamp(*last->As<model::TimePoint>()) == "9999-12-31 23:59:59");

  auto seconds = NormalizeValue("posts", "created_at", model::Value{int64_t{9999999999}}, ColumnCategory::TimeLike);
  assert(seconds && *seconds == model::Value{quire::util::FromUnixSeconds(9999999999)});

  auto huge = NormalizeValue("posts", "created_at", model::Value{1e300}, ColumnCategory::TimeLike);
  assert(!huge && "out-of-range epoch numbers are dropped");

  legacy::DateTime overflow;
  overflow.millis = INT64_MAX;
  auto legacy_far = NormalizeValue("posts", "created_at", model::Value{model::LegacyValue{overflow}}, ColumnCategory::TimeLike);
  assert(legacy_far && legacy_far->IsNull());
}

void TestStructuredValues() {
  model::List tags{model::Value{"c++"}, model::Value{"db"}};

  auto json = NormalizeValue("posts", "tags", model::Value{tags}, ColumnCategory::JsonLike);
  assert(json && json->Kind() == model::ValueKind::Text);
  const auto reparsed = quire::codec::ParseJson(*json->As<std::string>());
  assert(reparsed && quire::codec::FromProtoValue(*reparsed) == model::Value{tags});

  auto opaque = NormalizeValue("posts", "read_count", model::Value{tags}, ColumnCategory::Opaque);
  assert(!opaque && "structured values only fit textual columns");

  auto bytes = NormalizeValue("posts", "title", model::Value{model::Bytes{'h', 'i'}}, ColumnCategory::TextLike);
  assert(bytes && *bytes == model::Value{"hi"});

  auto blob = NormalizeValue("authn_credentials", "credential_id", model::Value{model::Bytes{1, 2}},
                             ColumnCategory::Opaque);
  assert((blob && *blob == model::Value{model::Bytes{1, 2}}));
}

void TestRefTypes() {
  auto ref = NormalizeValue("comments", "ref_type", model::Value{"Posts"}, ColumnCategory::TextLike);
  assert(ref && *ref == model::Value{"post"});

  auto tracker = NormalizeValue("slug_trackers", "type", model::Value{"Notes"}, ColumnCategory::TextLike);
  assert(tracker && *tracker == model::Value{"note"});

  auto other = NormalizeValue("posts", "title", model::Value{"Posts"}, ColumnCategory::TextLike);
  assert(other && *other == model::Value{"Posts"});
}

void TestNormalizeRow() {
  legacy::ObjectId oid;
  oid.bytes.fill(0x01);

  model::Map counts;
  counts["read"]  = model::Value{10};
  counts["likes"] = model::Value{3};

  model::Row raw;
  raw["_id"]         = model::Value{model::LegacyValue{oid}};
  raw["__v"]         = model::Value{0};
  raw["title"]       = model::Value{"Hello"};
  raw["slug"]        = model::Value{"hello"};
  raw["createdAt"]   = model::Value{"2024-01-02T03:04:05Z"};
  raw["updatedAt"]   = model::Value{"2024-01-02T03:04:05Z"};
  raw["count"]       = model::Value{counts};
  raw["unknownField"] = model::Value{"ignored"};

  const auto row = NormalizeRow("posts", raw, PostColumns());
  assert(row.has_value());
  assert(row->at("id") == model::Value{"010101010101010101010101"});
  assert(row->at("title") == model::Value{"Hello"});
  assert(row->at("created_at") == model::Value{quire::util::FromUnixSeconds(1704164645)});
  assert(row->at("updated_at").IsNull() && "modification time is reset");
  assert(row->at("read_count") == model::Value{10});
  assert(row->at("like_count") == model::Value{3});
  assert(row->count("__v") == 0);
  assert(row->count("unknown_field") == 0);
  assert(row->count("count") == 0);
}

void TestEmptyRowsAreDropped() {
  assert(!NormalizeRow("posts", model::Row{}, PostColumns()));

  model::Row only_unknown;
  only_unknown["nothing"] = model::Value{"here"};
  only_unknown["__v"]     = model::Value{1};
  assert(!NormalizeRow("posts", only_unknown, PostColumns()));
}

} // namespace

int main() {
  TestColumnNames();
  TestCoerceTime();
  TestZeroLikeTimes();
  TestTimeColumns();
  TestFarFutureTimes();
  TestStructuredValues();
  TestRefTypes();
  TestNormalizeRow();
  TestEmptyRowsAreDropped();

  std::cout << "quire_unit_row_normalizer: pass\n";
  return 0;
}
