#include "internal/codec/bson_document.hpp"

#include <cassert>
#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace {

namespace model  = quire::db::model;
namespace legacy = quire::db::model::legacy;

using quire::codec::AppendBsonDocument;

std::string LE32(uint32_t v) {
  std::string out;
  for (int i = 0; i < 4; ++i) out.push_back(static_cast<char>((v >> (8 * i)) & 0xFF));
  return out;
}

std::string LE64(uint64_t v) {
  std::string out;
  for (int i = 0; i < 8; ++i) out.push_back(static_cast<char>((v >> (8 * i)) & 0xFF));
  return out;
}

std::string BsonString(const std::string& s) {
  return LE32(static_cast<uint32_t>(s.size() + 1)) + s + std::string(1, '\0');
}

// Hand-assembled document for element types the encoder never writes.
class DocBuilder {
 public:
  DocBuilder& Element(uint8_t type, const std::string& key, const std::string& payload) {
    body_.push_back(static_cast<char>(type));
    body_ += key;
    body_.push_back('\0');
    body_ += payload;
    return *this;
  }

  std::string Build() const {
    std::string out = LE32(static_cast<uint32_t>(body_.size() + 5));
    out += body_;
    out.push_back('\0');
    return out;
  }

 private:
  std::string body_;
};

model::Row Decode(const std::string& doc) {
  return quire::codec::DecodeBsonDocument(reinterpret_cast<const uint8_t*>(doc.data()), doc.size());
}

bool DecodeFails(const std::string& doc) {
  try {
    Decode(doc);
  } catch (const quire::util::DecodeError&) {
    return true;
  }
  return false;
}

void TestNativeKindsRoundTrip() {
  const auto when = quire::util::FromUnixMillis(1704164645123);

  model::Map nested;
  nested["enable"] = model::Value{true};

  model::Row row;
  row["null"]   = model::Value{};
  row["flag"]   = model::Value{false};
  row["count"]  = model::Value{int64_t{1} << 40};
  row["ratio"]  = model::Value{0.25};
  row["title"]  = model::Value{"hello"};
  row["blob"]   = model::Value{model::Bytes{0x00, 0xff, 0x10}};
  row["at"]     = model::Value{when};
  row["tags"]   = model::Value{model::List{model::Value{"a"}, model::Value{"b"}}};
  row["config"] = model::Value{nested};

  std::string doc;
  AppendBsonDocument(row, doc);
  const auto out = Decode(doc);

  assert(out.size() == row.size());
  assert(out.at("null").IsNull());
  assert(out.at("flag") == model::Value{false});
  assert(out.at("count") == model::Value{int64_t{1} << 40});
  assert(out.at("ratio") == model::Value{0.25});
  assert(out.at("title") == model::Value{"hello"});
  assert(out.at("tags") == row.at("tags"));
  assert(out.at("config") == row.at("config"));

  // binary and datetime come back as legacy primitives; Normalize restores them
  assert(out.at("blob").Kind() == model::ValueKind::Legacy);
  assert(model::Normalize(out.at("blob")) == row.at("blob"));
  assert(out.at("at").Kind() == model::ValueKind::Legacy);
  assert(model::Normalize(out.at("at")) == model::Value{when});
}

void TestLegacyElementTypes() {
  std::string oid_bytes;
  for (int i = 0; i < 12; ++i) oid_bytes.push_back(static_cast<char>(0xa0 + i));

  const std::string old_binary = LE32(4 + 3) + std::string(1, '\x02') + LE32(3) + "xyz";

  const auto doc = DocBuilder()
                       .Element(0x10, "n", LE32(42))
                       .Element(0x07, "_id", oid_bytes)
                       .Element(0x06, "undef", "")
                       .Element(0xFF, "min", "")
                       .Element(0x7F, "max", "")
                       .Element(0x11, "ts", LE64((uint64_t{1704164645} << 32) | 7))
                       .Element(0x05, "old", old_binary)
                       .Element(0x0E, "sym", BsonString("symbol"))
                       .Element(0x0B, "re", std::string("^x$") + '\0' + "i" + '\0')
                       .Build();

  const auto row = Decode(doc);
  assert(row.at("n") == model::Value{int64_t{42}});

  const auto* oid = std::get_if<legacy::ObjectId>(row.at("_id").As<model::LegacyValue>());
  assert(oid != nullptr && oid->bytes[0] == 0xa0 && oid->bytes[11] == 0xab);
  assert(model::Normalize(row.at("_id")) == model::Value{"a0a1a2a3a4a5a6a7a8a9aaab"});

  assert(model::Normalize(row.at("undef")).IsNull());
  assert(model::Normalize(row.at("min")).IsNull());
  assert(model::Normalize(row.at("max")).IsNull());

  const auto* ts = std::get_if<legacy::Timestamp>(row.at("ts").As<model::LegacyValue>());
  assert(ts != nullptr && ts->seconds == 1704164645u && ts->increment == 7u);

  const auto* bin = std::get_if<legacy::Binary>(row.at("old").As<model::LegacyValue>());
  assert(bin != nullptr && bin->subtype == 2);
  assert((bin->data == model::Bytes{'x', 'y', 'z'}) && "old binary subtype drops its inner length");

  assert(model::Normalize(row.at("sym")) == model::Value{"symbol"});
  assert(model::Normalize(row.at("re")) == model::Value{"^x$"});
}

void TestMalformedDocuments() {
  std::string valid;
  model::Row  row;
  row["a"] = model::Value{1};
  AppendBsonDocument(row, valid);
  assert(!DecodeFails(valid));

  assert(DecodeFails(valid + "x") && "declared length must match the span");
  assert(DecodeFails(valid.substr(0, valid.size() - 1)));
  assert(DecodeFails(""));

  assert(DecodeFails(DocBuilder().Element(0x08, "b", std::string(1, '\x02')).Build()));
  assert(DecodeFails(DocBuilder().Element(0x02, "s", LE32(100) + "ab" + '\0').Build()));

  try {
    Decode(DocBuilder().Element(0x14, "x", "").Build());
    assert(false && "unknown element type must fail");
  } catch (const quire::util::DecodeError& e) {
    assert(std::string(e.what()).find("0x14") != std::string::npos);
  }
}

void TestNulInKeyIsRejected() {
  model::Row row;
  row[std::string("a\0b", 3)] = model::Value{1};
  std::string out;
  bool        threw = false;
  try {
    AppendBsonDocument(row, out);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestNativeKindsRoundTrip();
  TestLegacyElementTypes();
  TestMalformedDocuments();
  TestNulInKeyIsRejected();

  std::cout << "quire_unit_bson_document: pass\n";
  return 0;
}
