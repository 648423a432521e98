#include "internal/codec/bson_document.hpp"

#include <bson/bson.h>

#include <algorithm>
#include <cstdio>
#include <iterator>
#include <stdexcept>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace quire::codec {

namespace {

constexpr int kMaxDepth = 100;

// ------------------------------------------------------------------
// Decode
// ------------------------------------------------------------------

struct Corruption {
  bool     corrupt     = false;
  bool     unsupported = false;
  uint32_t type_code   = 0;
};

void OnCorrupt(const bson_iter_t*, void* data) {
  static_cast<Corruption*>(data)->corrupt = true;
}

void OnUnsupportedType(const bson_iter_t*, const char*, uint32_t type_code, void* data) {
  auto* c        = static_cast<Corruption*>(data);
  c->unsupported = true;
  c->type_code   = type_code;
}

// Walks the top level of `doc` once so a corrupt element surfaces as an
// error instead of silently ending iteration.
void CheckElements(const bson_t& doc) {
  bson_visitor_t visitor{};
  visitor.visit_corrupt          = OnCorrupt;
  visitor.visit_unsupported_type = OnUnsupportedType;

  Corruption  result;
  bson_iter_t iter;
  if (!bson_iter_init(&iter, &doc)) {
    throw util::DecodeError("bson: cannot iterate document");
  }
  bson_iter_visit_all(&iter, &visitor, &result);

  if (result.unsupported) {
    char hex[8];
    std::snprintf(hex, sizeof(hex), "0x%02x", static_cast<unsigned>(result.type_code));
    throw util::DecodeError(std::string("bson: unknown element type ") + hex);
  }
  if (result.corrupt) {
    throw util::DecodeError("bson: corrupt element at offset " + std::to_string(iter.err_off));
  }
}

void InitStatic(bson_t* doc, const std::uint8_t* data, std::size_t size) {
  if (!bson_init_static(doc, data, size)) {
    throw util::DecodeError("bson: document length does not match payload of " + std::to_string(size) + " bytes");
  }
}

model::legacy::ObjectId ToObjectId(const bson_oid_t* oid) {
  model::legacy::ObjectId out;
  std::copy(std::begin(oid->bytes), std::end(oid->bytes), out.bytes.begin());
  return out;
}

std::string Utf8(const char* data, uint32_t len) {
  return std::string(data, len);
}

model::Map ReadDocument(const bson_iter_t& iter, int depth);
model::List ReadArray(const bson_iter_t& iter, int depth);

model::Value ReadElementValue(const bson_iter_t& iter, int depth) {
  switch (bson_iter_type(&iter)) {
    case BSON_TYPE_DOUBLE:
      return model::Value{bson_iter_double(&iter)};
    case BSON_TYPE_UTF8: {
      uint32_t    len  = 0;
      const char* text = bson_iter_utf8(&iter, &len);
      return model::Value{Utf8(text, len)};
    }
    case BSON_TYPE_DOCUMENT:
      return model::Value{ReadDocument(iter, depth + 1)};
    case BSON_TYPE_ARRAY:
      return model::Value{ReadArray(iter, depth + 1)};
    case BSON_TYPE_BINARY: {
      bson_subtype_t subtype = BSON_SUBTYPE_BINARY;
      uint32_t       len     = 0;
      const uint8_t* bytes   = nullptr;
      // libbson strips the inner length of the deprecated subtype 0x02
      bson_iter_binary(&iter, &subtype, &len, &bytes);
      model::Bytes data;
      if (len > 0) data.assign(bytes, bytes + len);
      return model::Value{model::LegacyValue{model::legacy::Binary{static_cast<uint8_t>(subtype), std::move(data)}}};
    }
    case BSON_TYPE_UNDEFINED:
      return model::Value{model::LegacyValue{model::legacy::Undefined{}}};
    case BSON_TYPE_OID:
      return model::Value{model::LegacyValue{ToObjectId(bson_iter_oid(&iter))}};
    case BSON_TYPE_BOOL:
      return model::Value{bson_iter_bool(&iter)};
    case BSON_TYPE_DATE_TIME:
      return model::Value{model::LegacyValue{model::legacy::DateTime{bson_iter_date_time(&iter)}}};
    case BSON_TYPE_NULL:
      return model::Value{};
    case BSON_TYPE_REGEX: {
      const char*          options = nullptr;
      model::legacy::Regex re;
      re.pattern = bson_iter_regex(&iter, &options);
      re.options = options != nullptr ? options : "";
      return model::Value{model::LegacyValue{std::move(re)}};
    }
    case BSON_TYPE_DBPOINTER: {
      uint32_t          collection_len = 0;
      const char*       collection     = nullptr;
      const bson_oid_t* oid            = nullptr;
      bson_iter_dbpointer(&iter, &collection_len, &collection, &oid);
      if (oid == nullptr) throw util::DecodeError("bson: dbpointer without id");
      return model::Value{model::LegacyValue{ToObjectId(oid)}};
    }
    case BSON_TYPE_CODE: {
      uint32_t    len  = 0;
      const char* code = bson_iter_code(&iter, &len);
      return model::Value{model::LegacyValue{model::legacy::JavaScript{Utf8(code, len)}}};
    }
    case BSON_TYPE_SYMBOL: {
      uint32_t    len    = 0;
      const char* symbol = bson_iter_symbol(&iter, &len);
      return model::Value{model::LegacyValue{model::legacy::Symbol{Utf8(symbol, len)}}};
    }
    case BSON_TYPE_CODEWSCOPE: {
      uint32_t       len       = 0;
      uint32_t       scope_len = 0;
      const uint8_t* scope     = nullptr;
      // scope is dropped
      const char* code = bson_iter_codewscope(&iter, &len, &scope_len, &scope);
      return model::Value{model::LegacyValue{model::legacy::JavaScript{Utf8(code, len)}}};
    }
    case BSON_TYPE_INT32:
      return model::Value{static_cast<int64_t>(bson_iter_int32(&iter))};
    case BSON_TYPE_TIMESTAMP: {
      model::legacy::Timestamp ts;
      bson_iter_timestamp(&iter, &ts.seconds, &ts.increment);
      return model::Value{model::LegacyValue{ts}};
    }
    case BSON_TYPE_INT64:
      return model::Value{static_cast<int64_t>(bson_iter_int64(&iter))};
    case BSON_TYPE_DECIMAL128: {
      bson_decimal128_t raw;
      if (!bson_iter_decimal128(&iter, &raw)) throw util::DecodeError("bson: unreadable decimal128");
      model::legacy::Decimal128 dec;
      dec.low  = raw.low;
      dec.high = raw.high;
      return model::Value{model::LegacyValue{dec}};
    }
    case BSON_TYPE_MINKEY:
      return model::Value{model::LegacyValue{model::legacy::MinKey{}}};
    case BSON_TYPE_MAXKEY:
      return model::Value{model::LegacyValue{model::legacy::MaxKey{}}};
    case BSON_TYPE_EOD:
      break;
  }
  char hex[8];
  std::snprintf(hex, sizeof(hex), "0x%02x", static_cast<unsigned>(bson_iter_type(&iter)));
  throw util::DecodeError(std::string("bson: unknown element type ") + hex);
}

// Calls fn(key, value) for every top-level element of `doc`.
template <typename Fn>
void ForEachElement(const bson_t& doc, int depth, Fn&& fn) {
  if (depth > kMaxDepth) throw util::DecodeError("bson: document nesting too deep");

  CheckElements(doc);

  bson_iter_t iter;
  if (!bson_iter_init(&iter, &doc)) {
    throw util::DecodeError("bson: cannot iterate document");
  }
  while (bson_iter_next(&iter)) {
    uint32_t    key_len = bson_iter_key_len(&iter);
    std::string key(bson_iter_key(&iter), key_len);
    fn(std::move(key), ReadElementValue(iter, depth));
  }
  // iteration also stops at a corrupt element; err_off tells the two apart
  if (iter.err_off != 0) {
    throw util::DecodeError("bson: corrupt element at offset " + std::to_string(iter.err_off));
  }
}

void Embedded(const bson_iter_t& iter, bson_t* child) {
  uint32_t       len  = 0;
  const uint8_t* data = nullptr;
  if (BSON_ITER_HOLDS_DOCUMENT(&iter)) {
    bson_iter_document(&iter, &len, &data);
  } else {
    bson_iter_array(&iter, &len, &data);
  }
  if (data == nullptr) throw util::DecodeError("bson: invalid embedded document");
  InitStatic(child, data, len);
}

model::Map ReadDocument(const bson_iter_t& iter, int depth) {
  bson_t child;
  Embedded(iter, &child);
  model::Map   out;
  ForEachElement(child, depth, [&](std::string key, model::Value value) { out.insert_or_assign(std::move(key), std::move(value)); });
  return out;
}

model::List ReadArray(const bson_iter_t& iter, int depth) {
  bson_t child;
  Embedded(iter, &child);
  model::List  out;
  ForEachElement(child, depth, [&](std::string, model::Value value) { out.push_back(std::move(value)); });
  return out;
}

// ------------------------------------------------------------------
// Encode
// ------------------------------------------------------------------

// Owns a heap-allocated document from bson_new().
class OwnedBson {
 public:
  OwnedBson() : doc_(bson_new()) {
  }
  ~OwnedBson() {
    bson_destroy(doc_);
  }
  OwnedBson(const OwnedBson&)            = delete;
  OwnedBson& operator=(const OwnedBson&) = delete;

  bson_t* get() const {
    return doc_;
  }

 private:
  bson_t* doc_;
};

void Check(bool appended, const std::string& key) {
  if (!appended) {
    throw std::length_error("bson: cannot append \"" + key + "\", document too large");
  }
}

int KeyLength(const std::string& key) {
  if (key.find('\0') != std::string::npos) {
    throw std::invalid_argument("bson: key contains NUL");
  }
  return static_cast<int>(key.size());
}

void AppendValue(bson_t* doc, const std::string& key, const model::Value& value);

void AppendMap(bson_t* doc, const model::Map& map) {
  for (const auto& [key, value] : map) AppendValue(doc, key, value);
}

void AppendList(bson_t* doc, const model::List& list) {
  char        buf[16];
  const char* index = nullptr;
  uint32_t    i     = 0;
  for (const auto& item : list) {
    const std::size_t len = bson_uint32_to_string(i++, &index, buf, sizeof(buf));
    AppendValue(doc, std::string(index, len), item);
  }
}

void AppendLegacy(bson_t* doc, const std::string& key, const model::LegacyValue& legacy) {
  const int   key_len = KeyLength(key);
  const char* k       = key.c_str();

  if (std::holds_alternative<model::legacy::Undefined>(legacy)) {
    Check(bson_append_undefined(doc, k, key_len), key);
  } else if (std::holds_alternative<model::legacy::MinKey>(legacy)) {
    Check(bson_append_minkey(doc, k, key_len), key);
  } else if (std::holds_alternative<model::legacy::MaxKey>(legacy)) {
    Check(bson_append_maxkey(doc, k, key_len), key);
  } else if (const auto* id = std::get_if<model::legacy::ObjectId>(&legacy)) {
    bson_oid_t oid;
    bson_oid_init_from_data(&oid, id->bytes.data());
    Check(bson_append_oid(doc, k, key_len, &oid), key);
  } else if (const auto* dt = std::get_if<model::legacy::DateTime>(&legacy)) {
    Check(bson_append_date_time(doc, k, key_len, dt->millis), key);
  } else if (const auto* ts = std::get_if<model::legacy::Timestamp>(&legacy)) {
    Check(bson_append_timestamp(doc, k, key_len, ts->seconds, ts->increment), key);
  } else if (const auto* dec = std::get_if<model::legacy::Decimal128>(&legacy)) {
    bson_decimal128_t raw;
    raw.low  = dec->low;
    raw.high = dec->high;
    Check(bson_append_decimal128(doc, k, key_len, &raw), key);
  } else if (const auto* re = std::get_if<model::legacy::Regex>(&legacy)) {
    Check(bson_append_regex(doc, k, key_len, re->pattern.c_str(), re->options.c_str()), key);
  } else if (const auto* js = std::get_if<model::legacy::JavaScript>(&legacy)) {
    Check(bson_append_code(doc, k, key_len, js->code.c_str()), key);
  } else if (const auto* sym = std::get_if<model::legacy::Symbol>(&legacy)) {
    Check(bson_append_symbol(doc, k, key_len, sym->name.data(), static_cast<int>(sym->name.size())), key);
  } else if (const auto* bin = std::get_if<model::legacy::Binary>(&legacy)) {
    Check(bson_append_binary(doc, k, key_len, static_cast<bson_subtype_t>(bin->subtype), bin->data.data(),
                             static_cast<uint32_t>(bin->data.size())),
          key);
  }
}

void AppendValue(bson_t* doc, const std::string& key, const model::Value& value) {
  const int   key_len = KeyLength(key);
  const char* k       = key.c_str();

  switch (value.Kind()) {
    case model::ValueKind::Null:
      Check(bson_append_null(doc, k, key_len), key);
      return;
    case model::ValueKind::Bool:
      Check(bson_append_bool(doc, k, key_len, *value.As<bool>()), key);
      return;
    case model::ValueKind::Int:
      Check(bson_append_int64(doc, k, key_len, *value.As<int64_t>()), key);
      return;
    case model::ValueKind::Float:
      Check(bson_append_double(doc, k, key_len, *value.As<double>()), key);
      return;
    case model::ValueKind::Text: {
      const auto& text = *value.As<std::string>();
      Check(bson_append_utf8(doc, k, key_len, text.data(), static_cast<int>(text.size())), key);
      return;
    }
    case model::ValueKind::Bytes: {
      const auto& bytes = *value.As<model::Bytes>();
      Check(bson_append_binary(doc, k, key_len, BSON_SUBTYPE_BINARY, bytes.data(), static_cast<uint32_t>(bytes.size())),
            key);
      return;
    }
    case model::ValueKind::Time:
      Check(bson_append_date_time(doc, k, key_len, util::ToUnixMillis(*value.As<model::TimePoint>())), key);
      return;
    case model::ValueKind::List: {
      bson_t child;
      Check(bson_append_array_begin(doc, k, key_len, &child), key);
      AppendList(&child, *value.As<model::List>());
      Check(bson_append_array_end(doc, &child), key);
      return;
    }
    case model::ValueKind::Map: {
      bson_t child;
      Check(bson_append_document_begin(doc, k, key_len, &child), key);
      AppendMap(&child, *value.As<model::Map>());
      Check(bson_append_document_end(doc, &child), key);
      return;
    }
    case model::ValueKind::Legacy:
      AppendLegacy(doc, key, *value.As<model::LegacyValue>());
      return;
  }
}

} // namespace

model::Row DecodeBsonDocument(const std::uint8_t* data, std::size_t size) {
  bson_t doc;
  InitStatic(&doc, data, size);
  model::Row out;
  ForEachElement(doc, 0, [&](std::string key, model::Value value) { out.insert_or_assign(std::move(key), std::move(value)); });
  return out;
}

void AppendBsonDocument(const model::Row& row, std::string& out) {
  OwnedBson doc;
  AppendMap(doc.get(), row);
  out.append(reinterpret_cast<const char*>(bson_get_data(doc.get())), doc.get()->len);
}

} // namespace quire::codec
