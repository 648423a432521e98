#include "internal/codec/row_codec.hpp"

#include "internal/codec/bson_document.hpp"
#include "internal/codec/json_value.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"

namespace quire::codec {

const char* RowFormatExtension(RowFormat format) {
  switch (format) {
    case RowFormat::Bson:
      return ".bson";
    case RowFormat::Json:
      return ".json";
  }
  return "";
}

std::string EncodeBsonRows(const std::vector<model::Row>& rows) {
  std::string out;
  for (const auto& row : rows) {
    AppendBsonDocument(row, out);
  }
  return out;
}

std::vector<model::Row> DecodeBsonRows(std::string_view payload) {
  std::vector<model::Row> rows;
  const auto*             data = reinterpret_cast<const std::uint8_t*>(payload.data());
  std::size_t             pos  = 0;

  while (pos < payload.size()) {
    const std::size_t remaining = payload.size() - pos;
    if (remaining < 4) {
      throw util::DecodeError("bson stream: " + std::to_string(remaining) + " trailing bytes at offset " +
                              std::to_string(pos));
    }

    const std::int32_t len = static_cast<std::int32_t>(static_cast<std::uint32_t>(data[pos]) |
                                                       (static_cast<std::uint32_t>(data[pos + 1]) << 8) |
                                                       (static_cast<std::uint32_t>(data[pos + 2]) << 16) |
                                                       (static_cast<std::uint32_t>(data[pos + 3]) << 24));
    if (len <= 0 || static_cast<std::size_t>(len) > remaining) {
      throw util::DecodeError("bson stream: invalid document length " + std::to_string(len) + " at offset " +
                              std::to_string(pos));
    }

    rows.push_back(DecodeBsonDocument(data + pos, static_cast<std::size_t>(len)));
    pos += static_cast<std::size_t>(len);
  }
  return rows;
}

std::vector<model::Row> DecodeJsonRows(std::string_view payload) {
  if (util::Trim(payload).empty()) {
    return {};
  }

  auto parsed = ParseJson(payload);
  if (!parsed) {
    throw util::DecodeError("json rows: payload is not valid JSON");
  }
  if (parsed->kind_case() != google::protobuf::Value::kListValue) {
    throw util::DecodeError("json rows: top-level value is not an array");
  }

  std::vector<model::Row> rows;
  rows.reserve(static_cast<std::size_t>(parsed->list_value().values_size()));
  for (const auto& item : parsed->list_value().values()) {
    if (item.kind_case() == google::protobuf::Value::kNullValue) {
      rows.emplace_back();
      continue;
    }
    if (item.kind_case() != google::protobuf::Value::kStructValue) {
      throw util::DecodeError("json rows: array element is not an object");
    }
    auto value = FromProtoValue(item);
    rows.push_back(std::move(*value.As<model::Map>()));
  }
  return rows;
}

std::vector<model::Row> DecodeRows(std::string_view payload, RowFormat format) {
  switch (format) {
    case RowFormat::Bson:
      return DecodeBsonRows(payload);
    case RowFormat::Json:
      return DecodeJsonRows(payload);
  }
  return {};
}

} // namespace quire::codec
