#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "internal/db/model/value.hpp"

namespace quire::codec {

namespace model = db::model;

/*
  Per-table payload formats.

    Bson  concatenated BSON documents, each prefixed by its own
          little-endian int32 total length (primary format)
    Json  a JSON array of row objects (older archives)
*/
enum class RowFormat { Bson, Json };

const char* RowFormatExtension(RowFormat format); // ".bson", ".json"

// Empty input -> empty output.
std::string EncodeBsonRows(const std::vector<model::Row>& rows);

// All decoders throw util::DecodeError on malformed payloads.
std::vector<model::Row> DecodeBsonRows(std::string_view payload);
std::vector<model::Row> DecodeJsonRows(std::string_view payload);
std::vector<model::Row> DecodeRows(std::string_view payload, RowFormat format);

} // namespace quire::codec
