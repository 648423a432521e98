#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "internal/db/model/value.hpp"

namespace quire::codec {

namespace model = db::model;

/*
  BSON row documents on top of libbson.

  Decoding keeps legacy element types as model::LegacyValue so that
  the normalizer owns every conversion decision. Encoding writes
  Int as int64, Bytes as generic binary and Time as UTC datetime.
*/

// Decode exactly one document occupying [data, data + size).
// Throws util::DecodeError on any structural problem.
model::Row DecodeBsonDocument(const std::uint8_t* data, std::size_t size);

// Append one encoded document to `out`.
// Throws std::invalid_argument for keys containing NUL and
// std::length_error when the document outgrows the BSON size limit.
void AppendBsonDocument(const model::Row& row, std::string& out);

} // namespace quire::codec
