#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "google/protobuf/struct.pb.h"
#include "internal/db/model/value.hpp"

namespace quire::codec {

namespace model = db::model;

/*
  JSON <-> model::Value through google.protobuf.Value.

  JSON numbers are doubles on the wire; integral values within
  +-2^53 come back as Int, everything else as Float.
*/

model::Value FromProtoValue(const google::protobuf::Value& value);

// Legacy alternatives are normalized first. Bytes become a string,
// Time becomes RFC3339 text.
google::protobuf::Value ToProtoValue(const model::Value& value);

// Any top-level JSON value. std::nullopt on a parse error.
std::optional<google::protobuf::Value> ParseJson(std::string_view text);

// Compact JSON text. Throws std::runtime_error when the printer fails
// (for example a string that is not valid UTF-8).
std::string ToJsonText(const model::Value& value);
std::string ToJsonText(const google::protobuf::Value& value);

} // namespace quire::codec
