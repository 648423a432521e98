#include "internal/codec/json_value.hpp"

#include <cmath>
#include <stdexcept>

#include "google/protobuf/util/json_util.h"
#include "internal/util/time.hpp"

namespace quire::codec {

namespace {

constexpr double kMaxExactInteger = 9007199254740992.0; // 2^53

void FillProtoValue(const model::Value& value, google::protobuf::Value* out) {
  switch (value.Kind()) {
    case model::ValueKind::Null:
      out->set_null_value(google::protobuf::NULL_VALUE);
      return;
    case model::ValueKind::Bool:
      out->set_bool_value(*value.As<bool>());
      return;
    case model::ValueKind::Int:
      out->set_number_value(static_cast<double>(*value.As<int64_t>()));
      return;
    case model::ValueKind::Float:
      out->set_number_value(*value.As<double>());
      return;
    case model::ValueKind::Text:
      out->set_string_value(*value.As<std::string>());
      return;
    case model::ValueKind::Bytes: {
      const auto& bytes = *value.As<model::Bytes>();
      out->set_string_value(std::string(bytes.begin(), bytes.end()));
      return;
    }
    case model::ValueKind::Time:
      out->set_string_value(util::FormatRfc3339(*value.As<model::TimePoint>()));
      return;
    case model::ValueKind::List: {
      auto* list = out->mutable_list_value();
      for (const auto& item : *value.As<model::List>()) {
        FillProtoValue(item, list->add_values());
      }
      return;
    }
    case model::ValueKind::Map: {
      auto* fields = out->mutable_struct_value()->mutable_fields();
      for (const auto& [key, item] : *value.As<model::Map>()) {
        FillProtoValue(item, &(*fields)[key]);
      }
      return;
    }
    case model::ValueKind::Legacy:
      FillProtoValue(model::Normalize(value), out);
      return;
  }
}

} // namespace

model::Value FromProtoValue(const google::protobuf::Value& value) {
  switch (value.kind_case()) {
    case google::protobuf::Value::kBoolValue:
      return model::Value{value.bool_value()};
    case google::protobuf::Value::kNumberValue: {
      const double d = value.number_value();
      if (std::isfinite(d) && std::trunc(d) == d && std::fabs(d) <= kMaxExactInteger) {
        return model::Value{static_cast<int64_t>(d)};
      }
      return model::Value{d};
    }
    case google::protobuf::Value::kStringValue:
      return model::Value{value.string_value()};
    case google::protobuf::Value::kListValue: {
      model::List out;
      out.reserve(static_cast<std::size_t>(value.list_value().values_size()));
      for (const auto& item : value.list_value().values()) {
        out.push_back(FromProtoValue(item));
      }
      return model::Value{std::move(out)};
    }
    case google::protobuf::Value::kStructValue: {
      model::Map out;
      for (const auto& [key, item] : value.struct_value().fields()) {
        out.emplace(key, FromProtoValue(item));
      }
      return model::Value{std::move(out)};
    }
    case google::protobuf::Value::kNullValue:
    case google::protobuf::Value::KIND_NOT_SET:
      break;
  }
  return model::Value{};
}

google::protobuf::Value ToProtoValue(const model::Value& value) {
  google::protobuf::Value out;
  FillProtoValue(value, &out);
  return out;
}

std::optional<google::protobuf::Value> ParseJson(std::string_view text) {
  google::protobuf::Value value;
  auto status = google::protobuf::util::JsonStringToMessage(std::string(text), &value);
  if (!status.ok()) {
    return std::nullopt;
  }
  return value;
}

std::string ToJsonText(const google::protobuf::Value& value) {
  std::string out;
  auto status = google::protobuf::util::MessageToJsonString(value, &out);
  if (!status.ok()) {
    throw std::runtime_error("json encode failed: " + std::string(status.message()));
  }
  return out;
}

std::string ToJsonText(const model::Value& value) {
  return ToJsonText(ToProtoValue(value));
}

} // namespace quire::codec
