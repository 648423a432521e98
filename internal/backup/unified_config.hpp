#pragma once

#include <string_view>

#include "internal/db/model/value.hpp"

namespace quire::backup {

// Name of the options row holding the unified configuration blob.
inline constexpr const char* kUnifiedConfigOption = "configs";

// Default unified configuration, as JSON text.
std::string_view DefaultUnifiedConfigJson();

// Parsed form of DefaultUnifiedConfigJson(); a fresh copy per call.
db::model::Map DefaultUnifiedConfig();

} // namespace quire::backup
