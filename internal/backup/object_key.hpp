#pragma once

#include <string>
#include <string_view>

#include "internal/util/time.hpp"

namespace quire::backup {

/*
  Object-storage key for an uploaded backup.

  Placeholders {Y} {m} {d} {H} {M} {s} expand from `now` in UTC and
  {filename} from `filename`, in one left-to-right pass. A blank
  template means config::kDefaultObjectKeyTemplate. The key uses '/'
  separators with no leading '/' and no empty segments; a key that
  ends up empty falls back to `filename`.
*/
std::string RenderBackupObjectKey(std::string_view key_template, const std::string& filename, util::TimePoint now);

} // namespace quire::backup
