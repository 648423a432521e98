#include "internal/backup/object_key.hpp"

#include <algorithm>
#include <utility>

#include "internal/config/config_loader.hpp"
#include "internal/util/strings.hpp"

namespace quire::backup {

std::string RenderBackupObjectKey(std::string_view key_template, const std::string& filename, util::TimePoint now) {
  std::string tpl = util::Trim(key_template);
  if (tpl.empty()) {
    tpl = config::kDefaultObjectKeyTemplate;
  }

  const std::pair<std::string_view, std::string> placeholders[] = {
      {"{Y}", util::FormatUtc(now, "%Y")},
      {"{m}", util::FormatUtc(now, "%m")},
      {"{d}", util::FormatUtc(now, "%d")},
      {"{H}", util::FormatUtc(now, "%H")},
      {"{M}", util::FormatUtc(now, "%M")},
      {"{s}", util::FormatUtc(now, "%S")},
      {"{filename}", filename},
  };

  std::string key;
  key.reserve(tpl.size() + filename.size());
  for (std::size_t i = 0; i < tpl.size();) {
    bool replaced = false;
    for (const auto& [name, value] : placeholders) {
      if (tpl.compare(i, name.size(), name) == 0) {
        key += value;
        i += name.size();
        replaced = true;
        break;
      }
    }
    if (!replaced) {
      key.push_back(tpl[i++]);
    }
  }

  std::replace(key.begin(), key.end(), '\\', '/');
  if (!key.empty() && key.front() == '/') key.erase(0, 1);
  key = util::Trim(key);

  std::string collapsed;
  collapsed.reserve(key.size());
  for (char c : key) {
    if (c == '/' && !collapsed.empty() && collapsed.back() == '/') continue;
    collapsed.push_back(c);
  }

  return collapsed.empty() ? filename : collapsed;
}

} // namespace quire::backup
