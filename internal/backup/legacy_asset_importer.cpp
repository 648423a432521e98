#include "internal/backup/legacy_asset_importer.hpp"

#include <algorithm>
#include <string_view>

#include "internal/observability/logging.hpp"
#include "internal/util/strings.hpp"

namespace quire::backup {

namespace {

const char* TemplateOption(std::string_view base) {
  if (base == "owner.template.ejs") return "email_template_owner";
  if (base == "guest.template.ejs") return "email_template_guest";
  if (base == "newsletter.template.ejs") return "email_template_newsletter";
  return nullptr;
}

} // namespace

std::vector<std::string> ImportLegacyEmailTemplates(const std::vector<archive::ZipEntry>& entries,
                                                    OptionStore&                        options) {
  const std::string_view prefix = kLegacyEmailTemplateDir;

  std::vector<std::string> imported;
  for (const auto& entry : entries) {
    std::string path = util::ToLower(entry.name);
    std::replace(path.begin(), path.end(), '\\', '/');
    if (path.compare(0, prefix.size(), prefix) != 0) continue;

    const auto        slash = path.find_last_of('/');
    const std::string base  = slash == std::string::npos ? path : path.substr(slash + 1);
    const char*       name  = TemplateOption(base);
    if (name == nullptr) continue;

    if (!entry.Readable()) {
      QUIRE_LOG_WARN("skipping unreadable template asset", {observability::StringField("entry", entry.name),
                                                             observability::StringField("error", entry.error)});
      continue;
    }

    const std::string content = util::Trim(entry.data);
    if (content.empty()) continue;

    options.Put(name, content);
    imported.emplace_back(name);
    QUIRE_LOG_INFO("imported legacy email template", {observability::StringField("option", name)});
  }
  return imported;
}

} // namespace quire::backup
