#pragma once

#include <string>
#include <vector>

#include "internal/archive/zip_archive.hpp"
#include "internal/backup/option_store.hpp"

namespace quire::backup {

inline constexpr const char* kLegacyEmailTemplateDir = "backup_data/assets/email-template/";

/*
  Copies legacy e-mail templates shipped as archive assets into options:

    owner.template.ejs       -> email_template_owner
    guest.template.ejs       -> email_template_guest
    newsletter.template.ejs  -> email_template_newsletter

  Entry paths match case-insensitively with '\' read as '/'. Unreadable
  entries and blank templates are skipped. Returns the option names
  written, in archive order.
*/
std::vector<std::string> ImportLegacyEmailTemplates(const std::vector<archive::ZipEntry>& entries,
                                                    OptionStore&                        options);

} // namespace quire::backup
