#pragma once

#include <string>
#include <string_view>

namespace quire::util {

std::string Trim(std::string_view s);
std::string ToLower(std::string_view s);
bool        ContainsIgnoreCase(std::string_view haystack, std::string_view needle);

/*
  camelCase / PascalCase / kebab-case -> snake_case.

  "readCount"  -> "read_count"
  "HTMLParser" -> "html_parser"
  "s3Options"  -> "s3_options"
  "__v"        -> "v"

  Only ASCII letters change case; other bytes pass through.
*/
std::string CamelToSnake(std::string_view raw);

// Double-quoted SQL identifier; embedded quotes are doubled.
std::string QuoteIdentifier(std::string_view name);

} // namespace quire::util
