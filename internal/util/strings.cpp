#include "internal/util/strings.hpp"

#include <cctype>

namespace quire::util {

namespace {

bool IsUpper(char c) {
  return std::isupper(static_cast<unsigned char>(c)) != 0;
}

bool IsLower(char c) {
  return std::islower(static_cast<unsigned char>(c)) != 0;
}

bool IsDigit(char c) {
  return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

char Lower(char c) {
  return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

} // namespace

std::string Trim(std::string_view s) {
  std::size_t begin = 0;
  std::size_t end   = s.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
  while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
  return std::string(s.substr(begin, end - begin));
}

std::string ToLower(std::string_view s) {
  std::string out;
  out.reserve(s.size());
  for (char c : s) out.push_back(Lower(c));
  return out;
}

bool ContainsIgnoreCase(std::string_view haystack, std::string_view needle) {
  return ToLower(haystack).find(ToLower(needle)) != std::string::npos;
}

std::string CamelToSnake(std::string_view raw) {
  const std::string trimmed = Trim(raw);
  if (trimmed.empty()) {
    return {};
  }

  std::string out;
  out.reserve(trimmed.size() + 4);

  bool last_underscore = false;
  for (std::size_t i = 0; i < trimmed.size(); ++i) {
    const char c = trimmed[i];

    if (c == '-' || c == ' ' || c == '_') {
      if (!last_underscore && !out.empty()) {
        out.push_back('_');
        last_underscore = true;
      }
      continue;
    }

    if (IsUpper(c)) {
      if (i > 0 && !last_underscore) {
        const char prev       = trimmed[i - 1];
        const bool next_lower = i + 1 < trimmed.size() && IsLower(trimmed[i + 1]);
        if (IsLower(prev) || IsDigit(prev) || next_lower) {
          out.push_back('_');
        }
      }
      out.push_back(Lower(c));
      last_underscore = false;
      continue;
    }

    out.push_back(Lower(c));
    last_underscore = false;
  }

  // trim '_' and collapse runs
  std::string collapsed;
  collapsed.reserve(out.size());
  for (char c : out) {
    if (c == '_' && (collapsed.empty() || collapsed.back() == '_')) continue;
    collapsed.push_back(c);
  }
  while (!collapsed.empty() && collapsed.back() == '_') collapsed.pop_back();
  return collapsed;
}

std::string QuoteIdentifier(std::string_view name) {
  std::string out;
  out.reserve(name.size() + 2);
  out.push_back('"');
  for (char c : name) {
    if (c == '"') out.push_back('"');
    out.push_back(c);
  }
  out.push_back('"');
  return out;
}

} // namespace quire::util
