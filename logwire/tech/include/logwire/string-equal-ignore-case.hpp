#pragma once

#include <cstddef>
#include <string_view>

namespace logwire {

constexpr char ToLowerAscii(char ch) noexcept { return ch >= 'A' && ch <= 'Z' ? static_cast<char>(ch + ('a' - 'A')) : ch; }

// ASCII-only comparison, enough for HTTP header names and tokens.
constexpr bool CaseInsensitiveEqual(std::string_view lhs, std::string_view rhs) noexcept {
  if (lhs.size() != rhs.size()) {
    return false;
  }
  for (std::size_t pos = 0; pos < lhs.size(); ++pos) {
    if (ToLowerAscii(lhs[pos]) != ToLowerAscii(rhs[pos])) {
      return false;
    }
  }
  return true;
}

// True if the comma separated header value 'list' contains 'token' (case-insensitive).
constexpr bool HeaderListContainsToken(std::string_view list, std::string_view token) noexcept {
  while (!list.empty()) {
    const auto commaPos = list.find(',');
    std::string_view item = list.substr(0, commaPos);
    while (!item.empty() && (item.front() == ' ' || item.front() == '\t')) {
      item.remove_prefix(1);
    }
    while (!item.empty() && (item.back() == ' ' || item.back() == '\t')) {
      item.remove_suffix(1);
    }
    if (CaseInsensitiveEqual(item, token)) {
      return true;
    }
    if (commaPos == std::string_view::npos) {
      break;
    }
    list.remove_prefix(commaPos + 1);
  }
  return false;
}

}  // namespace logwire
