#pragma once

#include <string_view>

namespace sizegate {

// Trim OWS (optional whitespace) per RFC7230: SP and HTAB only.
constexpr std::string_view TrimOws(std::string_view sv) noexcept {
  auto begin = sv.begin();
  auto end = sv.end();
  while (begin != end && (*begin == ' ' || *begin == '\t')) {
    ++begin;
  }
  while (begin != end) {
    --end;
    if (*end != ' ' && *end != '\t') {
      ++end;
      break;
    }
  }
  return {begin, end};
}

// Trim all ASCII whitespace characters (SP, HTAB, CR, LF, VT, FF) on both sides.
constexpr std::string_view TrimAsciiSpaces(std::string_view sv) noexcept {
  constexpr std::string_view kSpaces = " \t\r\n\v\f";
  const auto first = sv.find_first_not_of(kSpaces);
  if (first == std::string_view::npos) {
    return {};
  }
  const auto last = sv.find_last_not_of(kSpaces);
  return sv.substr(first, last - first + 1);
}

}  // namespace sizegate
