#pragma once

#include <algorithm>
#include <string_view>

#include "sizegate/toupperlower.hpp"

namespace sizegate {

// ASCII case-insensitive equality, used for header names and content types.
constexpr bool CaseInsensitiveEqual(std::string_view lhs, std::string_view rhs) {
  return std::ranges::equal(lhs, rhs, [](char lc, char rc) { return tolower(lc) == tolower(rc); });
}

}  // namespace sizegate
