#pragma once

#include <charconv>
#include <concepts>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace sizegate {

inline std::string IntegralToString(std::integral auto val) { return std::to_string(val); }

// Strict conversion: the whole string must be a valid integral representation that fits in Integral.
// Leading '+' signs and surrounding spaces are not accepted.
template <std::integral Integral>
std::optional<Integral> TryStringToIntegral(std::string_view str) noexcept {
  if (str.empty()) {
    return std::nullopt;
  }
  Integral ret;
  const char *endPtr = str.data() + str.size();
  const auto [ptr, errc] = std::from_chars(str.data(), endPtr, ret);
  if (errc != std::errc() || ptr != endPtr) {
    return std::nullopt;
  }
  return ret;
}

}  // namespace sizegate
