#include "sizegate/unitsparser.hpp"

#include <algorithm>
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include "sizegate/invalid-argument-exception.hpp"
#include "sizegate/string-trim.hpp"
#include "sizegate/toupperlower.hpp"

namespace sizegate {

namespace {

constexpr std::pair<std::string_view, uint64_t> kUnits[] = {
    {"b", 1ULL},
    {"byte", 1ULL},
    {"bytes", 1ULL},
    {"kb", 1000ULL},
    {"kilobyte", 1000ULL},
    {"kilobytes", 1000ULL},
    {"mb", 1000ULL * 1000ULL},
    {"megabyte", 1000ULL * 1000ULL},
    {"megabytes", 1000ULL * 1000ULL},
    {"gb", 1000ULL * 1000ULL * 1000ULL},
    {"gigabyte", 1000ULL * 1000ULL * 1000ULL},
    {"gigabytes", 1000ULL * 1000ULL * 1000ULL},
    {"kib", 1024ULL},
    {"kibibyte", 1024ULL},
    {"kibibytes", 1024ULL},
    {"mib", 1024ULL * 1024ULL},
    {"mebibyte", 1024ULL * 1024ULL},
    {"mebibytes", 1024ULL * 1024ULL},
    {"gib", 1024ULL * 1024ULL * 1024ULL},
    {"gibibyte", 1024ULL * 1024ULL * 1024ULL},
    {"gibibytes", 1024ULL * 1024ULL * 1024ULL},
    {"kbit", 125ULL},
    {"kilobit", 125ULL},
    {"kilobits", 125ULL},
    {"mbit", 125ULL * 1000ULL},
    {"megabit", 125ULL * 1000ULL},
    {"megabits", 125ULL * 1000ULL},
    {"gbit", 125ULL * 1000ULL * 1000ULL},
    {"gigabit", 125ULL * 1000ULL * 1000ULL},
    {"gigabits", 125ULL * 1000ULL * 1000ULL},
};

uint64_t UnitMultiplier(std::string_view unit) {
  if (unit.empty()) {
    return 1;
  }
  const auto it = std::ranges::find(kUnits, unit, &std::pair<std::string_view, uint64_t>::first);
  if (it == std::end(kUnits)) {
    throw invalid_argument("Unknown unit '{}'", unit);
  }
  return it->second;
}

}  // namespace

std::size_t ParseHumanSize(std::string_view sizeStr) {
  const std::string lowered = ToLowerCopy(TrimAsciiSpaces(sizeStr));
  if (lowered.empty()) {
    throw invalid_argument("Empty size string");
  }

  const auto numEnd = lowered.find_first_not_of("0123456789.,");
  if (numEnd == 0) {
    throw invalid_argument("No number found in '{}'", sizeStr);
  }

  std::string numPart = lowered.substr(0, numEnd);
  std::ranges::replace(numPart, ',', '.');

  double value;
  const char* numBeg = numPart.data();
  const char* numLast = numBeg + numPart.size();
  const auto [ptr, errc] = std::from_chars(numBeg, numLast, value);
  if (errc != std::errc() || ptr != numLast) {
    throw invalid_argument("Invalid number '{}'", numPart);
  }

  const std::string_view unitPart =
      numEnd == std::string::npos ? std::string_view{} : TrimAsciiSpaces(std::string_view(lowered).substr(numEnd));

  const double bytes = value * static_cast<double>(UnitMultiplier(unitPart));
  if (bytes >= static_cast<double>(std::numeric_limits<std::size_t>::max())) {
    throw invalid_argument("Size '{}' is too large", sizeStr);
  }
  return static_cast<std::size_t>(bytes);
}

}  // namespace sizegate
