#include "sizegate/size-limit-config.hpp"

#include <cstddef>
#include <string>
#include <string_view>

#include "sizegate/content-type.hpp"
#include "sizegate/invalid-argument-exception.hpp"
#include "sizegate/size-limit.hpp"
#include "sizegate/toupperlower.hpp"

namespace sizegate {

void SizeLimitConfig::validate() const {
  for (const auto& [contentType, limit] : specificLimits) {
    if (contentType.empty()) {
      throw invalid_argument("specific limit content type must not be empty");
    }
    if (contentType.contains('*')) {
      throw invalid_argument("specific limit content type '{}' must not contain '*', use a wildcard limit instead",
                             contentType);
    }
  }
  for (const auto& [pattern, limit] : wildcardLimits) {
    if (!IsWildcardPattern(pattern) || pattern.find('/') != pattern.size() - 2U) {
      throw invalid_argument("wildcard limit pattern '{}' must be of the form 'type/*'", pattern);
    }
    if (pattern.size() == 2U) {
      throw invalid_argument("wildcard limit pattern '{}' must have a non empty type", pattern);
    }
  }
}

std::size_t SizeLimitConfig::limitFor(std::string_view contentType) const {
  const std::string normalized = NormalizeContentType(contentType);

  const auto specificIt = specificLimits.find(normalized);
  if (specificIt != specificLimits.end()) {
    return specificIt->second;
  }

  const std::string wildcard = WildcardKey(normalized);
  if (!wildcard.empty()) {
    const auto wildcardIt = wildcardLimits.find(wildcard);
    if (wildcardIt != wildcardLimits.end()) {
      return wildcardIt->second;
    }
  }

  return defaultLimit;
}

SizeLimitConfig& SizeLimitConfig::withDefaultLimit(SizeLimit limit) {
  defaultLimit = limit.bytes();
  return *this;
}

SizeLimitConfig& SizeLimitConfig::withSpecificLimit(std::string_view contentType, SizeLimit limit) {
  specificLimits.insert_or_assign(ToLowerCopy(contentType), limit.bytes());
  return *this;
}

SizeLimitConfig& SizeLimitConfig::withWildcardLimit(std::string_view pattern, SizeLimit limit) {
  wildcardLimits.insert_or_assign(ToLowerCopy(pattern), limit.bytes());
  return *this;
}

}  // namespace sizegate
