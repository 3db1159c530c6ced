#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>

#include "sizegate/size-limit.hpp"

namespace sizegate {

// Maps request content types to the maximum number of body bytes accepted for them.
// Resolution order for a given content type (see limitFor):
//   1. exact match in specificLimits
//   2. "type/*" match in wildcardLimits
//   3. defaultLimit
// Built once at startup, then shared read-only across all requests.
struct SizeLimitConfig {
  static constexpr std::size_t kDefaultLimit = 1'000'000UL;

  // Validates config. Throws std::invalid_argument if it is not valid.
  void validate() const;

  // Returns the effective body limit (in bytes) for given Content-Type header value.
  // Parameters (after ';') and case are ignored. Never fails, unknown or malformed content types get defaultLimit.
  [[nodiscard]] std::size_t limitFor(std::string_view contentType) const;

  // Set the limit applied when no specific nor wildcard limit matches.
  SizeLimitConfig& withDefaultLimit(SizeLimit limit);

  // Set (or overwrite) the limit of an exact content type, such as "application/json".
  SizeLimitConfig& withSpecificLimit(std::string_view contentType, SizeLimit limit);

  // Set (or overwrite) the limit of a wildcard pattern of the form "type/*", such as "image/*".
  SizeLimitConfig& withWildcardLimit(std::string_view pattern, SizeLimit limit);

  // Limit applied to content types matching no other entry. Default: 1 MB (1'000'000 bytes).
  std::size_t defaultLimit{kDefaultLimit};

  // Exact (lower-cased) content type -> limit in bytes.
  std::unordered_map<std::string, std::size_t> specificLimits;

  // Lower-cased "type/*" pattern -> limit in bytes.
  std::unordered_map<std::string, std::size_t> wildcardLimits;
};

}  // namespace sizegate
