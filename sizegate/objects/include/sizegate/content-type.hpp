#pragma once

#include <string>
#include <string_view>

namespace sizegate {

// Content type assumed for requests without a Content-Type header.
inline constexpr std::string_view kUnknownContentType = "application/octet-stream";

// Normalizes a Content-Type header value for limit and buffering lookups:
// lower-cased, truncated at the first ';' (parameters are dropped) and trimmed of surrounding white spaces.
// Normalization is idempotent.
//   "Application/JSON; charset=utf-8" -> "application/json"
std::string NormalizeContentType(std::string_view contentType);

// Returns the "type/*" wildcard key of an already normalized content type, made of the text up to the first '/'.
// Returns an empty string if there is no '/' (no wildcard can match such a content type).
//   "image/jpeg" -> "image/*"
std::string WildcardKey(std::string_view normalizedContentType);

// Tells whether given pattern is a wildcard pattern, that is, ends with "/*".
constexpr bool IsWildcardPattern(std::string_view pattern) noexcept { return pattern.ends_with("/*"); }

}  // namespace sizegate
