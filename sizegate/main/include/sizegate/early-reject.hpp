#pragma once

#include <cstddef>
#include <optional>

#include "sizegate/size-limit-error.hpp"

namespace sizegate {

// Fast path rejection from the declared Content-Length, before any body byte is read.
// Returns BodyTooLarge{limit, declared} if the declared length is known and exceeds 'limit', std::nullopt otherwise
// (absent or unparsable lengths defer to the body enforcers).
// The declared length is untrusted: passing this check does not dispense from enforcing the actual body size.
[[nodiscard]] inline std::optional<SizeLimitError> CheckDeclaredContentLength(
    std::optional<std::size_t> declaredContentLength, std::size_t limit) noexcept {
  if (declaredContentLength && *declaredContentLength > limit) {
    return SizeLimitError::BodyTooLarge{limit, *declaredContentLength};
  }
  return std::nullopt;
}

}  // namespace sizegate
