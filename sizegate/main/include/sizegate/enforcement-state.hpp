#pragma once

#include <cstddef>
#include <limits>
#include <optional>

#include "sizegate/size-limit-error.hpp"

namespace sizegate {

// Individual chunk ceiling applied by default, independently of the body limit.
inline constexpr std::size_t kDefaultMaxChunkBytes = 16UL * 1024UL * 1024UL;

// Per body enforcement counters, owned by the stream wrapper of a single request.
struct EnforcementState {
  // Body bytes accepted so far.
  std::size_t bytesRead{0};
  // Latch, set on the first violation (or producer error). Never reset.
  bool hasViolated{false};
};

// Accounts a chunk of 'chunkSize' bytes, in this order:
//  1. chunk larger than 'maxChunkBytes' -> ChunkTooLarge
//  2. bytesRead + chunkSize overflows   -> SizeOverflow
//  3. bytesRead + chunkSize > maxSize   -> BodyTooLarge{maxSize, bytesRead + chunkSize}
//  4. otherwise bytesRead is increased and std::nullopt is returned.
// On violation, the latch is set and bytesRead is left unchanged.
[[nodiscard]] inline std::optional<SizeLimitError> AccountChunk(EnforcementState& state, std::size_t chunkSize,
                                                                std::size_t maxSize,
                                                                std::size_t maxChunkBytes) noexcept {
  if (chunkSize > maxChunkBytes) {
    state.hasViolated = true;
    return SizeLimitError::ChunkTooLarge{maxChunkBytes, chunkSize};
  }
  if (chunkSize > std::numeric_limits<std::size_t>::max() - state.bytesRead) {
    state.hasViolated = true;
    return SizeLimitError::SizeOverflow{};
  }
  const std::size_t newTotal = state.bytesRead + chunkSize;
  if (newTotal > maxSize) {
    state.hasViolated = true;
    return SizeLimitError::BodyTooLarge{maxSize, newTotal};
  }
  state.bytesRead = newTotal;
  return std::nullopt;
}

}  // namespace sizegate
