#pragma once

#include <cstddef>

#include "sizegate/body-stream.hpp"
#include "sizegate/enforcement-state.hpp"

namespace sizegate {

// Pass-through BodyStream enforcing a body size limit chunk by chunk over a producer stream.
// Chunks are pulled from the producer only when the consumer calls next(), and forwarded unchanged and in order.
// The first violation (oversized chunk, counter overflow, cumulative limit exceeded) is reported as an Error item,
// after which the producer is never polled again and every call returns End. Producer errors are forwarded as is
// and latch the stream the same way.
// Destroying the stream before the end releases the producer without raising anything.
class LimitedBodyStream final : public BodyStream {
 public:
  // 'alreadyRead' seeds the byte counter with body bytes accounted before this stream (such as a peeked first chunk).
  LimitedBodyStream(BodyStreamPtr producer, std::size_t maxSize, std::size_t maxChunkBytes = kDefaultMaxChunkBytes,
                    std::size_t alreadyRead = 0) noexcept;

  BodyChunk next() override;

  [[nodiscard]] const EnforcementState& state() const noexcept { return _state; }

  [[nodiscard]] std::size_t maxSize() const noexcept { return _maxSize; }

  [[nodiscard]] std::size_t maxChunkBytes() const noexcept { return _maxChunkBytes; }

 private:
  BodyStreamPtr _producer;
  std::size_t _maxSize;
  std::size_t _maxChunkBytes;
  EnforcementState _state;
  bool _endReached{false};
};

}  // namespace sizegate
