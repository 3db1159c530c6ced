#pragma once

#include <cstddef>
#include <initializer_list>
#include <string_view>

#include "sizegate/buffer-strategy.hpp"
#include "sizegate/enforcement-state.hpp"
#include "sizegate/error-format.hpp"
#include "sizegate/size-limit-config.hpp"
#include "sizegate/size-limit.hpp"

namespace sizegate {

// Complete configuration of the body size limit pipeline (see SizeLimitService).
struct BodyLimitConfig {
  // Config streaming every body (no buffering) with given limits.
  static BodyLimitConfig Simple(SizeLimitConfig sizeLimits);

  // Validates config. Throws std::invalid_argument if it is not valid.
  void validate() const;

  // Replace the size limits.
  BodyLimitConfig& withSizeLimits(SizeLimitConfig limits);

  // Replace the whole buffering strategy.
  BodyLimitConfig& withBufferStrategy(BufferStrategy strategy);

  // Append patterns to the buffered list of the current strategy.
  BodyLimitConfig& withBufferedTypes(std::initializer_list<std::string_view> patterns);

  // Append patterns to the streamed list of the current strategy.
  BodyLimitConfig& withStreamedTypes(std::initializer_list<std::string_view> patterns);

  // Set the buffering behavior of content types matching no pattern.
  BodyLimitConfig& withDefaultBuffered(bool buffered = true);

  BodyLimitConfig& withErrorFormat(ErrorFormat format);

  BodyLimitConfig& withMaxChunkBytes(SizeLimit maxChunk);

  BodyLimitConfig& withPeekFirstChunk(bool on = true);

  // Per content type body limits.
  SizeLimitConfig sizeLimits;

  // Decides between buffering and streaming of request bodies.
  BufferStrategy bufferStrategy{BufferStrategy::WithDefaults()};

  // How violations are rendered. Default: simple JSON if built with JSON support, plain text otherwise.
  ErrorFormat errorFormat;

  // Maximum size of a single chunk of a streamed body, independently of the body limit. Default: 16 MiB.
  std::size_t maxChunkBytes{kDefaultMaxChunkBytes};

  // When true, the first chunk of a streamed body is pulled before invoking the handler so that a body exceeding
  // the limit in its first chunk is rejected without running the handler at all.
  bool peekFirstChunk{true};
};

}  // namespace sizegate
