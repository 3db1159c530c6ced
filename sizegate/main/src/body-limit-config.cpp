#include "sizegate/body-limit-config.hpp"

#include <initializer_list>
#include <string_view>
#include <utility>

#include "sizegate/buffer-strategy.hpp"
#include "sizegate/error-format.hpp"
#include "sizegate/invalid-argument-exception.hpp"
#include "sizegate/size-limit-config.hpp"
#include "sizegate/size-limit.hpp"

namespace sizegate {

BodyLimitConfig BodyLimitConfig::Simple(SizeLimitConfig sizeLimits) {
  BodyLimitConfig config;
  config.sizeLimits = std::move(sizeLimits);
  config.bufferStrategy = BufferStrategy::AllStreamed();
  return config;
}

void BodyLimitConfig::validate() const {
  sizeLimits.validate();
  bufferStrategy.validate();
  if (maxChunkBytes == 0) {
    throw invalid_argument("maxChunkBytes must be > 0");
  }
  if (!errorFormat.valid()) {
    throw invalid_argument("errorFormat must hold a renderer");
  }
}

BodyLimitConfig& BodyLimitConfig::withSizeLimits(SizeLimitConfig limits) {
  sizeLimits = std::move(limits);
  return *this;
}

BodyLimitConfig& BodyLimitConfig::withBufferStrategy(BufferStrategy strategy) {
  bufferStrategy = std::move(strategy);
  return *this;
}

BodyLimitConfig& BodyLimitConfig::withBufferedTypes(std::initializer_list<std::string_view> patterns) {
  bufferStrategy.withBufferedTypes(patterns);
  return *this;
}

BodyLimitConfig& BodyLimitConfig::withStreamedTypes(std::initializer_list<std::string_view> patterns) {
  bufferStrategy.withStreamedTypes(patterns);
  return *this;
}

BodyLimitConfig& BodyLimitConfig::withDefaultBuffered(bool buffered) {
  bufferStrategy.withDefaultBuffered(buffered);
  return *this;
}

BodyLimitConfig& BodyLimitConfig::withErrorFormat(ErrorFormat format) {
  errorFormat = std::move(format);
  return *this;
}

BodyLimitConfig& BodyLimitConfig::withMaxChunkBytes(SizeLimit maxChunk) {
  maxChunkBytes = maxChunk.bytes();
  return *this;
}

BodyLimitConfig& BodyLimitConfig::withPeekFirstChunk(bool on) {
  peekFirstChunk = on;
  return *this;
}

}  // namespace sizegate
