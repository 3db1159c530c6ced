#pragma once

#include <optional>
#include <utility>

#include "sizegate/body-stream.hpp"

namespace sizegate {

// Yields an already pulled item first, then delegates to 'rest'.
// Used to hand back a peeked first chunk in front of the remaining (monitored) body.
class PrefixedBodyStream final : public BodyStream {
 public:
  PrefixedBodyStream(BodyChunk first, BodyStreamPtr rest) noexcept : _first(std::move(first)), _rest(std::move(rest)) {}

  BodyChunk next() override {
    if (_first) {
      BodyChunk first = std::move(*_first);
      _first.reset();
      return first;
    }
    return _rest == nullptr ? BodyChunk::End() : _rest->next();
  }

 private:
  std::optional<BodyChunk> _first;
  BodyStreamPtr _rest;
};

}  // namespace sizegate
