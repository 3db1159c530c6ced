#include "sizegate/limited-body-stream.hpp"

#include <cstddef>
#include <utility>

#include "sizegate/body-stream.hpp"
#include "sizegate/enforcement-state.hpp"

namespace sizegate {

LimitedBodyStream::LimitedBodyStream(BodyStreamPtr producer, std::size_t maxSize, std::size_t maxChunkBytes,
                                     std::size_t alreadyRead) noexcept
    : _producer(std::move(producer)),
      _maxSize(maxSize),
      _maxChunkBytes(maxChunkBytes),
      _state{alreadyRead, false},
      _endReached(_producer == nullptr) {}

BodyChunk LimitedBodyStream::next() {
  if (_state.hasViolated || _endReached) {
    return BodyChunk::End();
  }

  BodyChunk chunk = _producer->next();
  switch (chunk.kind()) {
    case BodyChunk::Kind::Data: {
      auto optError = AccountChunk(_state, chunk.size(), _maxSize, _maxChunkBytes);
      if (optError) {
        return BodyChunk::Error(std::move(*optError));
      }
      return chunk;
    }
    case BodyChunk::Kind::End:
      _endReached = true;
      return chunk;
    case BodyChunk::Kind::Error:
      _state.hasViolated = true;
      return chunk;
  }
  return BodyChunk::End();
}

}  // namespace sizegate
