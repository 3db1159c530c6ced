#include "sizegate/buffered-body-reader.hpp"

#include <cstddef>
#include <limits>
#include <string>
#include <utility>

#include "sizegate/body-stream.hpp"
#include "sizegate/enforcement-state.hpp"
#include "sizegate/size-limit-error.hpp"

namespace sizegate {

BufferedBody ReadBodyWithLimit(BodyStream& body, std::size_t maxSize) {
  // No individual chunk ceiling here, only the cumulative limit matters for a buffered body.
  static constexpr std::size_t kNoChunkCeiling = std::numeric_limits<std::size_t>::max();

  std::string buffer;
  EnforcementState state;
  while (true) {
    BodyChunk chunk = body.next();
    switch (chunk.kind()) {
      case BodyChunk::Kind::Data: {
        auto optError = AccountChunk(state, chunk.size(), maxSize, kNoChunkCeiling);
        if (optError) {
          return BufferedBody(std::move(*optError));
        }
        if (buffer.empty()) {
          buffer = std::move(chunk).takeData();
        } else {
          buffer.append(chunk.data());
        }
        break;
      }
      case BodyChunk::Kind::End:
        if (buffer.size() > maxSize) {
          return BufferedBody(SizeLimitError::BodyTooLarge{maxSize, buffer.size()});
        }
        return BufferedBody(std::move(buffer));
      case BodyChunk::Kind::Error:
        return BufferedBody(chunk.error());
    }
  }
}

}  // namespace sizegate
