#include "sizegate/body-stream.hpp"

#include <algorithm>
#include <cstddef>
#include <string>
#include <utility>

namespace sizegate {

BodyChunk StringBodyStream::next() {
  if (_pos == _body.size()) {
    return BodyChunk::End();
  }
  if (_pos == 0 && (_chunkSize == 0 || _chunkSize >= _body.size())) {
    BodyChunk chunk = BodyChunk::Data(std::move(_body));
    _body.clear();
    return chunk;
  }
  const std::size_t len = std::min(_chunkSize, _body.size() - _pos);
  BodyChunk chunk = BodyChunk::Data(_body.substr(_pos, len));
  _pos += len;
  return chunk;
}

}  // namespace sizegate
