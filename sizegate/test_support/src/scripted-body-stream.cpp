#include "sizegate/scripted-body-stream.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "sizegate/body-stream.hpp"

namespace sizegate::test {

namespace {

std::vector<BodyChunk> DataScript(const std::vector<std::string>& chunks) {
  std::vector<BodyChunk> script;
  script.reserve(chunks.size() + 1U);
  for (const std::string& chunk : chunks) {
    script.push_back(BodyChunk::Data(chunk));
  }
  return script;
}

}  // namespace

ScriptedBodyStream::ScriptedBodyStream(std::vector<BodyChunk> script, std::shared_ptr<ScriptedBodyStreamProbe> probe)
    : _script(std::move(script)), _probe(std::move(probe)) {}

ScriptedBodyStream::~ScriptedBodyStream() {
  if (_probe) {
    _probe->destroyed = true;
  }
}

std::unique_ptr<ScriptedBodyStream> ScriptedBodyStream::Chunks(const std::vector<std::string>& chunks,
                                                               std::shared_ptr<ScriptedBodyStreamProbe> probe) {
  return std::make_unique<ScriptedBodyStream>(DataScript(chunks), std::move(probe));
}

std::unique_ptr<ScriptedBodyStream> ScriptedBodyStream::ChunksThenError(
    const std::vector<std::string>& chunks, std::string_view cause, std::shared_ptr<ScriptedBodyStreamProbe> probe) {
  std::vector<BodyChunk> script = DataScript(chunks);
  script.push_back(BodyChunk::TransportError(cause));
  return std::make_unique<ScriptedBodyStream>(std::move(script), std::move(probe));
}

std::unique_ptr<ScriptedBodyStream> ScriptedBodyStream::Repeated(std::size_t nbChunks, std::size_t chunkSize,
                                                                 std::shared_ptr<ScriptedBodyStreamProbe> probe) {
  std::vector<BodyChunk> script;
  script.reserve(nbChunks);
  for (std::size_t chunkPos = 0; chunkPos < nbChunks; ++chunkPos) {
    script.push_back(BodyChunk::Data(std::string(chunkSize, static_cast<char>('a' + (chunkPos % 26U)))));
  }
  return std::make_unique<ScriptedBodyStream>(std::move(script), std::move(probe));
}

BodyChunk ScriptedBodyStream::next() {
  if (_probe) {
    ++_probe->nbPolls;
  }
  if (_pos == _script.size()) {
    return BodyChunk::End();
  }
  BodyChunk item = std::move(_script[_pos++]);
  if (!item.isData()) {
    // terminal item
    _script.resize(_pos);
  }
  return item;
}

}  // namespace sizegate::test
