#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "sizegate/body-stream.hpp"

namespace sizegate::test {

// Observable state of a ScriptedBodyStream, shared with the test so that it survives the stream itself.
struct ScriptedBodyStreamProbe {
  // Number of next() calls received by the stream.
  std::size_t nbPolls{0};
  bool destroyed{false};
};

// BodyStream replaying a scripted sequence of items (data chunks, then optionally an error), used to simulate a
// request body producer. After the script is exhausted, End is returned.
// The probe records each poll and the destruction of the stream.
//   auto probe = std::make_shared<ScriptedBodyStreamProbe>();
//   auto stream = ScriptedBodyStream::Chunks({"ab", "cd"}, probe);
class ScriptedBodyStream final : public BodyStream {
 public:
  explicit ScriptedBodyStream(std::vector<BodyChunk> script, std::shared_ptr<ScriptedBodyStreamProbe> probe = {});

  ScriptedBodyStream(const ScriptedBodyStream&) = delete;
  ScriptedBodyStream(ScriptedBodyStream&&) = delete;
  ScriptedBodyStream& operator=(const ScriptedBodyStream&) = delete;
  ScriptedBodyStream& operator=(ScriptedBodyStream&&) = delete;

  ~ScriptedBodyStream() override;

  // Stream delivering given chunks, then End.
  static std::unique_ptr<ScriptedBodyStream> Chunks(const std::vector<std::string>& chunks,
                                                    std::shared_ptr<ScriptedBodyStreamProbe> probe = {});

  // Stream delivering given chunks, then a transport error with given cause.
  static std::unique_ptr<ScriptedBodyStream> ChunksThenError(const std::vector<std::string>& chunks,
                                                             std::string_view cause,
                                                             std::shared_ptr<ScriptedBodyStreamProbe> probe = {});

  // Stream delivering 'nbChunks' chunks of 'chunkSize' bytes each, then End.
  static std::unique_ptr<ScriptedBodyStream> Repeated(std::size_t nbChunks, std::size_t chunkSize,
                                                      std::shared_ptr<ScriptedBodyStreamProbe> probe = {});

  BodyChunk next() override;

 private:
  std::vector<BodyChunk> _script;
  std::size_t _pos{0};
  std::shared_ptr<ScriptedBodyStreamProbe> _probe;
};

}  // namespace sizegate::test
