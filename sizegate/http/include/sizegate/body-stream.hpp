#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include "sizegate/size-limit-error.hpp"

namespace sizegate {

// One item pulled from a BodyStream: a chunk of body bytes, the end of the body, or a terminal error.
class BodyChunk {
 public:
  enum class Kind : std::uint8_t { Data, End, Error };

  // Constructs an end of stream item.
  BodyChunk() noexcept = default;

  static BodyChunk Data(std::string bytes) noexcept { return BodyChunk(std::move(bytes)); }

  static BodyChunk End() noexcept { return {}; }

  static BodyChunk Error(SizeLimitError error) noexcept { return BodyChunk(std::move(error)); }

  // Error raised by the producer itself (connection reset, malformed framing...).
  static BodyChunk TransportError(std::string_view cause) { return Error(SizeLimitError::Transport(cause)); }

  [[nodiscard]] Kind kind() const noexcept { return static_cast<Kind>(_item.index()); }

  [[nodiscard]] bool isData() const noexcept { return kind() == Kind::Data; }
  [[nodiscard]] bool isEnd() const noexcept { return kind() == Kind::End; }
  [[nodiscard]] bool isError() const noexcept { return kind() == Kind::Error; }

  // Size of the data chunk, 0 for End and Error items.
  [[nodiscard]] std::size_t size() const noexcept {
    const auto* pData = std::get_if<std::string>(&_item);
    return pData == nullptr ? 0 : pData->size();
  }

  // Data bytes. Should only be called on Data items (throws std::bad_variant_access otherwise).
  [[nodiscard]] std::string_view data() const { return std::get<std::string>(_item); }

  [[nodiscard]] std::string&& takeData() && { return std::get<std::string>(std::move(_item)); }

  // Error. Should only be called on Error items (throws std::bad_variant_access otherwise).
  [[nodiscard]] const SizeLimitError& error() const { return std::get<SizeLimitError>(_item); }

 private:
  struct EndOfStream {};

  explicit BodyChunk(std::string bytes) noexcept : _item(std::in_place_index<0>, std::move(bytes)) {}

  explicit BodyChunk(SizeLimitError error) noexcept : _item(std::in_place_index<2>, std::move(error)) {}

  // Order matches Kind
  std::variant<std::string, EndOfStream, SizeLimitError> _item{std::in_place_index<1>};
};

// Pull based source of request body bytes.
// Each call to next() produces the following item of the body. Once End or Error has been returned, the stream is
// exhausted and subsequent calls return End. The producer only does work when next() is called, which bounds the
// amount of body bytes in flight to a single chunk (backpressure).
// Instances are not thread safe, a stream belongs to the request it is attached to.
class BodyStream {
 public:
  BodyStream() noexcept = default;

  BodyStream(const BodyStream&) = delete;
  BodyStream(BodyStream&&) = delete;
  BodyStream& operator=(const BodyStream&) = delete;
  BodyStream& operator=(BodyStream&&) = delete;

  virtual ~BodyStream() = default;

  virtual BodyChunk next() = 0;
};

using BodyStreamPtr = std::unique_ptr<BodyStream>;

// BodyStream over an in-memory body, delivered in chunks of at most 'chunkSize' bytes (whole body at once if 0).
// An empty body immediately yields End.
class StringBodyStream final : public BodyStream {
 public:
  explicit StringBodyStream(std::string body, std::size_t chunkSize = 0) noexcept
      : _body(std::move(body)), _chunkSize(chunkSize) {}

  BodyChunk next() override;

 private:
  std::string _body;
  std::size_t _chunkSize;
  std::size_t _pos{0};
};

}  // namespace sizegate
