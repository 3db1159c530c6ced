#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include "sizegate/http-status-code.hpp"

namespace sizegate {

// Reason why a request body was refused. Size violations are detected by the enforcers as close to the byte source
// as possible and carried as values up to the error rendering layer.
class SizeLimitError {
 public:
  // Cumulative body bytes (or declared Content-Length) exceeded the resolved limit.
  struct BodyTooLarge {
    std::size_t maxSize;
    std::size_t actualSize;

    bool operator==(const BodyTooLarge&) const noexcept = default;
  };

  // A single chunk exceeded the individual chunk ceiling, independently of the body limit.
  struct ChunkTooLarge {
    std::size_t maxChunkSize;
    std::size_t actualChunkSize;

    bool operator==(const ChunkTooLarge&) const noexcept = default;
  };

  // Accumulating the body size would overflow std::size_t.
  struct SizeOverflow {
    bool operator==(const SizeOverflow&) const noexcept = default;
  };

  // Failure unrelated to sizing.
  struct Other {
    enum class Origin : std::uint8_t {
      Transport,  // the body producer (connection) failed, client side issue
      Internal    // unexpected server side fault
    };

    std::string message;
    Origin origin{Origin::Transport};

    bool operator==(const Other&) const noexcept = default;
  };

  using Kind = std::variant<BodyTooLarge, ChunkTooLarge, SizeOverflow, Other>;

  // NOLINTBEGIN(google-explicit-constructor)
  SizeLimitError(BodyTooLarge err) noexcept : _kind(err) {}
  SizeLimitError(ChunkTooLarge err) noexcept : _kind(err) {}
  SizeLimitError(SizeOverflow err) noexcept : _kind(err) {}
  SizeLimitError(Other err) noexcept : _kind(std::move(err)) {}
  // NOLINTEND(google-explicit-constructor)

  static SizeLimitError Transport(std::string_view message) {
    return Other{std::string(message), Other::Origin::Transport};
  }

  static SizeLimitError Internal(std::string_view message) {
    return Other{std::string(message), Other::Origin::Internal};
  }

  [[nodiscard]] const Kind& kind() const noexcept { return _kind; }

  template <class T>
  [[nodiscard]] bool is() const noexcept {
    return std::holds_alternative<T>(_kind);
  }

  // Returns a pointer to the alternative T if held, nullptr otherwise.
  template <class T>
  [[nodiscard]] const T* getIf() const noexcept {
    return std::get_if<T>(&_kind);
  }

  // HTTP status for this error:
  //  - 413 for BodyTooLarge and ChunkTooLarge
  //  - 400 for SizeOverflow and transport errors
  //  - 500 for internal errors
  [[nodiscard]] http::StatusCode statusCode() const noexcept;

  // Human readable, one line description, such as "Body too large: Maximum size is 50 bytes".
  [[nodiscard]] std::string message() const;

  bool operator==(const SizeLimitError&) const noexcept = default;

 private:
  Kind _kind;
};

}  // namespace sizegate
