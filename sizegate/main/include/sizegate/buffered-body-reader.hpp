#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include "sizegate/body-stream.hpp"
#include "sizegate/size-limit-error.hpp"

namespace sizegate {

// Outcome of ReadBodyWithLimit: either the whole body, or the reason why it was refused.
class BufferedBody {
 public:
  explicit BufferedBody(std::string body) noexcept : _result(std::in_place_index<0>, std::move(body)) {}

  explicit BufferedBody(SizeLimitError error) noexcept : _result(std::in_place_index<1>, std::move(error)) {}

  [[nodiscard]] bool hasError() const noexcept { return _result.index() == 1; }

  // Should only be called when !hasError().
  [[nodiscard]] std::string_view body() const { return std::get<0>(_result); }

  [[nodiscard]] std::string takeBody() && { return std::get<0>(std::move(_result)); }

  // Should only be called when hasError().
  [[nodiscard]] const SizeLimitError& error() const { return std::get<1>(_result); }

 private:
  std::variant<std::string, SizeLimitError> _result;
};

// Reads the whole body from 'body' into a single buffer, never holding more than 'maxSize' bytes.
// Reading stops at the first chunk that would push the total beyond 'maxSize', which gives
// BodyTooLarge{maxSize, bytes held + offending chunk size}. A producer error is returned as is (transport error).
// The final length is checked again against 'maxSize' once the end of the body is reached.
[[nodiscard]] BufferedBody ReadBodyWithLimit(BodyStream& body, std::size_t maxSize);

}  // namespace sizegate
