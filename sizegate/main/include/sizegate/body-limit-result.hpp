#pragma once

#include <cstddef>
#include <cstdint>
#include <utility>
#include <variant>

#include "sizegate/size-limit-error.hpp"

namespace sizegate {

// How the body of an accepted request is handed to the handler.
enum class BodyMode : std::uint8_t { Buffered, Streamed };

// Decision of the body limit pipeline for a request: continue (with the resolved limit and body mode),
// or reject with a SizeLimitError.
class BodyLimitResult {
 public:
  static BodyLimitResult Continue(std::size_t limit, BodyMode mode) noexcept {
    return BodyLimitResult(Accepted{limit, mode});
  }

  static BodyLimitResult Reject(SizeLimitError error) noexcept { return BodyLimitResult(std::move(error)); }

  [[nodiscard]] bool shouldContinue() const noexcept { return _result.index() == 0; }

  [[nodiscard]] bool isRejected() const noexcept { return _result.index() == 1; }

  // Resolved body limit. Should only be called on a Continue result.
  [[nodiscard]] std::size_t limit() const { return std::get<Accepted>(_result).limit; }

  // Chosen body mode. Should only be called on a Continue result.
  [[nodiscard]] BodyMode mode() const { return std::get<Accepted>(_result).mode; }

  // Should only be called on a Reject result.
  [[nodiscard]] const SizeLimitError& error() const { return std::get<SizeLimitError>(_result); }

 private:
  struct Accepted {
    std::size_t limit;
    BodyMode mode;
  };

  explicit BodyLimitResult(Accepted accepted) noexcept : _result(accepted) {}

  explicit BodyLimitResult(SizeLimitError error) noexcept : _result(std::move(error)) {}

  std::variant<Accepted, SizeLimitError> _result;
};

}  // namespace sizegate
