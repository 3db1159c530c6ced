#include "sizegate/size-limit-error.hpp"

#include <format>
#include <string>
#include <type_traits>
#include <variant>

#include "sizegate/http-status-code.hpp"

namespace sizegate {

// NOLINTNEXTLINE(bugprone-exception-escape)
http::StatusCode SizeLimitError::statusCode() const noexcept {
  return std::visit(
      [](const auto& err) -> http::StatusCode {
        using T = std::decay_t<decltype(err)>;
        if constexpr (std::is_same_v<T, BodyTooLarge> || std::is_same_v<T, ChunkTooLarge>) {
          return http::StatusCodePayloadTooLarge;
        } else if constexpr (std::is_same_v<T, SizeOverflow>) {
          return http::StatusCodeBadRequest;
        } else {
          return err.origin == Other::Origin::Internal ? http::StatusCodeInternalServerError
                                                       : http::StatusCodeBadRequest;
        }
      },
      _kind);
}

std::string SizeLimitError::message() const {
  return std::visit(
      [](const auto& err) -> std::string {
        using T = std::decay_t<decltype(err)>;
        if constexpr (std::is_same_v<T, BodyTooLarge>) {
          return std::format("Body too large: Maximum size is {} bytes", err.maxSize);
        } else if constexpr (std::is_same_v<T, ChunkTooLarge>) {
          return std::format("Chunk too large: Maximum chunk size is {} bytes", err.maxChunkSize);
        } else if constexpr (std::is_same_v<T, SizeOverflow>) {
          return "Size overflow error";
        } else {
          return std::format("Error: {}", err.message);
        }
      },
      _kind);
}

}  // namespace sizegate
