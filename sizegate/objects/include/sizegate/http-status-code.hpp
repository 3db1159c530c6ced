#pragma once

#include <cstdint>

namespace sizegate::http {

using StatusCode = int16_t;

inline constexpr StatusCode StatusCodeOK = 200;
inline constexpr StatusCode StatusCodeCreated = 201;
inline constexpr StatusCode StatusCodeNoContent = 204;

inline constexpr StatusCode StatusCodeBadRequest = 400;
inline constexpr StatusCode StatusCodeNotFound = 404;
inline constexpr StatusCode StatusCodeLengthRequired = 411;
inline constexpr StatusCode StatusCodePayloadTooLarge = 413;
inline constexpr StatusCode StatusCodeUnsupportedMediaType = 415;

inline constexpr StatusCode StatusCodeInternalServerError = 500;

}  // namespace sizegate::http
