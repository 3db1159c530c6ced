#pragma once

#include <string_view>

#include "sizegate/http-status-code.hpp"

namespace sizegate::http {

// Header field names are case-insensitive (RFC 9110), they are stored here in their canonical form.
inline constexpr std::string_view ContentLength = "Content-Length";
inline constexpr std::string_view ContentType = "Content-Type";

// Reason Phrases (only those we currently emit explicitly)
inline constexpr std::string_view ReasonOK = "OK";                                      // 200
inline constexpr std::string_view ReasonCreated = "Created";                            // 201
inline constexpr std::string_view ReasonNoContent = "No Content";                       // 204
inline constexpr std::string_view ReasonBadRequest = "Bad Request";                     // 400
inline constexpr std::string_view ReasonNotFound = "Not Found";                         // 404
inline constexpr std::string_view ReasonLengthRequired = "Length Required";             // 411
inline constexpr std::string_view ReasonPayloadTooLarge = "Payload Too Large";          // 413
inline constexpr std::string_view ReasonUnsupportedMediaType = "Unsupported Media Type";  // 415
inline constexpr std::string_view ReasonInternalServerError = "Internal Server Error";  // 500

// Content type
inline constexpr std::string_view ContentTypeTextPlain = "text/plain";
inline constexpr std::string_view ContentTypeApplicationJson = "application/json";

// Return the canonical reason phrase for a subset of status codes we care about.
// If an unmapped status is provided, returns an empty string_view, letting callers
// decide whether to supply a custom phrase.
constexpr std::string_view ReasonPhraseFor(StatusCode status) noexcept {
  switch (status) {
    case StatusCodeOK:
      return ReasonOK;
    case StatusCodeCreated:
      return ReasonCreated;
    case StatusCodeNoContent:
      return ReasonNoContent;
    case StatusCodeBadRequest:
      return ReasonBadRequest;
    case StatusCodeNotFound:
      return ReasonNotFound;
    case StatusCodeLengthRequired:
      return ReasonLengthRequired;
    case StatusCodePayloadTooLarge:
      return ReasonPayloadTooLarge;
    case StatusCodeUnsupportedMediaType:
      return ReasonUnsupportedMediaType;
    case StatusCodeInternalServerError:
      return ReasonInternalServerError;
    default:
      return {};
  }
}

}  // namespace sizegate::http
