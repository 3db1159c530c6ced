#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "sizegate/body-stream.hpp"
#include "sizegate/http-header.hpp"
#include "sizegate/size-limit-error.hpp"

namespace sizegate {

// Thrown by HttpRequest body accessors when the body stream delivers an error item
// (size limit violation or transport failure).
class BodyReadError : public std::runtime_error {
 public:
  explicit BodyReadError(SizeLimitError error) : std::runtime_error(error.message()), _error(std::move(error)) {}

  [[nodiscard]] const SizeLimitError& error() const noexcept { return _error; }

 private:
  SizeLimitError _error;
};

// In-process model of an incoming HTTP request, as seen by the size limit pipeline and the handlers.
// The body is either a pull based BodyStream (possibly wrapped by an enforcer) or an already materialized buffer.
// The hosting server fills headers and body; the pipeline may replace the body before the handler runs.
class HttpRequest {
 public:
  HttpRequest() noexcept = default;

  // Adds or replaces a header (case-insensitive name match). Throws std::invalid_argument for invalid headers.
  HttpRequest& header(std::string_view name, std::string_view value);

  // Returns the header value for the given key (case-insensitive) or std::nullopt if absent.
  [[nodiscard]] std::optional<std::string_view> headerValue(std::string_view headerKey) const noexcept;

  // Like headerValue() but returns an empty string_view for absent headers.
  [[nodiscard]] std::string_view headerValueOrEmpty(std::string_view headerKey) const noexcept {
    return headerValue(headerKey).value_or(std::string_view{});
  }

  [[nodiscard]] const std::vector<http::Header>& headers() const noexcept { return _headers; }

  // Raw Content-Type header value, std::nullopt if absent.
  [[nodiscard]] std::optional<std::string_view> contentType() const noexcept;

  // Declared Content-Length, std::nullopt if absent or not a valid non-negative integer.
  // The declared length is untrusted, it is only a hint.
  [[nodiscard]] std::optional<std::size_t> declaredContentLength() const noexcept;

  // Replaces the body by given stream. Resets any body state (read mode, recorded error).
  void setBody(BodyStreamPtr stream) noexcept;

  // Replaces the body by an already materialized buffer.
  void setBody(std::string materializedBody) noexcept;

  // Takes ownership of the current body stream, leaving the request without body stream.
  // If the body was materialized, returns a stream delivering it in a single chunk.
  // Returns nullptr if there is no body at all.
  [[nodiscard]] BodyStreamPtr takeBody();

  // Tells whether the body is an in-memory buffer (set by setBody(std::string)).
  [[nodiscard]] bool isBodyMaterialized() const noexcept { return _materialized; }

  // Get the whole body of the request, reading the remaining of the body stream if needed.
  // Throws BodyReadError if the stream delivers an error (it is also recorded, see bodyError()).
  // Throws std::logic_error if readBody() was previously called on this request.
  [[nodiscard]] std::string_view body();

  // Indicates whether additional body data remains to be read via readBody().
  [[nodiscard]] bool hasMoreBody() const noexcept;

  // Streaming accessor for the body. Returns the next chunk of the body, as a view that remains valid until the next
  // readBody() invocation. An empty view means the body has been fully read.
  // Throws BodyReadError if the stream delivers an error (it is also recorded, see bodyError()).
  // Throws std::logic_error if body() was previously called on this request.
  [[nodiscard]] std::string_view readBody();

  // Error delivered by the body stream during a body() or readBody() call, if any.
  // Allows the pipeline to report a size violation observed by the handler, even if the handler swallowed it.
  [[nodiscard]] const std::optional<SizeLimitError>& bodyError() const noexcept { return _bodyError; }

 private:
  enum class BodyAccessMode : std::uint8_t { Undecided, Streaming, Aggregated };

  // Pulls next item from the stream, returns true if data has been appended to 'out'.
  bool pullInto(std::string& out);

  std::vector<http::Header> _headers;
  BodyStreamPtr _bodyStream;
  std::string _body;
  std::string _activeStreamingChunk;
  std::optional<SizeLimitError> _bodyError;
  BodyAccessMode _bodyAccessMode{BodyAccessMode::Undecided};
  bool _materialized{false};
  bool _bodyExhausted{true};
};

}  // namespace sizegate
