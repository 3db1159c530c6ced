#pragma once

#include <concepts>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "sizegate/http-constants.hpp"
#include "sizegate/http-header.hpp"
#include "sizegate/http-status-code.hpp"
#include "sizegate/stringconv.hpp"

namespace sizegate {

// HTTP response produced by handlers and by the error renderers.
// Setters exist in lvalue and rvalue flavors so that responses can be built fluently:
//   return HttpResponse(http::StatusCodeCreated).header("X-Id", 42).body("done");
class HttpResponse {
 public:
  // Constructs an HttpResponse with the given status code and optional reason phrase.
  // An empty reason is replaced by the canonical one for known status codes.
  explicit HttpResponse(http::StatusCode code = http::StatusCodeOK, std::string_view reason = {});

  // Constructs an HttpResponse with a 200 status code and given body.
  explicit HttpResponse(std::string_view body, std::string_view contentType = http::ContentTypeTextPlain);

  [[nodiscard]] http::StatusCode status() const noexcept { return _status; }

  [[nodiscard]] std::string_view reason() const noexcept { return _reason; }

  // Retrieves the value of the given header key (case-insensitive), std::nullopt if absent.
  [[nodiscard]] std::optional<std::string_view> headerValue(std::string_view key) const noexcept;

  // Retrieves the value of the given header key (case-insensitive), an empty string_view if absent.
  [[nodiscard]] std::string_view headerValueOrEmpty(std::string_view key) const noexcept {
    return headerValue(key).value_or(std::string_view{});
  }

  [[nodiscard]] const std::vector<http::Header>& headers() const noexcept { return _headers; }

  // Get a view of the current body stored in this HttpResponse.
  [[nodiscard]] std::string_view body() const noexcept { return _body; }

  // Replaces the status code (and the reason phrase by the canonical one).
  HttpResponse& status(http::StatusCode statusCode) & {
    setStatus(statusCode, {});
    return *this;
  }

  HttpResponse&& status(http::StatusCode statusCode) && {
    setStatus(statusCode, {});
    return std::move(*this);
  }

  // Replaces the status code and the reason phrase.
  HttpResponse& status(http::StatusCode statusCode, std::string_view reason) & {
    setStatus(statusCode, reason);
    return *this;
  }

  HttpResponse&& status(http::StatusCode statusCode, std::string_view reason) && {
    setStatus(statusCode, reason);
    return std::move(*this);
  }

  // Add or replace a header value entirely ensuring at most one instance (case-insensitive name comparison).
  // Throws std::invalid_argument for invalid header names or values.
  HttpResponse& header(std::string_view key, std::string_view value) & {
    setHeader(key, value);
    return *this;
  }

  // Convenient overload setting a header to a numeric value.
  HttpResponse& header(std::string_view key, std::integral auto value) & {
    setHeader(key, IntegralToString(value));
    return *this;
  }

  HttpResponse&& header(std::string_view key, std::string_view value) && {
    setHeader(key, value);
    return std::move(*this);
  }

  HttpResponse&& header(std::string_view key, std::integral auto value) && {
    setHeader(key, IntegralToString(value));
    return std::move(*this);
  }

  // Assigns the given body to this HttpResponse, and sets the Content-Type header accordingly
  // (Content-Type is removed for an empty body).
  HttpResponse& body(std::string body, std::string_view contentType = http::ContentTypeTextPlain) & {
    setBody(std::move(body), contentType);
    return *this;
  }

  HttpResponse&& body(std::string body, std::string_view contentType = http::ContentTypeTextPlain) && {
    setBody(std::move(body), contentType);
    return std::move(*this);
  }

  HttpResponse& body(std::string_view body, std::string_view contentType = http::ContentTypeTextPlain) & {
    setBody(std::string(body), contentType);
    return *this;
  }

  HttpResponse&& body(std::string_view body, std::string_view contentType = http::ContentTypeTextPlain) && {
    setBody(std::string(body), contentType);
    return std::move(*this);
  }

  HttpResponse& body(const char* body, std::string_view contentType = http::ContentTypeTextPlain) & {
    setBody(std::string(body), contentType);
    return *this;
  }

  HttpResponse&& body(const char* body, std::string_view contentType = http::ContentTypeTextPlain) && {
    setBody(std::string(body), contentType);
    return std::move(*this);
  }

  bool operator==(const HttpResponse&) const noexcept = default;

 private:
  void setStatus(http::StatusCode statusCode, std::string_view reason);

  void setHeader(std::string_view key, std::string_view value);

  void setBody(std::string body, std::string_view contentType);

  http::StatusCode _status;
  std::string _reason;
  std::vector<http::Header> _headers;
  std::string _body;
};

}  // namespace sizegate
