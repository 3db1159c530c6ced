#include "sizegate/http-request.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "sizegate/body-stream.hpp"
#include "sizegate/http-constants.hpp"
#include "sizegate/http-header.hpp"
#include "sizegate/string-equal-ignore-case.hpp"
#include "sizegate/string-trim.hpp"
#include "sizegate/stringconv.hpp"

namespace sizegate {

HttpRequest& HttpRequest::header(std::string_view name, std::string_view value) {
  for (http::Header& existing : _headers) {
    if (CaseInsensitiveEqual(existing.name(), name)) {
      existing.value(value);
      return *this;
    }
  }
  _headers.emplace_back(name, value);
  return *this;
}

std::optional<std::string_view> HttpRequest::headerValue(std::string_view headerKey) const noexcept {
  const http::Header* pHeader = http::FindHeader(_headers, headerKey);
  if (pHeader != nullptr) {
    return pHeader->value();
  }
  return {};
}

std::optional<std::string_view> HttpRequest::contentType() const noexcept { return headerValue(http::ContentType); }

std::optional<std::size_t> HttpRequest::declaredContentLength() const noexcept {
  const auto optValue = headerValue(http::ContentLength);
  if (!optValue) {
    return {};
  }
  return TryStringToIntegral<std::size_t>(TrimOws(*optValue));
}

void HttpRequest::setBody(BodyStreamPtr stream) noexcept {
  _bodyExhausted = stream == nullptr;
  _bodyStream = std::move(stream);
  _body.clear();
  _activeStreamingChunk.clear();
  _bodyError.reset();
  _bodyAccessMode = BodyAccessMode::Undecided;
  _materialized = false;
}

void HttpRequest::setBody(std::string materializedBody) noexcept {
  _bodyStream.reset();
  _body = std::move(materializedBody);
  _activeStreamingChunk.clear();
  _bodyError.reset();
  _bodyAccessMode = BodyAccessMode::Undecided;
  _materialized = true;
  _bodyExhausted = _body.empty();
}

BodyStreamPtr HttpRequest::takeBody() {
  _bodyExhausted = true;
  if (_materialized) {
    _materialized = false;
    return std::make_unique<StringBodyStream>(std::exchange(_body, {}));
  }
  return std::move(_bodyStream);
}

bool HttpRequest::pullInto(std::string& out) {
  BodyChunk chunk = _bodyStream->next();
  switch (chunk.kind()) {
    case BodyChunk::Kind::Data:
      out.append(chunk.data());
      return true;
    case BodyChunk::Kind::End:
      _bodyExhausted = true;
      return false;
    case BodyChunk::Kind::Error:
      _bodyExhausted = true;
      _bodyError = chunk.error();
      throw BodyReadError(chunk.error());
  }
  return false;
}

std::string_view HttpRequest::body() {
  if (_bodyAccessMode == BodyAccessMode::Streaming) {
    throw std::logic_error("Cannot call body() after readBody() on the same request");
  }
  _bodyAccessMode = BodyAccessMode::Aggregated;
  if (_bodyError) {
    throw BodyReadError(*_bodyError);
  }
  if (!_materialized) {
    while (!_bodyExhausted && pullInto(_body)) {
    }
  }
  return _body;
}

bool HttpRequest::hasMoreBody() const noexcept {
  if (_bodyAccessMode == BodyAccessMode::Aggregated) {
    return false;
  }
  return !_bodyExhausted;
}

std::string_view HttpRequest::readBody() {
  if (_bodyAccessMode == BodyAccessMode::Aggregated) {
    throw std::logic_error("Cannot call readBody() after body() on the same request");
  }
  _bodyAccessMode = BodyAccessMode::Streaming;
  _activeStreamingChunk.clear();
  if (_bodyExhausted) {
    return {};
  }
  if (_materialized) {
    _bodyExhausted = true;
    _activeStreamingChunk = std::exchange(_body, {});
    return _activeStreamingChunk;
  }
  // Skip empty data chunks so that an empty view always means end of body.
  while (_activeStreamingChunk.empty() && pullInto(_activeStreamingChunk)) {
  }
  return _activeStreamingChunk;
}

}  // namespace sizegate
