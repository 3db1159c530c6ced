#include "sizegate/http-response.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "sizegate/http-constants.hpp"
#include "sizegate/http-header.hpp"
#include "sizegate/http-status-code.hpp"
#include "sizegate/string-equal-ignore-case.hpp"

namespace sizegate {

HttpResponse::HttpResponse(http::StatusCode code, std::string_view reason) : _status(code) { setStatus(code, reason); }

HttpResponse::HttpResponse(std::string_view body, std::string_view contentType) : HttpResponse() {
  setBody(std::string(body), contentType);
}

std::optional<std::string_view> HttpResponse::headerValue(std::string_view key) const noexcept {
  const http::Header* pHeader = http::FindHeader(_headers, key);
  if (pHeader != nullptr) {
    return pHeader->value();
  }
  return {};
}

void HttpResponse::setStatus(http::StatusCode statusCode, std::string_view reason) {
  _status = statusCode;
  _reason = reason.empty() ? http::ReasonPhraseFor(statusCode) : reason;
}

void HttpResponse::setHeader(std::string_view key, std::string_view value) {
  for (http::Header& existing : _headers) {
    if (CaseInsensitiveEqual(existing.name(), key)) {
      existing.value(value);
      return;
    }
  }
  _headers.emplace_back(key, value);
}

void HttpResponse::setBody(std::string body, std::string_view contentType) {
  _body = std::move(body);
  if (_body.empty()) {
    std::erase_if(_headers,
                  [](const http::Header& header) { return CaseInsensitiveEqual(header.name(), http::ContentType); });
  } else {
    setHeader(http::ContentType, contentType);
  }
}

}  // namespace sizegate
