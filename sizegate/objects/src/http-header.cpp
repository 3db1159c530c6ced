#include "sizegate/http-header.hpp"

#include <algorithm>
#include <span>
#include <string_view>

#include "sizegate/invalid-argument-exception.hpp"
#include "sizegate/string-equal-ignore-case.hpp"
#include "sizegate/string-trim.hpp"

namespace sizegate::http {

namespace {

constexpr bool IsTchar(char ch) noexcept {
  if ((ch >= '0' && ch <= '9') || (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z')) {
    return true;
  }
  return std::string_view("!#$%&'*+-.^_`|~").contains(ch);
}

}  // namespace

Header::Header(std::string_view name, std::string_view value) {
  if (!IsValidHeaderName(name)) {
    throw invalid_argument("Invalid HTTP header name '{}'", name);
  }
  _name = name;
  this->value(value);
}

void Header::value(std::string_view newValue) {
  newValue = TrimOws(newValue);
  if (!IsValidHeaderValue(newValue)) {
    throw invalid_argument("Invalid value for HTTP header '{}'", _name);
  }
  _value = newValue;
}

bool IsValidHeaderName(std::string_view name) noexcept {
  return !name.empty() && std::ranges::all_of(name, IsTchar);
}

bool IsValidHeaderValue(std::string_view value) noexcept {
  return std::ranges::all_of(value, [](unsigned char ch) {
    if (ch == '\r' || ch == '\n') {
      return false;
    }
    if (ch == '\t') {
      return true;
    }
    // Visible ASCII characters, and obs-text
    return ch >= 0x20 && ch != 0x7F;
  });
}

const Header* FindHeader(std::span<const Header> headers, std::string_view name) noexcept {
  const auto it =
      std::ranges::find_if(headers, [name](const Header& header) { return CaseInsensitiveEqual(header.name(), name); });
  return it == headers.end() ? nullptr : &*it;
}

}  // namespace sizegate::http
