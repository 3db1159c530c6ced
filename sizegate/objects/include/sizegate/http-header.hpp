#pragma once

#include <span>
#include <string>
#include <string_view>

namespace sizegate::http {

// Represents a single HTTP header field.
// The name and value are validated upon construction.
class Header {
 public:
  // Constructs a Header with the given name and value.
  // The value is trimmed of optional white spaces.
  // Throws std::invalid_argument if the name or the value is invalid.
  Header(std::string_view name, std::string_view value);

  [[nodiscard]] std::string_view name() const noexcept { return _name; }

  [[nodiscard]] std::string_view value() const noexcept { return _value; }

  // Replaces the value (validated and trimmed as in the constructor).
  void value(std::string_view newValue);

  bool operator==(const Header&) const noexcept = default;

 private:
  std::string _name;
  std::string _value;
};

// RFC 9110 §5.6.3: Header field values can be preceded and followed by optional whitespace (OWS).
constexpr bool IsHeaderWhitespace(char ch) noexcept { return ch == ' ' || ch == '\t'; }

// Validates that a header name consists only of tchar characters as per RFC 9110 §5.6.2.
bool IsValidHeaderName(std::string_view name) noexcept;

// Validates that a header value does not contain CR, LF or other control characters (HTAB is allowed).
// The empty value is allowed.
bool IsValidHeaderValue(std::string_view value) noexcept;

// Returns a pointer to the first header named 'name' (case-insensitive), or nullptr if absent.
const Header* FindHeader(std::span<const Header> headers, std::string_view name) noexcept;

}  // namespace sizegate::http
