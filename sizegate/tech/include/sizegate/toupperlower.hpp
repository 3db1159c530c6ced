#pragma once

#include <string>
#include <string_view>

namespace sizegate {

constexpr unsigned char tolower(unsigned char ch) {
  if (ch >= 'A' && ch <= 'Z') {
    ch |= 0x20;
  }
  return ch;
}

constexpr char tolower(char ch) { return static_cast<char>(tolower(static_cast<unsigned char>(ch))); }

// Returns an ASCII lower-cased copy of 'str'. Non ASCII bytes are kept as is.
constexpr std::string ToLowerCopy(std::string_view str) {
  std::string ret(str);
  for (char& ch : ret) {
    ch = tolower(ch);
  }
  return ret;
}

}  // namespace sizegate
