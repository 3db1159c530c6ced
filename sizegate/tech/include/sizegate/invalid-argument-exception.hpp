#pragma once

#include <format>
#include <stdexcept>
#include <utility>

namespace sizegate {

// Thrown by configuration validation and parsing helpers.
// Catchable as std::invalid_argument.
class invalid_argument : public std::invalid_argument {
 public:
  explicit invalid_argument(const char* str) : std::invalid_argument(str) {}

  template <typename... Args>
    requires(sizeof...(Args) > 0)
  explicit invalid_argument(std::format_string<Args...> fmt, Args&&... args)
      : std::invalid_argument(std::format(fmt, std::forward<Args>(args)...)) {}
};

}  // namespace sizegate
