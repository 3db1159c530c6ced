#pragma once

// sizegate::log is spdlog when SIZEGATE_ENABLE_SPDLOG is defined, a minimal stderr logger otherwise.
// Only debug, warn and error levels are used by the library.
#ifdef SIZEGATE_ENABLE_SPDLOG
#ifndef SPDLOG_HEADER_ONLY
#define SPDLOG_HEADER_ONLY
#endif
#include <spdlog/common.h>  // IWYU pragma: export
#include <spdlog/spdlog.h>  // IWYU pragma: export
#else
#include <atomic>
#include <chrono>
#include <cstdio>
#include <format>
#include <string>
#include <string_view>
#include <utility>
#endif

namespace sizegate {
#ifdef SIZEGATE_ENABLE_SPDLOG
namespace log = spdlog;
#else
namespace log {

// Same names and ordering as spdlog::level so that call sites compile against both.
namespace level {
enum level_enum : int { debug = 1, warn = 3, err = 4, off = 6 };
}  // namespace level

namespace detail {

inline std::atomic<level::level_enum> &Threshold() {
  static std::atomic<level::level_enum> threshold{level::warn};
  return threshold;
}

constexpr std::string_view LevelName(level::level_enum lvl) {
  switch (lvl) {
    case level::debug:
      return "debug";
    case level::warn:
      return "warn";
    case level::err:
      return "error";
    default:
      return "off";
  }
}

template <typename... Args>
void Emit(level::level_enum lvl, std::format_string<Args...> fmt, Args &&...args) {
  if (lvl < Threshold().load(std::memory_order_relaxed)) {
    return;
  }
  const auto now = std::chrono::floor<std::chrono::milliseconds>(std::chrono::system_clock::now());
  const std::string line =
      std::format("[{:%FT%T}Z] [{}] {}\n", now, LevelName(lvl), std::format(fmt, std::forward<Args>(args)...));
  std::fputs(line.c_str(), stderr);
}

}  // namespace detail

inline void set_level(level::level_enum lvl) { detail::Threshold().store(lvl, std::memory_order_relaxed); }
inline level::level_enum get_level() { return detail::Threshold().load(std::memory_order_relaxed); }

template <typename... Args>
void debug(std::format_string<Args...> fmt, Args &&...args) {
  detail::Emit(level::debug, fmt, std::forward<Args>(args)...);
}
template <typename... Args>
void warn(std::format_string<Args...> fmt, Args &&...args) {
  detail::Emit(level::warn, fmt, std::forward<Args>(args)...);
}
template <typename... Args>
void error(std::format_string<Args...> fmt, Args &&...args) {
  detail::Emit(level::err, fmt, std::forward<Args>(args)...);
}

}  // namespace log
#endif

}  // namespace sizegate
