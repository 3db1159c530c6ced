#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "sizegate/unitsparser.hpp"

namespace sizegate {

// A byte quantity used to express body size limits.
// Implicitly constructible from a number of bytes and from a human readable string (see ParseHumanSize), so that
// builder methods accept both:
//   config.withDefaultLimit(1024).withSpecificLimit("application/json", "1.5MB");
class SizeLimit {
 public:
  static const SizeLimit KB;
  static const SizeLimit MB;
  static const SizeLimit GB;
  static const SizeLimit KiB;
  static const SizeLimit MiB;
  static const SizeLimit GiB;

  constexpr SizeLimit() noexcept = default;

  // NOLINTNEXTLINE(google-explicit-constructor)
  constexpr SizeLimit(std::size_t bytes) noexcept : _bytes(bytes) {}

  // Throws invalid_argument if 'humanSize' cannot be parsed.
  // NOLINTNEXTLINE(google-explicit-constructor)
  SizeLimit(std::string_view humanSize) : _bytes(ParseHumanSize(humanSize)) {}

  // NOLINTNEXTLINE(google-explicit-constructor)
  SizeLimit(const std::string& humanSize) : SizeLimit(std::string_view(humanSize)) {}

  template <std::size_t N>
  // NOLINTNEXTLINE(google-explicit-constructor,cppcoreguidelines-avoid-c-arrays)
  SizeLimit(const char (&humanSize)[N]) : SizeLimit(std::string_view(humanSize, N - 1)) {}

  static constexpr SizeLimit Bytes(std::size_t bytes) noexcept { return {bytes}; }

  static constexpr SizeLimit Kb(double kb) noexcept { return {static_cast<std::size_t>(kb * 1000.0)}; }
  static constexpr SizeLimit Mb(double mb) noexcept { return {static_cast<std::size_t>(mb * 1'000'000.0)}; }
  static constexpr SizeLimit Gb(double gb) noexcept { return {static_cast<std::size_t>(gb * 1'000'000'000.0)}; }

  static constexpr SizeLimit Kib(double kib) noexcept { return {static_cast<std::size_t>(kib * 1024.0)}; }
  static constexpr SizeLimit Mib(double mib) noexcept { return {static_cast<std::size_t>(mib * 1'048'576.0)}; }
  static constexpr SizeLimit Gib(double gib) noexcept { return {static_cast<std::size_t>(gib * 1'073'741'824.0)}; }

  static constexpr SizeLimit Kbit(double kbit) noexcept { return {static_cast<std::size_t>(kbit * 125.0)}; }
  static constexpr SizeLimit Mbit(double mbit) noexcept { return {static_cast<std::size_t>(mbit * 125'000.0)}; }
  static constexpr SizeLimit Gbit(double gbit) noexcept { return {static_cast<std::size_t>(gbit * 125'000'000.0)}; }

  [[nodiscard]] constexpr std::size_t bytes() const noexcept { return _bytes; }

  constexpr bool operator==(const SizeLimit&) const noexcept = default;

 private:
  std::size_t _bytes{0};
};

// Named constants are binary multiples (1 KB == 1024 bytes here), contrary to the Kb()/Mb()/Gb() helpers which are
// decimal.
inline constexpr SizeLimit SizeLimit::KB{1024UL};
inline constexpr SizeLimit SizeLimit::MB{1024UL * 1024UL};
inline constexpr SizeLimit SizeLimit::GB{1024UL * 1024UL * 1024UL};
inline constexpr SizeLimit SizeLimit::KiB{1024UL};
inline constexpr SizeLimit SizeLimit::MiB{1024UL * 1024UL};
inline constexpr SizeLimit SizeLimit::GiB{1024UL * 1024UL * 1024UL};

}  // namespace sizegate
