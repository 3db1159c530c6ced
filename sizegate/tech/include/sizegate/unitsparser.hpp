#pragma once

#include <cstddef>
#include <string_view>

namespace sizegate {

// Parses a human readable byte quantity into a number of bytes.
// Format: <number>[spaces]<unit>, case insensitive, surrounding spaces ignored.
//  - number: digits with an optional decimal part ('.' or ',' as separator), e.g. "1.5", "1,5", "1024"
//  - unit (optional, defaults to bytes):
//      b, byte, bytes                 -> 1
//      kb, kilobyte(s)                -> 1000        kib, kibibyte(s) -> 1024
//      mb, megabyte(s)                -> 1000^2      mib, mebibyte(s) -> 1024^2
//      gb, gigabyte(s)                -> 1000^3      gib, gibibyte(s) -> 1024^3
//      kbit, kilobit(s)               -> 125
//      mbit, megabit(s)               -> 125'000
//      gbit, gigabit(s)               -> 125'000'000
// Fractional results are truncated toward zero.
// Examples:
//   "1024"   -> 1024
//   "1.5MB"  -> 1'500'000
//   "2.5 GB" -> 2'500'000'000
//   "1MiB"   -> 1'048'576
//   "10Mbit" -> 1'250'000
// Throws invalid_argument for empty strings, missing number, invalid number, unknown unit or values that do not
// fit in std::size_t.
std::size_t ParseHumanSize(std::string_view sizeStr);

}  // namespace sizegate
