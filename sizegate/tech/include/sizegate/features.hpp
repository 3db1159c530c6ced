#pragma once

namespace sizegate {

#ifdef SIZEGATE_ENABLE_SPDLOG
constexpr bool spdLogEnabled() { return true; }
#else
constexpr bool spdLogEnabled() { return false; }
#endif

#ifdef SIZEGATE_ENABLE_GLAZE
constexpr bool glazeEnabled() { return true; }
#else
constexpr bool glazeEnabled() { return false; }
#endif

}  // namespace sizegate
