#pragma once

#ifdef SIZEGATE_ENABLE_GLAZE

#include <glaze/glaze.hpp>  // IWYU pragma: export
#include <string>

namespace sizegate {

/// Serialize a C++ object to JSON string using glaze.
/// Template parameter T must be a type that glaze can serialize (aggregate or with a glz::meta specialization).
/// Members held in an empty std::optional are omitted from the output.
template <typename T>
[[nodiscard]] inline std::string SerializeToJson(const T& obj) {
  return glz::write_json(obj).value_or(std::string{});
}

}  // namespace sizegate

#endif  // SIZEGATE_ENABLE_GLAZE
