#include "sizegate/content-type.hpp"

#include <string>
#include <string_view>

#include "sizegate/string-trim.hpp"
#include "sizegate/toupperlower.hpp"

namespace sizegate {

std::string NormalizeContentType(std::string_view contentType) {
  const auto semicolonPos = contentType.find(';');
  if (semicolonPos != std::string_view::npos) {
    contentType.remove_suffix(contentType.size() - semicolonPos);
  }
  return ToLowerCopy(TrimAsciiSpaces(contentType));
}

std::string WildcardKey(std::string_view normalizedContentType) {
  const auto slashPos = normalizedContentType.find('/');
  if (slashPos == std::string_view::npos) {
    return {};
  }
  std::string ret(normalizedContentType.substr(0, slashPos));
  ret.append("/*");
  return ret;
}

}  // namespace sizegate
