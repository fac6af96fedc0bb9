#include "tandem/http-header.hpp"

#include <algorithm>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string_view>

#include "tandem/http-constants.hpp"
#include "tandem/string-trim.hpp"
#include "tandem/tchars.hpp"

namespace tandem::http {

Header::Header(std::string_view name, std::string_view value) : _colonPos(static_cast<uint32_t>(name.size())) {
  value = TrimOws(value);
  if (!IsValidHeaderName(name)) {
    throw std::invalid_argument("HTTP header name is invalid");
  }
  if (!IsValidHeaderValue(value)) {
    throw std::invalid_argument("HTTP header value is invalid");
  }
  if (name.size() > std::numeric_limits<uint32_t>::max()) {
    throw std::invalid_argument("HTTP header name is too long");
  }
  _data.reserve(name.size() + HeaderSep.size() + value.size());
  _data.unchecked_append(name);
  _data.unchecked_append(HeaderSep);
  _data.unchecked_append(value);
}

bool IsValidHeaderName(std::string_view name) noexcept { return IsToken(name); }

bool IsValidHeaderValue(std::string_view value) noexcept {
  return std::ranges::all_of(value, [](unsigned char ch) { return IsFieldContentChar(ch); });
}

}  // namespace tandem::http
