#pragma once

#include <cstdint>
#include <string_view>

#include "tandem/http-constants.hpp"
#include "tandem/raw-chars.hpp"

namespace tandem::http {

struct HeaderView {
  std::string_view name;
  std::string_view value;
};

// Represents a single HTTP header field, stored contiguously as "Name: Value".
// The name and value are validated upon construction.
class Header {
 public:
  // Constructs a Header with the given name and value. The value is trimmed of OWS.
  // Throws std::invalid_argument if the name is not a token or the value contains forbidden characters.
  Header(std::string_view name, std::string_view value);

  [[nodiscard]] std::string_view name() const noexcept { return {_data.data(), _colonPos}; }

  [[nodiscard]] std::string_view value() const noexcept {
    return {_data.begin() + _colonPos + HeaderSep.size(), _data.end()};
  }

  // Returns the raw header as "Name: Value".
  [[nodiscard]] std::string_view raw() const noexcept { return _data.view(); }

  bool operator==(const Header&) const noexcept = default;

 private:
  RawChars _data;
  uint32_t _colonPos;
};

// Validates that a header name consists only of tchar characters (RFC 9110 section 5.1).
bool IsValidHeaderName(std::string_view name) noexcept;

// Validates that a header value does not contain CR, LF, NUL or other control characters except HTAB.
// obs-text (bytes >= 0x80) is accepted for compatibility. The empty value is allowed.
bool IsValidHeaderValue(std::string_view value) noexcept;

}  // namespace tandem::http
