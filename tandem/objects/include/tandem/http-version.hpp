#pragma once

#include <compare>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace tandem::http {

// HTTP protocol version of a message, as written on its start line ("HTTP/1.1").
struct Version {
  uint8_t major{1};
  uint8_t minor{1};

  // Tells whether this HTTP/1.x engine can handle messages of this version.
  [[nodiscard]] constexpr bool isSupported() const noexcept { return major == 1 && minor <= 1; }

  // Whether connections default to persistent for this version (HTTP/1.1 and above).
  [[nodiscard]] constexpr bool defaultsToKeepAlive() const noexcept { return major > 1 || (major == 1 && minor >= 1); }

  constexpr auto operator<=>(const Version&) const noexcept = default;
};

inline constexpr Version HTTP_1_0{1, 0};
inline constexpr Version HTTP_1_1{1, 1};

// Length of a version token such as "HTTP/1.1".
inline constexpr std::size_t kVersionStrLen = 8;

// Parses a version token of the form "HTTP/D.D" (single digits, as in RFC 9112).
// Returns true on success; false if the format is invalid.
constexpr bool ParseVersion(std::string_view token, Version& out) noexcept {
  if (token.size() != kVersionStrLen || !token.starts_with("HTTP/") || token[6] != '.') {
    return false;
  }
  const char majorCh = token[5];
  const char minorCh = token[7];
  if (majorCh < '0' || majorCh > '9' || minorCh < '0' || minorCh > '9') {
    return false;
  }
  out.major = static_cast<uint8_t>(majorCh - '0');
  out.minor = static_cast<uint8_t>(minorCh - '0');
  return true;
}

// Writes the version token to 'out', which must have room for kVersionStrLen chars.
// Returns a pointer past the last written char.
constexpr char* WriteVersion(Version version, char* out) noexcept {
  constexpr std::string_view kPrefix = "HTTP/";
  for (char ch : kPrefix) {
    *out++ = ch;
  }
  *out++ = static_cast<char>('0' + (version.major % 10));
  *out++ = '.';
  *out++ = static_cast<char>('0' + (version.minor % 10));
  return out;
}

}  // namespace tandem::http
