#pragma once

#include <cstdint>

namespace tandem {

/// Decode a single hexadecimal digit. Returns -1 if invalid.
constexpr int from_hex_digit(char ch) {
  if (ch >= '0' && ch <= '9') {
    return ch - '0';
  }
  if (ch >= 'A' && ch <= 'F') {
    return 10 + (ch - 'A');
  }
  if (ch >= 'a' && ch <= 'f') {
    return 10 + (ch - 'a');
  }
  return -1;
}

/// Number of lower case hexadecimal digits needed to represent 'value' (at least 1).
constexpr int nhexdigits(uint64_t value) {
  int nbDigits = 1;
  while (value >= 16U) {
    value >>= 4U;
    ++nbDigits;
  }
  return nbDigits;
}

/// Writes the lower case hexadecimal representation of 'value' (without leading zeros) to 'buf'.
/// Buffer should have space for at least nhexdigits(value) chars.
/// Returns a pointer to the char immediately positioned after the last written digit.
/// Examples:
///  26 -> "1a"
///  0  -> "0"
constexpr char *to_lower_hex(uint64_t value, char *buf) {
  constexpr const char *const kHexits = "0123456789abcdef";

  char *end = buf + nhexdigits(value);
  char *out = end;
  do {
    *--out = kHexits[value & 0x0FU];
    value >>= 4U;
  } while (value != 0);
  return end;
}

}  // namespace tandem
