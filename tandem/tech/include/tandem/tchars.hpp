#pragma once

#include <algorithm>
#include <cstdint>
#include <string_view>

namespace tandem {

/// RFC 9110: tchar = "!" / "#" / "$" / "%" / "&" / "'" / "*"
///                  / "+" / "-" / "." / "^" / "_" / "`" / "|" / "~"
///                  / DIGIT / ALPHA
constexpr bool is_tchar(unsigned char uc) noexcept {
  // Two 64-bit chunks: [0-63], [64-127]
  constexpr uint64_t bitmap[2] = {
      (1ULL << '!') | (1ULL << '#') | (1ULL << '$') | (1ULL << '%') | (1ULL << '&') | (1ULL << '\'') | (1ULL << '*') |
          (1ULL << '+') | (1ULL << '-') | (1ULL << '.') | (0x3FFULL << '0'),

      (0x3FFFFFFULL << ('A' - 64)) | (1ULL << ('^' - 64)) | (1ULL << ('_' - 64)) | (0x3FFFFFFULL << ('a' - 64)) |
          (1ULL << ('`' - 64)) | (1ULL << ('|' - 64)) | (1ULL << ('~' - 64))};

  return uc < 128U && ((bitmap[uc >> 6] >> (uc & 63)) & 1U) != 0U;
}

constexpr bool is_tchar(char ch) noexcept { return is_tchar(static_cast<unsigned char>(ch)); }

/// A token is a non-empty sequence of tchars (methods, header names, transfer codings).
constexpr bool IsToken(std::string_view str) noexcept {
  return !str.empty() && std::ranges::all_of(str, [](char ch) { return is_tchar(ch); });
}

/// field-vchar / obs-text plus SP and HTAB, which is what may appear inside a header value or a reason phrase.
constexpr bool IsFieldContentChar(unsigned char uc) noexcept {
  return uc == '\t' || (uc >= 0x20 && uc != 0x7F);
}

/// request-target characters: any visible char (no whitespace, no controls).
constexpr bool IsTargetChar(unsigned char uc) noexcept { return uc > 0x20 && uc != 0x7F; }

constexpr bool IsDigit(char ch) noexcept { return ch >= '0' && ch <= '9'; }

}  // namespace tandem
