#pragma once

#include <string_view>

namespace tandem {

constexpr bool IsOws(char ch) noexcept { return ch == ' ' || ch == '\t'; }

// Trim OWS (optional whitespace) per RFC 9110: SP and HTAB only.
constexpr std::string_view TrimOws(std::string_view sv) noexcept {
  while (!sv.empty() && IsOws(sv.front())) {
    sv.remove_prefix(1);
  }
  while (!sv.empty() && IsOws(sv.back())) {
    sv.remove_suffix(1);
  }
  return sv;
}

}  // namespace tandem
