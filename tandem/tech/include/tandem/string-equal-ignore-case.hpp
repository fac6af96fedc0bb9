#pragma once

#include <cstddef>
#include <string_view>

#include "tandem/string-trim.hpp"

namespace tandem {

// ASCII only: header names and tokens are never localized.
constexpr char AsciiToLower(char ch) noexcept { return ch >= 'A' && ch <= 'Z' ? static_cast<char>(ch | 0x20) : ch; }

constexpr bool CaseInsensitiveEqual(std::string_view lhs, std::string_view rhs) {
  if (lhs.size() != rhs.size()) {
    return false;
  }

  const char* pLhs = lhs.data();
  const char* pRhs = rhs.data();
  const char* end = pLhs + lhs.size();

  for (; pLhs != end; ++pLhs, ++pRhs) {
    if (AsciiToLower(*pLhs) != AsciiToLower(*pRhs)) {
      return false;
    }
  }
  return true;
}

/// Calls 'fn' for each non-empty, OWS-trimmed element of a comma separated list (RFC 9110 #rule).
/// Iteration stops early if 'fn' returns true, and the function then returns true as well.
template <class Fn>
constexpr bool ForEachListElement(std::string_view list, Fn fn) {
  while (!list.empty()) {
    const auto commaPos = list.find(',');
    const std::string_view element = TrimOws(list.substr(0, commaPos));
    if (!element.empty() && fn(element)) {
      return true;
    }
    if (commaPos == std::string_view::npos) {
      break;
    }
    list.remove_prefix(commaPos + 1);
  }
  return false;
}

/// Tells whether the comma separated list 'list' contains 'token', ignoring case.
constexpr bool ListContainsTokenIgnoreCase(std::string_view list, std::string_view token) {
  return ForEachListElement(list, [token](std::string_view element) { return CaseInsensitiveEqual(element, token); });
}

struct CaseInsensitiveEqualFunc {
  constexpr bool operator()(std::string_view lhs, std::string_view rhs) const noexcept {
    return CaseInsensitiveEqual(lhs, rhs);
  }
};

}  // namespace tandem
