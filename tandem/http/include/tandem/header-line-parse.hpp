#pragma once

#include <string_view>

#include "tandem/http-header.hpp"
#include "tandem/string-trim.hpp"

namespace tandem::http {

// Parse a single HTTP header line (range [lineStart, lineLast), CRLF excluded).
// Returns the (name, value) views with the value trimmed of OWS, or an empty name view when there is no colon.
// The name is not validated here: a name with surrounding whitespace is returned as is, so that the caller rejects it.
constexpr HeaderView ParseHeaderLine(const char* lineStart, const char* lineLast) {
  const char* colonPtr = lineStart;
  while (colonPtr < lineLast && *colonPtr != ':') {
    ++colonPtr;
  }

  if (colonPtr == lineLast) {
    // malformed: no colon
    return {};
  }

  return {std::string_view(lineStart, colonPtr), TrimOws(std::string_view(colonPtr + 1, lineLast))};
}

}  // namespace tandem::http
