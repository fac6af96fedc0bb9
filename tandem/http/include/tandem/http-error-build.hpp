#pragma once

#include <string_view>

#include "tandem/http-status-code.hpp"
#include "tandem/raw-chars.hpp"

namespace tandem {

// Builds a complete HTTP/1.1 error response with a text/plain body and 'connection: close'.
// If 'body' is empty, the reason phrase of the status is used as body.
RawChars BuildSimpleError(http::StatusCode status, std::string_view body = {}, bool addDate = false);

}  // namespace tandem
