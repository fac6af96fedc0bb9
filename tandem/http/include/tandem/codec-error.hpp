#pragma once

#include <cstdint>
#include <string_view>

#include "tandem/http-status-code.hpp"

namespace tandem {

// Protocol level errors. All of them are fatal to the connection they occur on.
enum class CodecError : uint8_t {
  None,
  // Head grammar
  MalformedHead,
  HeadTooLarge,
  TooManyHeaders,
  UnsupportedVersion,
  // Framing resolution
  ConflictingFramingHeaders,
  InvalidContentLength,
  UnsupportedTransferCoding,
  // Body decoding
  InvalidChunk,
  ChunkTooLarge,
  BodyTooLarge,
  UnexpectedEof,
  // Body encoding
  BodyLengthMismatch,
  StreamingRequiresHttp11,
  BodyStreamFailure
};

// Stable textual name of the error, for logs.
std::string_view CodecErrorToStr(CodecError error) noexcept;

// Best-effort HTTP status to answer with when the server role detects this error.
http::StatusCode CodecErrorToStatus(CodecError error) noexcept;

}  // namespace tandem
