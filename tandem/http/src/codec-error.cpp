#include "tandem/codec-error.hpp"

#include <string_view>

#include "tandem/http-status-code.hpp"

namespace tandem {

std::string_view CodecErrorToStr(CodecError error) noexcept {
  switch (error) {
    case CodecError::None:
      return "None";
    case CodecError::MalformedHead:
      return "MalformedHead";
    case CodecError::HeadTooLarge:
      return "HeadTooLarge";
    case CodecError::TooManyHeaders:
      return "TooManyHeaders";
    case CodecError::UnsupportedVersion:
      return "UnsupportedVersion";
    case CodecError::ConflictingFramingHeaders:
      return "ConflictingFramingHeaders";
    case CodecError::InvalidContentLength:
      return "InvalidContentLength";
    case CodecError::UnsupportedTransferCoding:
      return "UnsupportedTransferCoding";
    case CodecError::InvalidChunk:
      return "InvalidChunk";
    case CodecError::ChunkTooLarge:
      return "ChunkTooLarge";
    case CodecError::BodyTooLarge:
      return "BodyTooLarge";
    case CodecError::UnexpectedEof:
      return "UnexpectedEof";
    case CodecError::BodyLengthMismatch:
      return "BodyLengthMismatch";
    case CodecError::StreamingRequiresHttp11:
      return "StreamingRequiresHttp11";
    case CodecError::BodyStreamFailure:
      return "BodyStreamFailure";
    default:
      return "Unknown";
  }
}

http::StatusCode CodecErrorToStatus(CodecError error) noexcept {
  switch (error) {
    case CodecError::HeadTooLarge:
      [[fallthrough]];
    case CodecError::TooManyHeaders:
      return http::StatusCodeRequestHeaderFieldsTooLarge;
    case CodecError::UnsupportedVersion:
      return http::StatusCodeHTTPVersionNotSupported;
    case CodecError::UnsupportedTransferCoding:
      return http::StatusCodeNotImplemented;
    case CodecError::BodyTooLarge:
      [[fallthrough]];
    case CodecError::ChunkTooLarge:
      return http::StatusCodePayloadTooLarge;
    case CodecError::BodyLengthMismatch:
      [[fallthrough]];
    case CodecError::BodyStreamFailure:
      return http::StatusCodeInternalServerError;
    default:
      return http::StatusCodeBadRequest;
  }
}

}  // namespace tandem
