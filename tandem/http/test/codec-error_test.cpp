#include "tandem/codec-error.hpp"

#include <gtest/gtest.h>

#include "tandem/http-status-code.hpp"

namespace tandem {

TEST(CodecErrorTest, Names) {
  EXPECT_EQ(CodecErrorToStr(CodecError::None), "None");
  EXPECT_EQ(CodecErrorToStr(CodecError::MalformedHead), "MalformedHead");
  EXPECT_EQ(CodecErrorToStr(CodecError::ConflictingFramingHeaders), "ConflictingFramingHeaders");
  EXPECT_EQ(CodecErrorToStr(CodecError::BodyLengthMismatch), "BodyLengthMismatch");
}

TEST(CodecErrorTest, StatusMapping) {
  EXPECT_EQ(CodecErrorToStatus(CodecError::MalformedHead), http::StatusCodeBadRequest);
  EXPECT_EQ(CodecErrorToStatus(CodecError::ConflictingFramingHeaders), http::StatusCodeBadRequest);
  EXPECT_EQ(CodecErrorToStatus(CodecError::InvalidChunk), http::StatusCodeBadRequest);
  EXPECT_EQ(CodecErrorToStatus(CodecError::HeadTooLarge), http::StatusCodeRequestHeaderFieldsTooLarge);
  EXPECT_EQ(CodecErrorToStatus(CodecError::TooManyHeaders), http::StatusCodeRequestHeaderFieldsTooLarge);
  EXPECT_EQ(CodecErrorToStatus(CodecError::UnsupportedVersion), http::StatusCodeHTTPVersionNotSupported);
  EXPECT_EQ(CodecErrorToStatus(CodecError::UnsupportedTransferCoding), http::StatusCodeNotImplemented);
  EXPECT_EQ(CodecErrorToStatus(CodecError::BodyTooLarge), http::StatusCodePayloadTooLarge);
  EXPECT_EQ(CodecErrorToStatus(CodecError::ChunkTooLarge), http::StatusCodePayloadTooLarge);
  EXPECT_EQ(CodecErrorToStatus(CodecError::BodyStreamFailure), http::StatusCodeInternalServerError);
}

}  // namespace tandem
