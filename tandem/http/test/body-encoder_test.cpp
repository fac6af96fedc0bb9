#include "tandem/body-encoder.hpp"

#include <gtest/gtest.h>

#include <cstddef>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "tandem/body-stream.hpp"
#include "tandem/body.hpp"
#include "tandem/codec-error.hpp"
#include "tandem/framing-mode.hpp"
#include "tandem/raw-chars.hpp"

namespace tandem {

namespace {

// Stream replaying a scripted sequence of polls.
class ScriptedStream : public BodyStream {
 public:
  explicit ScriptedStream(std::vector<BodyPoll> polls) : _polls(std::move(polls)) {}

  BodyPoll pollChunk() override { return _pos < _polls.size() ? _polls[_pos++] : BodyPoll::End(); }

 private:
  std::vector<BodyPoll> _polls;
  std::size_t _pos{};
};

struct EncodeOutcome {
  std::string wire;
  EncodeStatus status;
  CodecError error{CodecError::None};
};

EncodeOutcome EncodeAll(Body& body, FramingMode framing, std::size_t hint = 0) {
  BodyEncoder encoder(body, framing, hint);
  RawChars scratch;
  EncodeOutcome outcome{{}, EncodeStatus::Unit};
  while (true) {
    const EncodeResult res = encoder.next(scratch);
    if (res.status == EncodeStatus::Unit) {
      outcome.wire.append(res.unit);
      continue;
    }
    if (res.status == EncodeStatus::Pending) {
      continue;
    }
    outcome.status = res.status;
    outcome.error = res.error;
    return outcome;
  }
}

std::unique_ptr<BodyStream> Chunks(std::vector<std::string> chunks) {
  return std::make_unique<StringChunksStream>(std::move(chunks));
}

}  // namespace

TEST(BodyEncoderTest, StreamingIsChunked) {
  Body body = Body::Streaming(Chunks({"ab", "c"}));
  const auto outcome = EncodeAll(body, body.framing());
  EXPECT_EQ(outcome.status, EncodeStatus::Done);
  EXPECT_EQ(outcome.wire, "2\r\nab\r\n1\r\nc\r\n0\r\n\r\n");
}

TEST(BodyEncoderTest, EmptyChunksAreSkipped) {
  Body body = Body::Streaming(Chunks({"", "abcdefghijklmnopq", ""}));
  EXPECT_EQ(EncodeAll(body, body.framing()).wire, "11\r\nabcdefghijklmnopq\r\n0\r\n\r\n");
}

TEST(BodyEncoderTest, EmptyStreamingBodyIsOnlyLastChunk) {
  Body body = Body::Streaming(Chunks({}));
  EXPECT_EQ(EncodeAll(body, body.framing()).wire, "0\r\n\r\n");
}

TEST(BodyEncoderTest, ChunkSizeHintSplitsLargeChunks) {
  Body body = Body::Streaming(Chunks({"abcdefg", "h"}));
  EXPECT_EQ(EncodeAll(body, body.framing(), 3).wire, "3\r\nabc\r\n3\r\ndef\r\n1\r\ng\r\n1\r\nh\r\n0\r\n\r\n");
}

TEST(BodyEncoderTest, BufferedIsForwardedAsIs) {
  Body body = Body::Buffered(std::string("hello world"));
  BodyEncoder encoder(body, body.framing());
  RawChars scratch;
  const EncodeResult res = encoder.next(scratch);
  ASSERT_EQ(res.status, EncodeStatus::Unit);
  EXPECT_EQ(res.unit, "hello world");
  EXPECT_EQ(res.unit.data(), body.bufferedView().data());
  EXPECT_TRUE(scratch.empty());
  EXPECT_EQ(encoder.next(scratch).status, EncodeStatus::Done);
  EXPECT_TRUE(encoder.done());
  EXPECT_EQ(encoder.bodyBytes(), 11U);
}

TEST(BodyEncoderTest, EmptyBufferedIsDoneAtOnce) {
  Body body;
  BodyEncoder encoder(body, body.framing());
  RawChars scratch;
  EXPECT_EQ(encoder.next(scratch).status, EncodeStatus::Done);
}

TEST(BodyEncoderTest, ExactSizeMatchingLength) {
  Body body = Body::ExactSize(5, Chunks({"he", "llo"}));
  const auto outcome = EncodeAll(body, body.framing());
  EXPECT_EQ(outcome.status, EncodeStatus::Done);
  EXPECT_EQ(outcome.wire, "hello");
}

TEST(BodyEncoderTest, ExactSizeShortIsMismatch) {
  Body body = Body::ExactSize(5, Chunks({"ab", "cd"}));
  const auto outcome = EncodeAll(body, body.framing());
  EXPECT_EQ(outcome.status, EncodeStatus::Error);
  EXPECT_EQ(outcome.error, CodecError::BodyLengthMismatch);
  EXPECT_EQ(outcome.wire, "abcd");
}

TEST(BodyEncoderTest, ExactSizeLongIsMismatchBeforeExtraBytes) {
  Body body = Body::ExactSize(5, Chunks({"abc", "def"}));
  const auto outcome = EncodeAll(body, body.framing());
  EXPECT_EQ(outcome.status, EncodeStatus::Error);
  EXPECT_EQ(outcome.error, CodecError::BodyLengthMismatch);
  EXPECT_EQ(outcome.wire, "abc");
}

TEST(BodyEncoderTest, PendingStreamIsReported) {
  Body body = Body::Streaming(std::make_unique<ScriptedStream>(
      std::vector<BodyPoll>{BodyPoll::Pending(), BodyPoll::Data("x"), BodyPoll::Pending()}));
  BodyEncoder encoder(body, body.framing());
  RawChars scratch;
  EXPECT_EQ(encoder.next(scratch).status, EncodeStatus::Pending);
  EXPECT_EQ(encoder.next(scratch).unit, "1\r\nx\r\n");
  EXPECT_EQ(encoder.next(scratch).status, EncodeStatus::Pending);
  EXPECT_EQ(encoder.next(scratch).unit, "0\r\n\r\n");
  EXPECT_EQ(encoder.next(scratch).status, EncodeStatus::Done);
}

TEST(BodyEncoderTest, StreamFailure) {
  Body body = Body::Streaming(
      std::make_unique<ScriptedStream>(std::vector<BodyPoll>{BodyPoll::Data("x"), BodyPoll::Error(CodecError::None)}));
  const auto outcome = EncodeAll(body, body.framing());
  EXPECT_EQ(outcome.status, EncodeStatus::Error);
  EXPECT_EQ(outcome.error, CodecError::BodyStreamFailure);
}

TEST(BodyEncoderTest, CloseDelimitedIsRaw) {
  Body body = Body::Streaming(Chunks({"ab", "c"}));
  const auto outcome = EncodeAll(body, FramingMode::CloseDelimited());
  EXPECT_EQ(outcome.status, EncodeStatus::Done);
  EXPECT_EQ(outcome.wire, "abc");
}

}  // namespace tandem
