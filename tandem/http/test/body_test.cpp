#include "tandem/body.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "tandem/body-stream.hpp"
#include "tandem/framing-mode.hpp"

namespace tandem {

namespace {

std::unique_ptr<BodyStream> Chunks(std::vector<std::string> chunks) {
  return std::make_unique<StringChunksStream>(std::move(chunks));
}

}  // namespace

TEST(BodyTest, DefaultIsEmptyBuffered) {
  Body body;
  EXPECT_TRUE(body.isBuffered());
  EXPECT_EQ(body.framing(), FramingMode::Length(0));
  EXPECT_TRUE(body.bufferedView().empty());
}

TEST(BodyTest, FramingFollowsAlternative) {
  EXPECT_EQ(Body::Buffered(std::string("hello")).framing(), FramingMode::Length(5));
  EXPECT_EQ(Body::ExactSize(3, Chunks({"abc"})).framing(), FramingMode::Length(3));
  EXPECT_EQ(Body::Streaming(Chunks({"abc"})).framing(), FramingMode::Chunked());
}

TEST(BodyTest, NullStreamThrows) {
  EXPECT_THROW(Body::ExactSize(3, nullptr), std::invalid_argument);
  EXPECT_THROW(Body::Streaming(nullptr), std::invalid_argument);
}

TEST(BodyTest, VisitIsExhaustive) {
  Body body = Body::Streaming(Chunks({"a"}));
  const int index = body.visit([](const auto& alternative) {
    using T = std::decay_t<decltype(alternative)>;
    if constexpr (std::is_same_v<T, BufferedBody>) {
      return 0;
    } else if constexpr (std::is_same_v<T, ExactSizeBody>) {
      return 1;
    } else {
      return 2;
    }
  });
  EXPECT_EQ(index, 2);
}

TEST(BodyTest, CollectBuffered) {
  Body body = Body::Buffered(std::string("payload"));
  std::string out;
  EXPECT_EQ(CollectBody(body, out).status, BodyPollStatus::End);
  EXPECT_EQ(out, "payload");
  EXPECT_TRUE(body.bufferedView().empty());
}

TEST(BodyTest, CollectStream) {
  Body body = Body::Streaming(Chunks({"ab", "", "cd"}));
  std::string out;
  EXPECT_EQ(CollectBody(body, out).status, BodyPollStatus::End);
  EXPECT_EQ(out, "abcd");
}

TEST(BodyTest, StringChunksStream) {
  StringChunksStream stream({"x", "yz"});
  EXPECT_EQ(stream.totalSize(), 3U);
  BodyPoll poll = stream.pollChunk();
  EXPECT_EQ(poll.status, BodyPollStatus::Data);
  EXPECT_EQ(poll.data, "x");
  poll = stream.pollChunk();
  EXPECT_EQ(poll.data, "yz");
  EXPECT_EQ(stream.pollChunk().status, BodyPollStatus::End);
  EXPECT_EQ(stream.pollChunk().status, BodyPollStatus::End);
}

}  // namespace tandem
