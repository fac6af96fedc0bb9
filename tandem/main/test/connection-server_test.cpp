#include <gtest/gtest.h>

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "tandem/body-stream.hpp"
#include "tandem/body.hpp"
#include "tandem/codec-error.hpp"
#include "tandem/connection-config.hpp"
#include "tandem/connection-test-helpers.hpp"
#include "tandem/connection.hpp"
#include "tandem/http-codec.hpp"
#include "tandem/http-status-code.hpp"
#include "tandem/memory-transport.hpp"
#include "tandem/message-head.hpp"
#include "tandem/message.hpp"
#include "tandem/poll-result.hpp"
#include "tandem/role.hpp"
#include "tandem/service-context.hpp"
#include "tandem/service.hpp"
#include "tandem/timestring.hpp"

namespace tandem {

namespace {

constexpr std::string_view kSimpleGet = "GET /x HTTP/1.1\r\nHost: a\r\n\r\n";
constexpr std::string_view kHiResponse = "HTTP/1.1 200 OK\r\ncontent-length: 2\r\n\r\nhi";

const PollResult kWaitingRead = PollResult::Suspended(SuspendReason::Readable);

std::optional<Message> AnswerHi([[maybe_unused]] std::optional<Message> request) {
  return test::MakeResponse(http::StatusCodeOK, "hi");
}

// Answers with the request body.
std::optional<Message> Echo(std::optional<Message> request) {
  return test::MakeResponse(http::StatusCodeOK, std::string(request->body.bufferedView()));
}

using HiService = FunctionService<decltype(&AnswerHi)>;
using EchoService = AggregatingService<decltype(&Echo)>;

class ServerConnectionTest : public ::testing::Test {
 protected:
  ServerConnectionTest() {
    auto [transport, memoryPeer] = MakeMemoryPipe();
    pendingTransport = std::move(transport);
    peer.emplace(std::move(memoryPeer));
  }

  template <class S>
  Connection<S> makeConnection(S service, const ConnectionConfig& config = {}) {
    return Connection<S>(Role::Server, std::move(pendingTransport), std::move(service), config);
  }

  std::unique_ptr<ITransport> pendingTransport;
  std::optional<MemoryPeer> peer;
};

}  // namespace

TEST_F(ServerConnectionTest, StartsByReadingARequestHead) {
  auto conn = makeConnection(HiService(&AnswerHi));
  EXPECT_EQ(conn.role(), Role::Server);
  EXPECT_EQ(conn.phase(), Phase::HeadRead);
  EXPECT_EQ(conn.poll(), kWaitingRead);
  EXPECT_EQ(conn.phase(), Phase::HeadRead);
  EXPECT_TRUE(peer->output().empty());
}

TEST_F(ServerConnectionTest, SimpleExchangeKeepsConnectionOpen) {
  auto conn = makeConnection(HiService(&AnswerHi));
  peer->send(kSimpleGet);
  EXPECT_EQ(test::Drive(conn), kWaitingRead);
  EXPECT_EQ(peer->takeOutput(), kHiResponse);
  EXPECT_EQ(conn.phase(), Phase::HeadRead);
  EXPECT_FALSE(peer->isTransportClosed());
  EXPECT_EQ(conn.stats().exchanges, 1U);
  EXPECT_EQ(conn.stats().bytesRead, kSimpleGet.size());
  EXPECT_EQ(conn.stats().bytesWritten, kHiResponse.size());
}

TEST_F(ServerConnectionTest, PhasesCompleteOneAtATime) {
  auto conn = makeConnection(HiService(&AnswerHi));
  peer->send(kSimpleGet);
  EXPECT_EQ(conn.poll(), PollResult::PhaseComplete());
  EXPECT_EQ(conn.phase(), Phase::ServiceRun);
  EXPECT_EQ(conn.poll(), PollResult::PhaseComplete());
  EXPECT_EQ(conn.phase(), Phase::HeadWrite);
  EXPECT_EQ(conn.poll(), PollResult::PhaseComplete());
  EXPECT_EQ(conn.phase(), Phase::HeadRead);
  EXPECT_EQ(peer->output(), kHiResponse);
}

TEST_F(ServerConnectionTest, PipelinedRequestsThenPeerClose) {
  auto conn = makeConnection(HiService(&AnswerHi));
  peer->send(std::string(kSimpleGet) + std::string(kSimpleGet));
  EXPECT_EQ(test::Drive(conn), kWaitingRead);
  EXPECT_EQ(peer->takeOutput(), std::string(kHiResponse) + std::string(kHiResponse));
  EXPECT_EQ(conn.stats().exchanges, 2U);

  peer->closeWrite();
  EXPECT_EQ(test::Drive(conn), PollResult::Terminal());
  EXPECT_TRUE(conn.isTerminal());
  EXPECT_EQ(conn.terminalReason(), TerminalReason::Closed);
  EXPECT_EQ(conn.errorSource(), ErrorSource::None);
  EXPECT_TRUE(peer->isTransportClosed());
}

TEST_F(ServerConnectionTest, LeadingEmptyLinesAreIgnored) {
  auto conn = makeConnection(HiService(&AnswerHi));
  peer->send("\r\n\r\n" + std::string(kSimpleGet));
  EXPECT_EQ(test::Drive(conn), kWaitingRead);
  EXPECT_EQ(peer->takeOutput(), kHiResponse);
}

TEST_F(ServerConnectionTest, PeerClosingMidHeadIsAnError) {
  auto conn = makeConnection(HiService(&AnswerHi));
  peer->send("GET /x HTTP/1.1\r\nHo");
  peer->closeWrite();
  EXPECT_EQ(test::Drive(conn), PollResult::Terminal());
  EXPECT_EQ(conn.terminalReason(), TerminalReason::Error);
  EXPECT_EQ(conn.errorSource(), ErrorSource::Codec);
  EXPECT_EQ(conn.lastError(), CodecError::UnexpectedEof);
  EXPECT_TRUE(peer->output().starts_with("HTTP/1.1 400 Bad Request\r\n"));
}

TEST_F(ServerConnectionTest, ConnectionCloseRequest) {
  auto conn = makeConnection(HiService(&AnswerHi));
  peer->send("GET /x HTTP/1.1\r\nHost: a\r\nConnection: close\r\n\r\n");
  EXPECT_EQ(test::Drive(conn), PollResult::Terminal());
  EXPECT_EQ(peer->takeOutput(), "HTTP/1.1 200 OK\r\nconnection: close\r\ncontent-length: 2\r\n\r\nhi");
  EXPECT_EQ(conn.terminalReason(), TerminalReason::Closed);
  EXPECT_EQ(conn.stats().exchanges, 1U);
  EXPECT_TRUE(peer->isTransportClosed());
}

TEST_F(ServerConnectionTest, Http10RequestClosesByDefault) {
  auto conn = makeConnection(HiService(&AnswerHi));
  peer->send("GET / HTTP/1.0\r\n\r\n");
  EXPECT_EQ(test::Drive(conn), PollResult::Terminal());
  EXPECT_EQ(peer->takeOutput(), "HTTP/1.1 200 OK\r\nconnection: close\r\ncontent-length: 2\r\n\r\nhi");
  EXPECT_EQ(conn.terminalReason(), TerminalReason::Closed);
}

TEST_F(ServerConnectionTest, Http10KeepAliveIsHonored) {
  auto conn = makeConnection(HiService(&AnswerHi));
  peer->send("GET / HTTP/1.0\r\nConnection: keep-alive\r\n\r\n");
  EXPECT_EQ(test::Drive(conn), kWaitingRead);
  EXPECT_EQ(peer->takeOutput(), "HTTP/1.1 200 OK\r\nconnection: keep-alive\r\ncontent-length: 2\r\n\r\nhi");
  EXPECT_FALSE(conn.isTerminal());
}

TEST_F(ServerConnectionTest, KeepAliveDisabledByConfig) {
  auto conn = makeConnection(HiService(&AnswerHi), ConnectionConfig{}.withKeepAliveMode(false));
  peer->send(kSimpleGet);
  EXPECT_EQ(test::Drive(conn), PollResult::Terminal());
  EXPECT_EQ(peer->takeOutput(), "HTTP/1.1 200 OK\r\nconnection: close\r\ncontent-length: 2\r\n\r\nhi");
}

TEST_F(ServerConnectionTest, MaxExchangesPerConnection) {
  auto conn = makeConnection(HiService(&AnswerHi), ConnectionConfig{}.withMaxExchangesPerConnection(2));
  peer->send(std::string(kSimpleGet) + std::string(kSimpleGet) + std::string(kSimpleGet));
  EXPECT_EQ(test::Drive(conn), PollResult::Terminal());
  EXPECT_EQ(peer->takeOutput(), std::string(kHiResponse) +
                                    "HTTP/1.1 200 OK\r\nconnection: close\r\ncontent-length: 2\r\n\r\nhi");
  EXPECT_EQ(conn.stats().exchanges, 2U);
  EXPECT_EQ(conn.terminalReason(), TerminalReason::Closed);
}

TEST_F(ServerConnectionTest, ServiceMayRequestClose) {
  auto conn = makeConnection(FunctionService([](ServiceContext& ctx, [[maybe_unused]] std::optional<Message> in) {
    EXPECT_TRUE(ctx.isPersistent());
    ctx.requestClose();
    EXPECT_FALSE(ctx.isPersistent());
    return std::optional<Message>(test::MakeResponse(http::StatusCodeOK, "hi"));
  }));
  peer->send(kSimpleGet);
  EXPECT_EQ(test::Drive(conn), PollResult::Terminal());
  EXPECT_EQ(peer->takeOutput(), "HTTP/1.1 200 OK\r\nconnection: close\r\ncontent-length: 2\r\n\r\nhi");
}

TEST_F(ServerConnectionTest, ConflictingFramingHeadersAnswer400) {
  auto conn = makeConnection(EchoService(&Echo));
  peer->send("POST / HTTP/1.1\r\nContent-Length: 3\r\nTransfer-Encoding: chunked\r\n\r\n3\r\nabc\r\n0\r\n\r\n");
  EXPECT_EQ(test::Drive(conn), PollResult::Terminal());
  EXPECT_EQ(peer->takeOutput(),
            "HTTP/1.1 400 Bad Request\r\ncontent-type: text/plain\r\ncontent-length: 11\r\nconnection: close\r\n\r\n"
            "Bad Request");
  EXPECT_EQ(conn.terminalReason(), TerminalReason::Error);
  EXPECT_EQ(conn.errorSource(), ErrorSource::Codec);
  EXPECT_EQ(conn.lastError(), CodecError::ConflictingFramingHeaders);
  EXPECT_EQ(conn.stats().exchanges, 0U);
}

TEST_F(ServerConnectionTest, MalformedRequestLineAnswer400) {
  auto conn = makeConnection(HiService(&AnswerHi));
  peer->send("GET  /x HTTP/1.1\r\n\r\n");
  EXPECT_EQ(test::Drive(conn), PollResult::Terminal());
  EXPECT_TRUE(peer->output().starts_with("HTTP/1.1 400 Bad Request\r\n"));
  EXPECT_EQ(conn.errorSource(), ErrorSource::Codec);
}

TEST_F(ServerConnectionTest, HeadTooLargeAnswer431) {
  auto conn = makeConnection(HiService(&AnswerHi), ConnectionConfig{}.withMaxHeaderBytes(128));
  peer->send("GET /x HTTP/1.1\r\nX-Long: " + std::string(200, 'v'));
  EXPECT_EQ(test::Drive(conn), PollResult::Terminal());
  EXPECT_TRUE(peer->output().starts_with("HTTP/1.1 431 Request Header Fields Too Large\r\n"));
  EXPECT_EQ(conn.lastError(), CodecError::HeadTooLarge);
}

TEST_F(ServerConnectionTest, DeclaredBodyTooLargeAnswer413) {
  auto conn = makeConnection(EchoService(&Echo), ConnectionConfig{}.withMaxBodyBytes(4));
  peer->send("POST / HTTP/1.1\r\nContent-Length: 5\r\n\r\nhello");
  EXPECT_EQ(test::Drive(conn), PollResult::Terminal());
  EXPECT_TRUE(peer->output().starts_with("HTTP/1.1 413 Payload Too Large\r\n"));
  EXPECT_EQ(conn.lastError(), CodecError::BodyTooLarge);
}

TEST_F(ServerConnectionTest, ChunkedBodyTooLargeAnswer413) {
  auto conn = makeConnection(EchoService(&Echo), ConnectionConfig{}.withMaxBodyBytes(4));
  peer->send("POST / HTTP/1.1\r\nTransfer-Encoding: chunked\r\n\r\n3\r\nabc\r\n3\r\ndef\r\n0\r\n\r\n");
  EXPECT_EQ(test::Drive(conn), PollResult::Terminal());
  EXPECT_TRUE(peer->output().starts_with("HTTP/1.1 413 Payload Too Large\r\n"));
  EXPECT_EQ(conn.terminalReason(), TerminalReason::Error);
}

TEST_F(ServerConnectionTest, ContentLengthBodyReadInSmallPieces) {
  auto conn = makeConnection(EchoService(&Echo));
  peer->setReadChunkLimit(3);
  peer->send("POST /e HTTP/1.1\r\nContent-Length: 5\r\n\r\nhello");
  EXPECT_EQ(test::Drive(conn), kWaitingRead);
  EXPECT_EQ(peer->takeOutput(), "HTTP/1.1 200 OK\r\ncontent-length: 5\r\n\r\nhello");
}

TEST_F(ServerConnectionTest, ChunkedBodyIsDecoded) {
  auto conn = makeConnection(EchoService(&Echo));
  peer->send("POST / HTTP/1.1\r\nTransfer-Encoding: chunked\r\n\r\n2\r\nab\r\n1\r\nc\r\n0\r\nX-Trailer: t\r\n\r\n");
  EXPECT_EQ(test::Drive(conn), kWaitingRead);
  EXPECT_EQ(peer->takeOutput(), "HTTP/1.1 200 OK\r\ncontent-length: 3\r\n\r\nabc");
}

TEST_F(ServerConnectionTest, InvalidChunkAfterHeadAnswer400) {
  auto conn = makeConnection(EchoService(&Echo));
  peer->send("POST / HTTP/1.1\r\nTransfer-Encoding: chunked\r\n\r\nzz\r\n");
  EXPECT_EQ(test::Drive(conn), PollResult::Terminal());
  EXPECT_TRUE(peer->output().starts_with("HTTP/1.1 400 Bad Request\r\n"));
  EXPECT_EQ(conn.lastError(), CodecError::InvalidChunk);
}

TEST_F(ServerConnectionTest, UnreadBodyIsDrainedBeforeNextRequest) {
  auto conn = makeConnection(HiService(&AnswerHi));
  peer->send("POST / HTTP/1.1\r\nContent-Length: 5\r\n\r\nhello" + std::string(kSimpleGet));
  EXPECT_EQ(test::Drive(conn), kWaitingRead);
  EXPECT_EQ(peer->takeOutput(), std::string(kHiResponse) + std::string(kHiResponse));
  EXPECT_EQ(conn.stats().exchanges, 2U);
}

TEST_F(ServerConnectionTest, StreamingResponseIsChunked) {
  auto conn = makeConnection(FunctionService([]([[maybe_unused]] std::optional<Message> in) {
    return std::optional<Message>(
        Message{MessageHead::Response(http::StatusCodeOK), Body::Streaming(test::MakeChunks({"ab", "c"}))});
  }));
  peer->send(kSimpleGet);
  EXPECT_EQ(test::Drive(conn), kWaitingRead);
  EXPECT_EQ(peer->takeOutput(), "HTTP/1.1 200 OK\r\ntransfer-encoding: chunked\r\n\r\n2\r\nab\r\n1\r\nc\r\n0\r\n\r\n");
}

TEST_F(ServerConnectionTest, StreamingResponseToHttp10IsCloseDelimited) {
  auto conn = makeConnection(FunctionService([]([[maybe_unused]] std::optional<Message> in) {
    return std::optional<Message>(
        Message{MessageHead::Response(http::StatusCodeOK), Body::Streaming(test::MakeChunks({"ab", "c"}))});
  }));
  peer->send("GET / HTTP/1.0\r\nConnection: keep-alive\r\n\r\n");
  EXPECT_EQ(test::Drive(conn), PollResult::Terminal());
  EXPECT_EQ(peer->takeOutput(), "HTTP/1.1 200 OK\r\nconnection: close\r\n\r\nabc");
  EXPECT_EQ(conn.terminalReason(), TerminalReason::Closed);
}

TEST_F(ServerConnectionTest, ExactSizeResponse) {
  auto conn = makeConnection(FunctionService([]([[maybe_unused]] std::optional<Message> in) {
    return std::optional<Message>(
        Message{MessageHead::Response(http::StatusCodeOK), Body::ExactSize(5, test::MakeChunks({"he", "llo"}))});
  }));
  peer->send(kSimpleGet);
  EXPECT_EQ(test::Drive(conn), kWaitingRead);
  EXPECT_EQ(peer->takeOutput(), "HTTP/1.1 200 OK\r\ncontent-length: 5\r\n\r\nhello");
}

TEST_F(ServerConnectionTest, ExactSizeShortBodyTerminatesWithError) {
  auto conn = makeConnection(FunctionService([]([[maybe_unused]] std::optional<Message> in) {
    return std::optional<Message>(
        Message{MessageHead::Response(http::StatusCodeOK), Body::ExactSize(5, test::MakeChunks({"abcd"}))});
  }));
  peer->send(kSimpleGet);
  EXPECT_EQ(test::Drive(conn), PollResult::Terminal());
  // Head is already out, no error response can follow.
  EXPECT_EQ(peer->takeOutput(), "HTTP/1.1 200 OK\r\ncontent-length: 5\r\n\r\nabcd");
  EXPECT_EQ(conn.terminalReason(), TerminalReason::Error);
  EXPECT_EQ(conn.errorSource(), ErrorSource::Codec);
  EXPECT_EQ(conn.lastError(), CodecError::BodyLengthMismatch);
}

TEST_F(ServerConnectionTest, ExactSizeLongBodyTerminatesWithError) {
  auto conn = makeConnection(FunctionService([]([[maybe_unused]] std::optional<Message> in) {
    return std::optional<Message>(
        Message{MessageHead::Response(http::StatusCodeOK), Body::ExactSize(5, test::MakeChunks({"abc", "def"}))});
  }));
  peer->send(kSimpleGet);
  EXPECT_EQ(test::Drive(conn), PollResult::Terminal());
  EXPECT_EQ(peer->takeOutput(), "HTTP/1.1 200 OK\r\ncontent-length: 5\r\n\r\nabc");
  EXPECT_EQ(conn.lastError(), CodecError::BodyLengthMismatch);
}

TEST_F(ServerConnectionTest, HeadResponseHasNoBody) {
  auto conn = makeConnection(HiService(&AnswerHi));
  peer->send("HEAD /x HTTP/1.1\r\nHost: a\r\n\r\n");
  EXPECT_EQ(test::Drive(conn), kWaitingRead);
  EXPECT_EQ(peer->takeOutput(), "HTTP/1.1 200 OK\r\ncontent-length: 2\r\n\r\n");
  EXPECT_FALSE(conn.isTerminal());
}

TEST_F(ServerConnectionTest, NoContentResponseHasNoBodyNorFraming) {
  auto conn = makeConnection(FunctionService([]([[maybe_unused]] std::optional<Message> in) {
    return std::optional<Message>(test::MakeResponse(http::StatusCodeNoContent, "ignored"));
  }));
  peer->send(std::string(kSimpleGet) + std::string(kSimpleGet));
  EXPECT_EQ(test::Drive(conn), kWaitingRead);
  EXPECT_EQ(peer->takeOutput(), "HTTP/1.1 204 No Content\r\n\r\nHTTP/1.1 204 No Content\r\n\r\n");
}

TEST_F(ServerConnectionTest, ServiceExceptionAnswer500) {
  auto conn = makeConnection(FunctionService([]([[maybe_unused]] std::optional<Message> in) -> std::optional<Message> {
    throw std::runtime_error("boom");
  }));
  peer->send(kSimpleGet);
  EXPECT_EQ(test::Drive(conn), PollResult::Terminal());
  EXPECT_EQ(peer->takeOutput(),
            "HTTP/1.1 500 Internal Server Error\r\ncontent-type: text/plain\r\ncontent-length: 21\r\n"
            "connection: close\r\n\r\nInternal Server Error");
  EXPECT_EQ(conn.terminalReason(), TerminalReason::Error);
  EXPECT_EQ(conn.errorSource(), ErrorSource::Service);
}

TEST_F(ServerConnectionTest, ServiceWithoutResponseClosesConnection) {
  auto conn = makeConnection(FunctionService([]([[maybe_unused]] std::optional<Message> in) {
    return std::optional<Message>();
  }));
  peer->send(kSimpleGet);
  EXPECT_EQ(test::Drive(conn), PollResult::Terminal());
  EXPECT_TRUE(peer->output().empty());
  EXPECT_EQ(conn.terminalReason(), TerminalReason::Closed);
  EXPECT_TRUE(peer->isTransportClosed());
}

TEST_F(ServerConnectionTest, ServiceMustAnswerWithAResponse) {
  auto conn = makeConnection(FunctionService([]([[maybe_unused]] std::optional<Message> in) {
    return std::optional<Message>(test::MakeRequest("GET", "/"));
  }));
  peer->send(kSimpleGet);
  EXPECT_EQ(test::Drive(conn), PollResult::Terminal());
  EXPECT_TRUE(peer->output().starts_with("HTTP/1.1 500 Internal Server Error\r\n"));
  EXPECT_EQ(conn.errorSource(), ErrorSource::Service);
}

TEST_F(ServerConnectionTest, ResponseReadingTheUnconsumedRequestBodyAnswer500) {
  auto conn = makeConnection(FunctionService([](std::optional<Message> in) {
    return std::optional<Message>(Message{MessageHead::Response(http::StatusCodeOK), std::move(in->body)});
  }));
  peer->send("POST /x HTTP/1.1\r\nHost: a\r\nContent-Length: 5\r\n\r\nhello");
  EXPECT_EQ(test::Drive(conn), PollResult::Terminal());
  EXPECT_TRUE(peer->output().starts_with("HTTP/1.1 500 Internal Server Error\r\n"));
  EXPECT_EQ(peer->output().find("200 OK"), std::string::npos);
  EXPECT_EQ(conn.errorSource(), ErrorSource::Service);
}

TEST_F(ServerConnectionTest, RequestBodyKeptPastTheExchangeFails) {
  std::optional<Body> kept;
  auto conn = makeConnection(FunctionService([&kept](std::optional<Message> in) {
    kept.emplace(std::move(in->body));
    return AnswerHi(std::nullopt);
  }));
  peer->send("POST /x HTTP/1.1\r\nHost: a\r\nContent-Length: 5\r\n\r\nhello" + std::string(kSimpleGet));
  EXPECT_EQ(test::Drive(conn), kWaitingRead);
  EXPECT_EQ(peer->takeOutput(), std::string(kHiResponse) + std::string(kHiResponse));
  ASSERT_TRUE(kept.has_value());
  std::string collected;
  const BodyPoll res = CollectBody(*kept, collected);
  EXPECT_EQ(res.status, BodyPollStatus::Error);
  EXPECT_EQ(res.error, CodecError::BodyStreamFailure);
  EXPECT_TRUE(collected.empty());
}

TEST_F(ServerConnectionTest, PendingServiceSuspendsOnTask) {
  auto conn = makeConnection(test::DeferredService(2U, &AnswerHi));
  peer->send(kSimpleGet);
  EXPECT_EQ(test::Drive(conn), PollResult::Suspended(SuspendReason::Task));
  EXPECT_EQ(conn.phase(), Phase::ServiceRun);
  EXPECT_EQ(test::Drive(conn), PollResult::Suspended(SuspendReason::Task));
  EXPECT_TRUE(peer->output().empty());
  EXPECT_EQ(test::Drive(conn), kWaitingRead);
  EXPECT_EQ(peer->takeOutput(), kHiResponse);
}

TEST_F(ServerConnectionTest, ExpectContinueIsSentWhenBodyIsRead) {
  auto conn = makeConnection(EchoService(&Echo));
  peer->send("PUT /u HTTP/1.1\r\nContent-Length: 3\r\nExpect: 100-continue\r\n\r\n");
  EXPECT_EQ(test::Drive(conn), kWaitingRead);
  EXPECT_EQ(peer->takeOutput(), "HTTP/1.1 100 Continue\r\n\r\n");
  EXPECT_EQ(conn.phase(), Phase::ServiceRun);

  peer->send("abc");
  EXPECT_EQ(test::Drive(conn), kWaitingRead);
  EXPECT_EQ(peer->takeOutput(), "HTTP/1.1 200 OK\r\ncontent-length: 3\r\n\r\nabc");
  EXPECT_EQ(conn.phase(), Phase::HeadRead);
}

TEST_F(ServerConnectionTest, ExpectContinueWithUnreadBodyCloses) {
  auto conn = makeConnection(HiService(&AnswerHi));
  peer->send("PUT /u HTTP/1.1\r\nContent-Length: 3\r\nExpect: 100-continue\r\n\r\n");
  EXPECT_EQ(test::Drive(conn), PollResult::Terminal());
  EXPECT_EQ(peer->takeOutput(), "HTTP/1.1 200 OK\r\nconnection: close\r\ncontent-length: 2\r\n\r\nhi");
  EXPECT_EQ(conn.terminalReason(), TerminalReason::Closed);
}

TEST_F(ServerConnectionTest, PartialWritesResume) {
  auto conn = makeConnection(HiService(&AnswerHi));
  peer->setWriteCapacity(10);
  peer->send(kSimpleGet);

  std::string out;
  PollResult res = test::Drive(conn);
  int nbWritablePolls = 0;
  while (res == PollResult::Suspended(SuspendReason::Writable)) {
    ++nbWritablePolls;
    out += peer->takeOutput();
    res = test::Drive(conn);
  }
  out += peer->takeOutput();
  EXPECT_EQ(res, kWaitingRead);
  EXPECT_GE(nbWritablePolls, 3);
  EXPECT_EQ(out, kHiResponse);
}

TEST_F(ServerConnectionTest, PollStopsWhenByteBudgetIsExhausted) {
  auto conn = makeConnection(HiService(&AnswerHi), ConnectionConfig{}.withReadChunkBytes(4).withMaxBytesPerPoll(4));
  peer->send(kSimpleGet);
  EXPECT_EQ(conn.poll(), PollResult::Progress());
  EXPECT_EQ(conn.stats().bytesRead, 4U);
  EXPECT_EQ(conn.phase(), Phase::HeadRead);
  EXPECT_EQ(test::Drive(conn), kWaitingRead);
  EXPECT_EQ(peer->takeOutput(), kHiResponse);
}

TEST_F(ServerConnectionTest, DateHeaderWhenConfigured) {
  auto conn = makeConnection(HiService(&AnswerHi), ConnectionConfig{}.withDateHeader());
  peer->send(kSimpleGet);
  EXPECT_EQ(test::Drive(conn), kWaitingRead);
  const std::string out = peer->takeOutput();

  MessageHead head;
  const HeadParseResult res = ParseHead(out, MessageKind::Response, HeadLimits{}, head);
  ASSERT_EQ(res.status, ParseStatus::Complete);
  ASSERT_TRUE(head.headers().get("Date"));
  EXPECT_EQ(head.headers().get("Date")->size(), kRFC7231DateStrLen);
  EXPECT_EQ(out.substr(res.consumed), "hi");
}

TEST_F(ServerConnectionTest, TransportFailure) {
  auto conn = makeConnection(HiService(&AnswerHi));
  peer->fail();
  EXPECT_EQ(test::Drive(conn), PollResult::Terminal());
  EXPECT_EQ(conn.terminalReason(), TerminalReason::Error);
  EXPECT_EQ(conn.errorSource(), ErrorSource::Transport);
}

TEST_F(ServerConnectionTest, TerminalConnectionStaysTerminal) {
  auto conn = makeConnection(HiService(&AnswerHi));
  peer->closeWrite();
  EXPECT_EQ(test::Drive(conn), PollResult::Terminal());
  EXPECT_EQ(conn.poll(), PollResult::Terminal());
  EXPECT_EQ(conn.terminalReason(), TerminalReason::Closed);
}

TEST(ConnectionTest, NullTransportThrows) {
  EXPECT_THROW(Connection<HiService>(Role::Server, nullptr, HiService(&AnswerHi)), std::invalid_argument);
}

TEST(ConnectionTest, InvalidConfigThrows) {
  auto [transport, peer] = MakeMemoryPipe();
  EXPECT_THROW(Connection<HiService>(Role::Server, std::move(transport), HiService(&AnswerHi),
                          ConnectionConfig{}.withReadChunkBytes(0)),
               std::invalid_argument);
}

}  // namespace tandem
