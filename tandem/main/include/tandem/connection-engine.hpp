#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "tandem/body-channel.hpp"
#include "tandem/body-decoder.hpp"
#include "tandem/body-encoder.hpp"
#include "tandem/codec-error.hpp"
#include "tandem/connection-config.hpp"
#include "tandem/framing-mode.hpp"
#include "tandem/http-status-code.hpp"
#include "tandem/http-version.hpp"
#include "tandem/message.hpp"
#include "tandem/poll-result.hpp"
#include "tandem/raw-chars.hpp"
#include "tandem/role.hpp"
#include "tandem/service-context.hpp"
#include "tandem/transport.hpp"
#include "tandem/waker.hpp"

namespace tandem {

// Protocol side of a connection, independent of the service type: it owns the stream and its buffers, reads and
// writes heads and bodies, and sequences the phases. Connection<S> drives it and runs the service in between.
// Neither copyable nor movable, as the outbound body encoder refers to the message it writes.
class ConnectionEngine {
 public:
  // Throws std::invalid_argument if the transport is null or the configuration is invalid.
  ConnectionEngine(Role role, std::unique_ptr<ITransport> transport, const ConnectionConfig& config);

  ConnectionEngine(const ConnectionEngine&) = delete;
  ConnectionEngine(ConnectionEngine&&) = delete;
  ConnectionEngine& operator=(const ConnectionEngine&) = delete;
  ConnectionEngine& operator=(ConnectionEngine&&) = delete;

  ~ConnectionEngine() = default;

  // Resets the per-poll byte budget.
  void beginPoll() noexcept { _pollBytes = 0; }

  [[nodiscard]] bool budgetExhausted() const noexcept {
    return _config.maxBytesPerPoll != 0 && _pollBytes >= _config.maxBytesPerPoll;
  }

  // Advances the HeadRead or HeadWrite phase. Must not be called in ServiceRun.
  PollResult pollIo();

  // ServiceRun: returns the inbound message for the service (std::nullopt for the first client invocation).
  std::optional<Message> takeInbound();

  // ServiceRun: feeds the inbound body to the service if it asked for more.
  // Returns Progress if something was handed over, Suspended otherwise.
  PollResult pumpInbound();

  // ServiceRun: the service produced its result. Moves to HeadWrite, or to Terminal if there is nothing to write.
  PollResult completeService(std::optional<Message> outbound);

  // The service (or an outbound body stream) threw. The server answers 500 if no response byte was sent yet.
  PollResult failService(std::string_view what);

  [[nodiscard]] Role role() const noexcept { return _context.role(); }

  [[nodiscard]] Phase phase() const noexcept { return _phase; }

  [[nodiscard]] ServiceContext& context() noexcept { return _context; }

  void setWaker(Waker waker) noexcept { _context._waker = std::move(waker); }

  [[nodiscard]] TerminalReason terminalReason() const noexcept { return _terminalReason; }

  [[nodiscard]] ErrorSource errorSource() const noexcept { return _errorSource; }

  [[nodiscard]] CodecError lastError() const noexcept { return _lastError; }

  [[nodiscard]] const ConnectionStats& stats() const noexcept { return _stats; }

  [[nodiscard]] const ConnectionConfig& config() const noexcept { return _config; }

 private:
  enum class WriteStep : uint8_t { Drain, Head, Body, Finish };

  enum class IoOutcome : uint8_t { Done, WouldBlock, Eof, Error };

  PollResult pollHeadRead();
  PollResult onHeadParsed(MessageHead head);

  PollResult pollHeadWrite();
  // Both return std::nullopt when done, or the result to return from the poll otherwise.
  std::optional<PollResult> drainInbound();
  std::optional<PollResult> prepareOutbound();
  void prepareResponseHead(MessageHead& head, bool streaming);
  PollResult finishExchange();

  PollResult protocolError(CodecError error);
  PollResult transportError(std::string_view operation);
  PollResult queueErrorResponse(http::StatusCode status);
  PollResult terminate(TerminalReason reason);
  void setPhase(Phase phase) noexcept;

  IoOutcome readSome();
  IoOutcome flushOut();
  IoOutcome writeUnit(std::string_view unit);

  [[nodiscard]] BodyLimits bodyLimits() const noexcept {
    return {_config.maxBodyBytes, _config.maxChunkBytes, _config.maxHeaderBytes};
  }

  ConnectionConfig _config;
  std::unique_ptr<ITransport> _transport;
  ServiceContext _context;
  Phase _phase;
  WriteStep _writeStep{WriteStep::Drain};
  TerminalReason _terminalReason{TerminalReason::None};
  // Terminal reason to apply once the current output is flushed, for error responses.
  TerminalReason _terminalAfterFlush{TerminalReason::None};
  ErrorSource _errorSource{ErrorSource::None};
  CodecError _lastError{CodecError::None};
  ConnectionStats _stats;

  RawChars _inBuf;
  RawChars _outBuf;
  RawChars _scratch;
  std::size_t _pollBytes{};
  bool _peerEof{false};

  // Inbound message of the current exchange
  std::optional<Message> _inbound;
  std::optional<BodyDecoder> _decoder;
  std::shared_ptr<BodyChannel> _channel;
  // Error met while feeding the inbound body during ServiceRun, reported when the service completes.
  ErrorSource _inboundErrorSource{ErrorSource::None};
  CodecError _inboundError{CodecError::None};

  // Outbound message of the current exchange
  std::optional<Message> _outbound;
  std::optional<BodyEncoder> _encoder;
  bool _responseStarted{false};

  // Server: method and version of the request being answered. Client: method of the last request written.
  std::string _requestMethod;
  http::Version _requestVersion{http::HTTP_1_1};
  bool _persistent{true};
  bool _continuePending{false};
};

}  // namespace tandem
