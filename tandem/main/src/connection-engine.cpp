#include "tandem/connection-engine.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string_view>
#include <type_traits>
#include <utility>

#include "tandem/body-channel.hpp"
#include "tandem/body-decoder.hpp"
#include "tandem/body-encoder.hpp"
#include "tandem/body.hpp"
#include "tandem/codec-error.hpp"
#include "tandem/connection-config.hpp"
#include "tandem/framing-mode.hpp"
#include "tandem/http-codec.hpp"
#include "tandem/http-constants.hpp"
#include "tandem/http-error-build.hpp"
#include "tandem/http-status-code.hpp"
#include "tandem/http-version.hpp"
#include "tandem/log.hpp"
#include "tandem/message-head.hpp"
#include "tandem/message.hpp"
#include "tandem/poll-result.hpp"
#include "tandem/raw-chars.hpp"
#include "tandem/role.hpp"
#include "tandem/timedef.hpp"
#include "tandem/timestring.hpp"
#include "tandem/transport.hpp"

namespace tandem {

namespace {

std::unique_ptr<ITransport> CheckTransport(std::unique_ptr<ITransport> transport) {
  if (!transport) {
    throw std::invalid_argument("Connection requires a transport");
  }
  return transport;
}

// Tells whether 'body' streams its bytes out of the inbound body 'channel'.
bool ReadsFromChannel(const Body& body, const BodyChannel* channel) {
  return body.visit([channel](const auto& alt) {
    if constexpr (std::is_same_v<std::remove_cvref_t<decltype(alt)>, BufferedBody>) {
      return false;
    } else {
      const auto* incoming = dynamic_cast<const IncomingBodyStream*>(alt.stream.get());
      return incoming != nullptr && incoming->readsFrom(channel);
    }
  });
}

const ConnectionConfig& CheckConfig(const ConnectionConfig& config) {
  config.validate();
  return config;
}

}  // namespace

ConnectionEngine::ConnectionEngine(Role role, std::unique_ptr<ITransport> transport, const ConnectionConfig& config)
    : _config(CheckConfig(config)),
      _transport(CheckTransport(std::move(transport))),
      _context(role),
      _phase(InitialPhase(role)) {
  _context._persistent = _config.enableKeepAlive;
}

void ConnectionEngine::setPhase(Phase phase) noexcept {
  log::trace("{} connection: {} -> {}", RoleToStr(role()), PhaseToStr(_phase), PhaseToStr(phase));
  _phase = phase;
}

PollResult ConnectionEngine::pollIo() {
  switch (_phase) {
    case Phase::HeadRead:
      return pollHeadRead();
    case Phase::HeadWrite:
      return pollHeadWrite();
    case Phase::Terminal:
      return PollResult::Terminal();
    default:
      throw std::logic_error("ServiceRun phase is driven by the connection");
  }
}

//////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Inbound
//////////////////////////////////////////////////////////////////////////////////////////////////////////////////////

PollResult ConnectionEngine::pollHeadRead() {
  const MessageKind kind = role() == Role::Server ? MessageKind::Request : MessageKind::Response;
  const HeadLimits limits{_config.maxHeaderBytes, _config.maxHeaderCount};
  while (true) {
    MessageHead head;
    const HeadParseResult res = ParseHead(_inBuf.view(), kind, limits, head);
    if (res.status == ParseStatus::Error) {
      return protocolError(res.error);
    }
    if (res.status == ParseStatus::Complete) {
      _inBuf.erase_front(res.consumed);
      if (role() == Role::Client && http::IsInformationalStatus(head.status()) &&
          head.status() != http::StatusCodeSwitchingProtocols) {
        log::debug("Client connection skips interim response {}", head.status());
        continue;
      }
      return onHeadParsed(std::move(head));
    }

    // NeedMoreData
    if (_peerEof) {
      if (_inBuf.view().find_first_not_of(http::CRLF) == std::string_view::npos) {
        log::debug("{} connection closed by peer after {} exchange(s)", RoleToStr(role()), _stats.exchanges);
        return terminate(TerminalReason::Closed);
      }
      return protocolError(CodecError::UnexpectedEof);
    }
    if (budgetExhausted()) {
      return PollResult::Progress();
    }
    switch (readSome()) {
      case IoOutcome::WouldBlock:
        return PollResult::Suspended(SuspendReason::Readable);
      case IoOutcome::Error:
        return transportError("read");
      default:
        break;
    }
  }
}

PollResult ConnectionEngine::onHeadParsed(MessageHead head) {
  const FramingResult framing =
      ResolveFraming(head, role() == Role::Client ? std::string_view(_requestMethod) : std::string_view{});
  if (framing.error != CodecError::None) {
    return protocolError(framing.error);
  }
  if (framing.mode.kind == FramingMode::Kind::Length && _config.maxBodyBytes != 0 &&
      framing.mode.length > _config.maxBodyBytes) {
    return protocolError(CodecError::BodyTooLarge);
  }

  _decoder.emplace(framing.mode, bodyLimits());
  _inboundErrorSource = ErrorSource::None;
  _inboundError = CodecError::None;

  Body body;
  if (!framing.mode.isEmpty()) {
    _channel = std::make_shared<BodyChannel>();
    auto stream = std::make_unique<IncomingBodyStream>(_channel);
    if (framing.mode.kind == FramingMode::Kind::Length) {
      body = Body::ExactSize(framing.mode.length, std::move(stream));
    } else {
      body = Body::Streaming(std::move(stream));
    }
  }

  if (role() == Role::Server) {
    _requestMethod.assign(head.method());
    _requestVersion = head.version();
    _persistent = _config.enableKeepAlive && DeclaresKeepAlive(head);
    _continuePending = ExpectsContinue(head) && !framing.mode.isEmpty();
    log::debug("Server connection received {} {} ({} body)", head.method(), head.target(),
               FramingKindToStr(framing.mode.kind));
  } else {
    ++_stats.exchanges;
    _context._exchanges = _stats.exchanges;
    _persistent = _persistent && DeclaresKeepAlive(head) && framing.mode.isDeterminate() &&
                  head.status() != http::StatusCodeSwitchingProtocols;
    log::debug("Client connection received status {} ({} body)", head.status(), FramingKindToStr(framing.mode.kind));
  }
  _context._persistent = _persistent;

  _inbound = Message{std::move(head), std::move(body)};
  setPhase(Phase::ServiceRun);
  return PollResult::PhaseComplete();
}

std::optional<Message> ConnectionEngine::takeInbound() {
  std::optional<Message> inbound = std::move(_inbound);
  _inbound.reset();
  return inbound;
}

PollResult ConnectionEngine::pumpInbound() {
  if (!_channel || !_channel->wantsData()) {
    return PollResult::Suspended(SuspendReason::Task);
  }
  while (true) {
    const BodyDecodeResult res = _decoder->decode(_inBuf.view(), _peerEof);
    switch (res.status) {
      case BodyDecodeStatus::Data:
        _channel->offer(res.data);
        _inBuf.erase_front(res.consumed);
        return PollResult::Progress();
      case BodyDecodeStatus::End:
        _inBuf.erase_front(res.consumed);
        _channel->finish();
        return PollResult::Progress();
      case BodyDecodeStatus::Error:
        log::warn("{} connection failed to decode inbound body: {}", RoleToStr(role()), CodecErrorToStr(res.error));
        _inboundErrorSource = ErrorSource::Codec;
        _inboundError = res.error;
        _channel->fail(res.error);
        return PollResult::Progress();
      default:
        break;
    }

    // NeedMoreData
    _inBuf.erase_front(res.consumed);
    if (_continuePending) {
      log::debug("Server connection sends 100 Continue");
      _continuePending = false;
      _outBuf.append(http::HTTP11_100_CONTINUE);
    }
    if (!_outBuf.empty()) {
      switch (flushOut()) {
        case IoOutcome::WouldBlock:
          return PollResult::Suspended(SuspendReason::Writable);
        case IoOutcome::Error:
          _inboundErrorSource = ErrorSource::Transport;
          _channel->fail(CodecError::UnexpectedEof);
          return PollResult::Progress();
        default:
          break;
      }
    }
    if (budgetExhausted()) {
      return PollResult::Progress();
    }
    switch (readSome()) {
      case IoOutcome::WouldBlock:
        return PollResult::Suspended(SuspendReason::Readable);
      case IoOutcome::Error:
        log::error("{} connection failed to read inbound body", RoleToStr(role()));
        _inboundErrorSource = ErrorSource::Transport;
        _channel->fail(CodecError::UnexpectedEof);
        return PollResult::Progress();
      default:
        break;
    }
  }
}

PollResult ConnectionEngine::completeService(std::optional<Message> outbound) {
  if (_inboundErrorSource == ErrorSource::Transport) {
    _errorSource = ErrorSource::Transport;
    return terminate(TerminalReason::Error);
  }
  if (_inboundErrorSource == ErrorSource::Codec) {
    return protocolError(_inboundError);
  }
  if (!outbound) {
    log::debug("{} service ended the connection", RoleToStr(role()));
    return terminate(TerminalReason::Closed);
  }
  if (_channel && !_channel->abandoned() && !_channel->finished()) {
    // The rest of the inbound body is discarded before writing, so a stream still held on it cannot be read anymore.
    _channel->fail(CodecError::BodyStreamFailure);
    if (ReadsFromChannel(outbound->body, _channel.get())) {
      return failService("outbound body reads from the unconsumed inbound body");
    }
  }
  if (role() == Role::Client && _stats.exchanges != 0 && !_persistent) {
    log::debug("Client connection is not persistent, next request is not sent");
    return terminate(TerminalReason::Closed);
  }
  _outbound = std::move(outbound);
  _writeStep = WriteStep::Drain;
  setPhase(Phase::HeadWrite);
  return PollResult::PhaseComplete();
}

//////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Outbound
//////////////////////////////////////////////////////////////////////////////////////////////////////////////////////

PollResult ConnectionEngine::pollHeadWrite() {
  while (true) {
    switch (_writeStep) {
      case WriteStep::Drain: {
        if (const auto res = drainInbound()) {
          return *res;
        }
        if (const auto res = prepareOutbound()) {
          return *res;
        }
        _writeStep = WriteStep::Head;
        break;
      }
      case WriteStep::Head:
        _responseStarted = true;
        switch (flushOut()) {
          case IoOutcome::WouldBlock:
            return PollResult::Suspended(SuspendReason::Writable);
          case IoOutcome::Error:
            return transportError("write");
          default:
            break;
        }
        _writeStep = _encoder ? WriteStep::Body : WriteStep::Finish;
        break;
      case WriteStep::Body: {
        if (!_outBuf.empty()) {
          switch (flushOut()) {
            case IoOutcome::WouldBlock:
              return PollResult::Suspended(SuspendReason::Writable);
            case IoOutcome::Error:
              return transportError("write");
            default:
              break;
          }
        }
        if (budgetExhausted()) {
          return PollResult::Progress();
        }
        const EncodeResult res = _encoder->next(_scratch);
        switch (res.status) {
          case EncodeStatus::Unit:
            switch (writeUnit(res.unit)) {
              case IoOutcome::WouldBlock:
                return PollResult::Suspended(SuspendReason::Writable);
              case IoOutcome::Error:
                return transportError("write");
              default:
                break;
            }
            break;
          case EncodeStatus::Pending:
            return PollResult::Suspended(SuspendReason::Task);
          case EncodeStatus::Done:
            _writeStep = WriteStep::Finish;
            break;
          default:
            log::warn("{} connection failed to write body: {}", RoleToStr(role()), CodecErrorToStr(res.error));
            _errorSource = ErrorSource::Codec;
            _lastError = res.error;
            return terminate(TerminalReason::Error);
        }
        break;
      }
      case WriteStep::Finish:
        switch (flushOut()) {
          case IoOutcome::WouldBlock:
            return PollResult::Suspended(SuspendReason::Writable);
          case IoOutcome::Error:
            return transportError("write");
          default:
            break;
        }
        return finishExchange();
      default:
        throw std::logic_error("unexpected write step");
    }
  }
}

std::optional<PollResult> ConnectionEngine::drainInbound() {
  if (_decoder && !_decoder->done()) {
    if (_continuePending) {
      // The peer waits for 100 Continue before sending its body, it will not come.
      log::debug("Server connection will close instead of reading the unrequested body");
      _persistent = false;
      _decoder.reset();
    }
  }
  while (_decoder && !_decoder->done()) {
    const BodyDecodeResult res = _decoder->decode(_inBuf.view(), _peerEof);
    _inBuf.erase_front(res.consumed);
    if (res.status == BodyDecodeStatus::Error) {
      return protocolError(res.error);
    }
    if (res.status != BodyDecodeStatus::NeedMoreData) {
      continue;
    }
    if (budgetExhausted()) {
      return PollResult::Progress();
    }
    switch (readSome()) {
      case IoOutcome::WouldBlock:
        return PollResult::Suspended(SuspendReason::Readable);
      case IoOutcome::Error:
        return transportError("read");
      default:
        break;
    }
  }
  _decoder.reset();
  _channel.reset();
  return std::nullopt;
}

void ConnectionEngine::prepareResponseHead(MessageHead& head, bool streaming) {
  HeaderList& headers = head.headers();
  if (streaming && !_requestVersion.defaultsToKeepAlive()) {
    // chunked is not available to HTTP/1.0 peers, the body is delimited by closing the connection
    _persistent = false;
  }
  if (_context._closeRequested || headers.containsToken(http::Connection, http::close) ||
      (_config.maxExchangesPerConnection != 0 && _stats.exchanges + 1 >= _config.maxExchangesPerConnection)) {
    _persistent = false;
  }

  if (!_persistent) {
    if (!headers.containsToken(http::Connection, http::close)) {
      headers.set(http::ConnectionLower, http::close);
    }
  } else if (!_requestVersion.defaultsToKeepAlive() && !headers.containsToken(http::Connection, http::keepalive)) {
    headers.set(http::ConnectionLower, http::keepalive);
  }

  if (_config.addDateHeader && !headers.contains(http::Date)) {
    char dateBuf[kRFC7231DateStrLen];
    TimeToStringRFC7231(SysClock::now(), dateBuf);
    headers.append(http::DateLower, std::string_view(dateBuf, kRFC7231DateStrLen));
  }
}

std::optional<PollResult> ConnectionEngine::prepareOutbound() {
  Message& message = *_outbound;
  MessageHead& head = message.head;
  std::optional<FramingMode> framing = message.body.framing();
  bool writeBody = true;

  if (role() == Role::Server) {
    if (head.isRequest()) {
      throw std::logic_error("server service must produce a response");
    }
    const bool streaming = message.body.isStreaming();
    prepareResponseHead(head, streaming);
    if (streaming && !_requestVersion.defaultsToKeepAlive()) {
      framing = FramingMode::CloseDelimited();
    }
    if (http::IsBodylessStatus(head.status())) {
      framing.reset();
      writeBody = false;
    } else if (_requestMethod == http::HEAD) {
      writeBody = false;
    }
  } else {
    if (!head.isRequest()) {
      throw std::logic_error("client service must produce a request");
    }
    if (message.body.isStreaming() && !head.version().defaultsToKeepAlive()) {
      return protocolError(CodecError::StreamingRequiresHttp11);
    }
    if (!_config.enableKeepAlive || _context._closeRequested ||
        (_config.maxExchangesPerConnection != 0 && _stats.exchanges + 1 >= _config.maxExchangesPerConnection)) {
      _persistent = false;
      if (!head.headers().containsToken(http::Connection, http::close)) {
        head.headers().set(http::ConnectionLower, http::close);
      }
    }
    _persistent = _persistent && DeclaresKeepAlive(head);
    _requestMethod.assign(head.method());
  }
  _context._persistent = _persistent;

  WriteHead(head, framing, _outBuf);
  if (writeBody) {
    _encoder.emplace(message.body, framing.value_or(FramingMode::Length(0)), _config.streamingChunkSizeHint);
  }
  log::debug("{} connection writes {} with {} framing", RoleToStr(role()), head.isRequest() ? "request" : "response",
             framing ? FramingKindToStr(framing->kind) : "no");
  return std::nullopt;
}

PollResult ConnectionEngine::finishExchange() {
  _encoder.reset();
  _outbound.reset();
  _responseStarted = false;
  if (_terminalAfterFlush != TerminalReason::None) {
    return terminate(_terminalAfterFlush);
  }
  if (role() == Role::Client) {
    setPhase(Phase::HeadRead);
    return PollResult::PhaseComplete();
  }
  ++_stats.exchanges;
  _context._exchanges = _stats.exchanges;
  log::debug("Server connection completed exchange #{}", _stats.exchanges);
  if (!_persistent) {
    return terminate(TerminalReason::Closed);
  }
  _requestMethod.clear();
  _continuePending = false;
  _inBuf.shrinkIfEmpty(_config.readChunkBytes);
  setPhase(Phase::HeadRead);
  return PollResult::PhaseComplete();
}

//////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Failures and termination
//////////////////////////////////////////////////////////////////////////////////////////////////////////////////////

PollResult ConnectionEngine::protocolError(CodecError error) {
  log::warn("{} connection protocol error: {}", RoleToStr(role()), CodecErrorToStr(error));
  _errorSource = ErrorSource::Codec;
  _lastError = error;
  if (_channel) {
    _channel->fail(error);
  }
  if (role() == Role::Server && !_responseStarted) {
    return queueErrorResponse(CodecErrorToStatus(error));
  }
  return terminate(TerminalReason::Error);
}

PollResult ConnectionEngine::transportError(std::string_view operation) {
  log::error("{} connection transport {} failure", RoleToStr(role()), operation);
  _errorSource = ErrorSource::Transport;
  return terminate(TerminalReason::Error);
}

PollResult ConnectionEngine::failService(std::string_view what) {
  if (_phase == Phase::Terminal) {
    return PollResult::Terminal();
  }
  log::error("{} service failure: {}", RoleToStr(role()), what);
  _errorSource = ErrorSource::Service;
  if (role() == Role::Server && !_responseStarted) {
    return queueErrorResponse(http::StatusCodeInternalServerError);
  }
  return terminate(TerminalReason::Error);
}

PollResult ConnectionEngine::queueErrorResponse(http::StatusCode status) {
  // Only a pending interim response may precede the error response in the output buffer.
  _encoder.reset();
  _outbound.reset();
  _inbound.reset();
  _decoder.reset();
  _persistent = false;
  _context._persistent = false;
  _outBuf.append(BuildSimpleError(status, {}, _config.addDateHeader).view());
  _terminalAfterFlush = TerminalReason::Error;
  _writeStep = WriteStep::Finish;
  setPhase(Phase::HeadWrite);
  return PollResult::PhaseComplete();
}

PollResult ConnectionEngine::terminate(TerminalReason reason) {
  _encoder.reset();
  _outbound.reset();
  _inbound.reset();
  _decoder.reset();
  if (_channel && !_channel->finished()) {
    _channel->fail(CodecError::UnexpectedEof);
  }
  _channel.reset();
  _transport.reset();
  _terminalReason = reason;
  _context._persistent = false;
  setPhase(Phase::Terminal);
  log::debug("{} connection terminated ({}) after {} exchange(s), {} bytes read, {} bytes written",
             RoleToStr(role()), TerminalReasonToStr(reason), _stats.exchanges, _stats.bytesRead, _stats.bytesWritten);
  return PollResult::Terminal();
}

//////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Transport I/O
//////////////////////////////////////////////////////////////////////////////////////////////////////////////////////

ConnectionEngine::IoOutcome ConnectionEngine::readSome() {
  if (_peerEof) {
    return IoOutcome::Eof;
  }
  _inBuf.ensureAvailableCapacity(_config.readChunkBytes);
  const auto [nbRead, want] = _transport->read(_inBuf.data() + _inBuf.size(), _config.readChunkBytes);
  _inBuf.addSize(nbRead);
  _stats.bytesRead += nbRead;
  _pollBytes += nbRead;
  if (want == TransportHint::Error) {
    return IoOutcome::Error;
  }
  if (nbRead != 0) {
    return IoOutcome::Done;
  }
  if (want == TransportHint::None) {
    log::trace("{} connection read end of stream", RoleToStr(role()));
    _peerEof = true;
    return IoOutcome::Eof;
  }
  return IoOutcome::WouldBlock;
}

ConnectionEngine::IoOutcome ConnectionEngine::flushOut() {
  while (!_outBuf.empty()) {
    const auto [nbWritten, want] = _transport->write(_outBuf.view());
    _outBuf.erase_front(nbWritten);
    _stats.bytesWritten += nbWritten;
    _pollBytes += nbWritten;
    if (want == TransportHint::Error) {
      return IoOutcome::Error;
    }
    if (want != TransportHint::None || nbWritten == 0) {
      return _outBuf.empty() ? IoOutcome::Done : IoOutcome::WouldBlock;
    }
  }
  return IoOutcome::Done;
}

ConnectionEngine::IoOutcome ConnectionEngine::writeUnit(std::string_view unit) {
  if (!_outBuf.empty()) {
    _outBuf.append(unit);
    return flushOut();
  }
  const auto [nbWritten, want] = _transport->write(unit);
  _stats.bytesWritten += nbWritten;
  _pollBytes += nbWritten;
  if (want == TransportHint::Error) {
    return IoOutcome::Error;
  }
  if (nbWritten < unit.size()) {
    // keep the rest of the unit, which may point into a buffer reused by the next unit
    _outBuf.append(unit.substr(nbWritten));
    return IoOutcome::WouldBlock;
  }
  return IoOutcome::Done;
}

}  // namespace tandem
