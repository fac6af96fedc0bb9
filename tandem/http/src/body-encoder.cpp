#include "tandem/body-encoder.hpp"

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <type_traits>

#include "tandem/body-stream.hpp"
#include "tandem/body.hpp"
#include "tandem/char-hexadecimal-converter.hpp"
#include "tandem/codec-error.hpp"
#include "tandem/framing-mode.hpp"
#include "tandem/http-constants.hpp"
#include "tandem/log.hpp"
#include "tandem/raw-chars.hpp"

namespace tandem {

namespace {

// 16 hex digits + CRLF
constexpr std::size_t kMaxChunkSizeLineBytes = 18;

}  // namespace

BodyEncoder::BodyEncoder(Body& body, FramingMode framing, std::size_t chunkSizeHint) noexcept
    : _pBody(&body), _framing(framing), _chunkSizeHint(chunkSizeHint) {}

EncodeResult BodyEncoder::fail(CodecError error) noexcept {
  _state = State::Failed;
  _error = error;
  return {EncodeStatus::Error, {}, error};
}

BodyPoll BodyEncoder::pollSource() {
  return _pBody->visit([this](auto& body) -> BodyPoll {
    using T = std::decay_t<decltype(body)>;
    if constexpr (std::is_same_v<T, BufferedBody>) {
      if (_bufferedConsumed || body.bytes.empty()) {
        return BodyPoll::End();
      }
      _bufferedConsumed = true;
      return BodyPoll::Data(body.bytes.view());
    } else {
      return body.stream->pollChunk();
    }
  });
}

EncodeResult BodyEncoder::next(RawChars& scratch) {
  switch (_state) {
    case State::Done:
      return {EncodeStatus::Done};
    case State::Failed:
      return {EncodeStatus::Error, {}, _error};
    default:
      break;
  }

  std::string_view data = _pendingData;
  while (data.empty()) {
    const BodyPoll poll = pollSource();
    switch (poll.status) {
      case BodyPollStatus::Data:
        data = poll.data;
        break;
      case BodyPollStatus::Pending:
        return {EncodeStatus::Pending};
      case BodyPollStatus::End:
        if (_framing.kind == FramingMode::Kind::Length && _bodyBytes != _framing.length) {
          log::warn("Body ended after {} bytes, {} were declared", _bodyBytes, _framing.length);
          return fail(CodecError::BodyLengthMismatch);
        }
        if (_framing.kind == FramingMode::Kind::Chunked) {
          _state = State::Done;
          return {EncodeStatus::Unit, http::LastChunk};
        }
        _state = State::Done;
        return {EncodeStatus::Done};
      default:
        log::error("Outbound body stream failed: {}", CodecErrorToStr(poll.error));
        return fail(poll.error == CodecError::None ? CodecError::BodyStreamFailure : poll.error);
    }
  }

  switch (_framing.kind) {
    case FramingMode::Kind::Length:
      _pendingData = {};
      _bodyBytes += data.size();
      if (_bodyBytes > _framing.length) {
        log::warn("Body produced at least {} bytes, {} were declared", _bodyBytes, _framing.length);
        return fail(CodecError::BodyLengthMismatch);
      }
      return {EncodeStatus::Unit, data};
    case FramingMode::Kind::Chunked: {
      std::size_t sz = data.size();
      if (_chunkSizeHint != 0 && sz > _chunkSizeHint) {
        sz = _chunkSizeHint;
      }
      _pendingData = data.substr(sz);
      _bodyBytes += sz;

      scratch.clear();
      scratch.ensureAvailableCapacity(kMaxChunkSizeLineBytes + sz + http::CRLF.size());
      char* sizeLast = to_lower_hex(sz, scratch.data());
      scratch.setSize(static_cast<std::size_t>(sizeLast - scratch.data()));
      scratch.unchecked_append(http::CRLF);
      scratch.unchecked_append(data.substr(0, sz));
      scratch.unchecked_append(http::CRLF);
      return {EncodeStatus::Unit, scratch.view()};
    }
    default:
      _pendingData = {};
      _bodyBytes += data.size();
      return {EncodeStatus::Unit, data};
  }
}

}  // namespace tandem
