#include "tandem/body-decoder.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string_view>

#include "tandem/char-hexadecimal-converter.hpp"
#include "tandem/codec-error.hpp"
#include "tandem/framing-mode.hpp"
#include "tandem/header-line-parse.hpp"
#include "tandem/http-constants.hpp"
#include "tandem/http-header.hpp"
#include "tandem/string-trim.hpp"

namespace tandem {

namespace {

// A chunk size line longer than this is refused, extensions included.
constexpr std::size_t kMaxChunkSizeLineBytes = 1024;

// Parses the hexadecimal size of a chunk size line (CRLF excluded), ignoring extensions.
// Returns false if the size is not a valid hexadecimal number fitting in 64 bits.
bool ParseChunkSize(std::string_view line, uint64_t& size) {
  line = TrimOws(line.substr(0, line.find(';')));
  if (line.empty()) {
    return false;
  }
  uint64_t value = 0;
  for (char ch : line) {
    const int digit = from_hex_digit(ch);
    if (digit < 0 || value > (std::numeric_limits<uint64_t>::max() >> 4)) {
      return false;
    }
    value = (value << 4) | static_cast<uint64_t>(digit);
  }
  size = value;
  return true;
}

}  // namespace

BodyDecoder::BodyDecoder(FramingMode framing, BodyLimits limits) noexcept
    : _framing(framing),
      _limits(limits),
      _state(framing.kind == FramingMode::Kind::Chunked ? State::ChunkSize : State::Raw) {}

BodyDecodeResult BodyDecoder::fail(CodecError error, std::size_t consumed) noexcept {
  _state = State::Failed;
  _error = error;
  return {BodyDecodeStatus::Error, error, consumed};
}

BodyDecodeResult BodyDecoder::decode(std::string_view input, bool eof) {
  switch (_state) {
    case State::Done:
      return {BodyDecodeStatus::End};
    case State::Failed:
      return {BodyDecodeStatus::Error, _error};
    case State::Raw:
      return decodeRaw(input, eof);
    default:
      return decodeChunked(input, eof);
  }
}

BodyDecodeResult BodyDecoder::decodeRaw(std::string_view input, bool eof) {
  if (_framing.kind == FramingMode::Kind::Length) {
    if (_limits.maxBodyBytes != 0 && _framing.length > _limits.maxBodyBytes) {
      return fail(CodecError::BodyTooLarge);
    }
    const uint64_t remaining = _framing.length - _decodedBytes;
    if (remaining == 0) {
      _state = State::Done;
      return {BodyDecodeStatus::End};
    }
    if (input.empty()) {
      return eof ? fail(CodecError::UnexpectedEof) : BodyDecodeResult{BodyDecodeStatus::NeedMoreData};
    }
    const auto sz = static_cast<std::size_t>(std::min<uint64_t>(remaining, input.size()));
    _decodedBytes += sz;
    return {BodyDecodeStatus::Data, CodecError::None, sz, input.substr(0, sz)};
  }

  // close-delimited
  if (input.empty()) {
    if (eof) {
      _state = State::Done;
      return {BodyDecodeStatus::End};
    }
    return {BodyDecodeStatus::NeedMoreData};
  }
  if (exceedsBodyLimit(input.size())) {
    return fail(CodecError::BodyTooLarge);
  }
  _decodedBytes += input.size();
  return {BodyDecodeStatus::Data, CodecError::None, input.size(), input};
}

BodyDecodeResult BodyDecoder::decodeChunked(std::string_view input, bool eof) {
  std::size_t pos = 0;
  const auto needMoreData = [&pos, eof, this]() {
    return eof ? fail(CodecError::UnexpectedEof, pos) : BodyDecodeResult{BodyDecodeStatus::NeedMoreData,
                                                                          CodecError::None, pos};
  };

  while (true) {
    switch (_state) {
      case State::ChunkSize: {
        const auto lf = input.find('\n', pos);
        if (lf == std::string_view::npos) {
          if (input.size() - pos > kMaxChunkSizeLineBytes) {
            return fail(CodecError::InvalidChunk, pos);
          }
          return needMoreData();
        }
        uint64_t chunkSize{};
        if (lf == pos || input[lf - 1U] != '\r' || lf - pos > kMaxChunkSizeLineBytes ||
            !ParseChunkSize(input.substr(pos, lf - 1U - pos), chunkSize)) {
          return fail(CodecError::InvalidChunk, pos);
        }
        if (chunkSize > _limits.maxChunkBytes) {
          return fail(CodecError::ChunkTooLarge, pos);
        }
        if (exceedsBodyLimit(chunkSize)) {
          return fail(CodecError::BodyTooLarge, pos);
        }
        pos = lf + 1U;
        if (chunkSize == 0) {
          _state = State::Trailers;
        } else {
          _chunkRemaining = chunkSize;
          _state = State::ChunkData;
        }
        break;
      }
      case State::ChunkData: {
        if (pos == input.size()) {
          return needMoreData();
        }
        const auto sz = static_cast<std::size_t>(std::min<uint64_t>(_chunkRemaining, input.size() - pos));
        _chunkRemaining -= sz;
        _decodedBytes += sz;
        if (_chunkRemaining == 0) {
          _state = State::ChunkDataCrlf;
        }
        return {BodyDecodeStatus::Data, CodecError::None, pos + sz, input.substr(pos, sz)};
      }
      case State::ChunkDataCrlf: {
        const std::string_view avail = input.substr(pos, http::CRLF.size());
        if (!http::CRLF.starts_with(avail)) {
          return fail(CodecError::InvalidChunk, pos);
        }
        if (avail.size() < http::CRLF.size()) {
          return needMoreData();
        }
        pos += http::CRLF.size();
        _state = State::ChunkSize;
        break;
      }
      case State::Trailers: {
        const auto lf = input.find('\n', pos);
        if (lf == std::string_view::npos) {
          if (_trailerBytes + (input.size() - pos) > _limits.maxTrailerBytes) {
            return fail(CodecError::HeadTooLarge, pos);
          }
          return needMoreData();
        }
        const std::size_t lineLen = lf + 1U - pos;
        _trailerBytes += lineLen;
        if (_trailerBytes > _limits.maxTrailerBytes) {
          return fail(CodecError::HeadTooLarge, pos);
        }
        if (lf == pos || input[lf - 1U] != '\r') {
          return fail(CodecError::InvalidChunk, pos);
        }
        if (lineLen == http::CRLF.size()) {
          _state = State::Done;
          return {BodyDecodeStatus::End, CodecError::None, lf + 1U};
        }
        // trailer fields are discarded, but must still be well formed
        const char* lineStart = input.data() + pos;
        const http::HeaderView trailer = http::ParseHeaderLine(lineStart, input.data() + lf - 1U);
        if (!http::IsValidHeaderName(trailer.name) || !http::IsValidHeaderValue(trailer.value)) {
          return fail(CodecError::InvalidChunk, pos);
        }
        pos = lf + 1U;
        break;
      }
      default:
        return {BodyDecodeStatus::End, CodecError::None, pos};
    }
  }
}

}  // namespace tandem
