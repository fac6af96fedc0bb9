#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

#include "tandem/codec-error.hpp"
#include "tandem/framing-mode.hpp"

namespace tandem {

enum class BodyDecodeStatus : uint8_t {
  Data,          // 'data' holds the next decoded bytes
  NeedMoreData,  // all given bytes were consumed, body not finished
  End,           // body complete, trailers included
  Error
};

struct BodyLimits {
  uint64_t maxBodyBytes{};  // 0 = unlimited
  uint64_t maxChunkBytes{1UL << 24};
  std::size_t maxTrailerBytes{8192};
};

struct BodyDecodeResult {
  BodyDecodeStatus status;
  CodecError error{CodecError::None};
  // Bytes of the input processed by this call, framing included. The caller should drop them from its buffer
  // (after having used 'data', which points inside them) whatever the status.
  std::size_t consumed{};
  std::string_view data;
};

// Incremental decoder of one inbound body, according to its resolved framing mode.
// Each decode() call returns at most one slice of decoded bytes, pointing into the given input (no copy).
// Chunk size lines, chunk extensions and CRLFs are stripped, trailers are consumed and discarded.
class BodyDecoder {
 public:
  BodyDecoder(FramingMode framing, BodyLimits limits) noexcept;

  // 'input' starts at the first byte not consumed so far. 'eof' tells that the peer will not send any more byte.
  BodyDecodeResult decode(std::string_view input, bool eof);

  [[nodiscard]] bool done() const noexcept { return _state == State::Done; }

  [[nodiscard]] FramingMode framing() const noexcept { return _framing; }

  // Number of body bytes decoded so far.
  [[nodiscard]] uint64_t decodedBytes() const noexcept { return _decodedBytes; }

 private:
  enum class State : uint8_t { Raw, ChunkSize, ChunkData, ChunkDataCrlf, Trailers, Done, Failed };

  BodyDecodeResult decodeRaw(std::string_view input, bool eof);
  BodyDecodeResult decodeChunked(std::string_view input, bool eof);

  BodyDecodeResult fail(CodecError error, std::size_t consumed = 0) noexcept;

  [[nodiscard]] bool exceedsBodyLimit(uint64_t additionalBytes) const noexcept {
    return _limits.maxBodyBytes != 0 && _decodedBytes + additionalBytes > _limits.maxBodyBytes;
  }

  FramingMode _framing;
  BodyLimits _limits;
  State _state;
  CodecError _error{CodecError::None};
  uint64_t _decodedBytes{};
  uint64_t _chunkRemaining{};
  std::size_t _trailerBytes{};
};

}  // namespace tandem
