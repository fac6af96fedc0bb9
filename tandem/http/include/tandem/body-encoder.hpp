#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

#include "tandem/body.hpp"
#include "tandem/codec-error.hpp"
#include "tandem/framing-mode.hpp"
#include "tandem/raw-chars.hpp"

namespace tandem {

enum class EncodeStatus : uint8_t {
  Unit,     // 'unit' holds the next bytes to write
  Pending,  // the body stream has no bytes available yet
  Done,     // the whole body has been produced
  Error
};

struct EncodeResult {
  EncodeStatus status;
  // Only for Unit. Valid until the next call to next(), or until the scratch buffer is modified.
  std::string_view unit;
  CodecError error{CodecError::None};
};

// Produces the wire bytes of one outbound body, unit by unit, according to the framing its head was written with.
// For Length framing, bytes are forwarded unmodified and their total is checked against the declared length.
// For Chunked framing, each produced chunk is wrapped in its size line and CRLF, and the last chunk is appended.
// For CloseDelimited framing, bytes are forwarded unmodified.
class BodyEncoder {
 public:
  // 'body' must outlive the encoder. 'chunkSizeHint' caps the size of emitted chunks (0 = no cap).
  BodyEncoder(Body& body, FramingMode framing, std::size_t chunkSizeHint = 0) noexcept;

  // Produces the next unit. Chunk frames are assembled in 'scratch', other units point into the body.
  EncodeResult next(RawChars& scratch);

  [[nodiscard]] bool done() const noexcept { return _state == State::Done; }

  // Number of payload bytes produced so far, framing excluded.
  [[nodiscard]] uint64_t bodyBytes() const noexcept { return _bodyBytes; }

 private:
  enum class State : uint8_t { Body, Done, Failed };

  BodyPoll pollSource();

  EncodeResult fail(CodecError error) noexcept;

  Body* _pBody;
  FramingMode _framing;
  std::size_t _chunkSizeHint;
  State _state{State::Body};
  CodecError _error{CodecError::None};
  bool _bufferedConsumed{false};
  // Remainder of the last polled slice, when it is split in several chunks.
  std::string_view _pendingData;
  uint64_t _bodyBytes{};
};

}  // namespace tandem
