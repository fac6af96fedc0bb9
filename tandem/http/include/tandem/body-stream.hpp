#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "tandem/codec-error.hpp"

namespace tandem {

enum class BodyPollStatus : uint8_t {
  Data,     // 'data' holds the next bytes of the body
  Pending,  // no bytes available yet, poll again later
  End,      // the body is complete
  Error     // the body cannot be completed, see 'error'
};

struct BodyPoll {
  static constexpr BodyPoll Data(std::string_view data) noexcept { return {BodyPollStatus::Data, data}; }
  static constexpr BodyPoll Pending() noexcept { return {BodyPollStatus::Pending, {}}; }
  static constexpr BodyPoll End() noexcept { return {BodyPollStatus::End, {}}; }
  static constexpr BodyPoll Error(CodecError error) noexcept { return {BodyPollStatus::Error, {}, error}; }

  BodyPollStatus status;
  // Only for Data. Valid until the next pollChunk() call on the same stream.
  std::string_view data;
  CodecError error{CodecError::None};
};

// A non-restartable producer of body bytes, polled without blocking.
// Outgoing bodies are implemented by the application; incoming ones are fed by the connection.
class BodyStream {
 public:
  virtual ~BodyStream() = default;

  virtual BodyPoll pollChunk() = 0;
};

// Body stream yielding a fixed list of chunks, then End.
class StringChunksStream : public BodyStream {
 public:
  explicit StringChunksStream(std::vector<std::string> chunks) noexcept : _chunks(std::move(chunks)) {}

  BodyPoll pollChunk() override;

  // Sum of the sizes of all chunks.
  [[nodiscard]] uint64_t totalSize() const noexcept;

 private:
  std::vector<std::string> _chunks;
  std::size_t _pos{};
};

}  // namespace tandem
