#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string_view>
#include <utility>

#include "tandem/body-stream.hpp"
#include "tandem/codec-error.hpp"
#include "tandem/raw-chars.hpp"

namespace tandem {

// Hand-off point between a connection decoding an inbound body and the service consuming it.
// The connection offers decoded slices only when the consumer asks for more (wantsData()), so that at most one slice
// is held at a time. A slice handed out by poll() stays valid until the next poll().
// Single threaded: both sides are driven by the same connection poll.
class BodyChannel {
 public:
  // Producer side

  // Tells whether the consumer has taken everything offered so far and asked for more.
  [[nodiscard]] bool wantsData() const noexcept { return _wantsData && !_abandoned && _state == State::Open; }

  // Copies 'data' into the channel.
  void offer(std::string_view data);

  void finish() noexcept { _state = State::Finished; }

  void fail(CodecError error) noexcept {
    _state = State::Failed;
    _error = error;
  }

  [[nodiscard]] bool abandoned() const noexcept { return _abandoned; }

  [[nodiscard]] bool finished() const noexcept { return _state == State::Finished; }

  // Consumer side

  BodyPoll poll();

  // Called when the consumer drops the stream. The producer is then free to discard the rest of the body.
  void abandon() noexcept;

 private:
  enum class State : uint8_t { Open, Finished, Failed };

  RawChars _buffer;
  State _state{State::Open};
  CodecError _error{CodecError::None};
  bool _delivered{false};
  bool _wantsData{false};
  bool _abandoned{false};
};

// Inbound body stream handed to services, reading from a BodyChannel fed by the connection.
class IncomingBodyStream : public BodyStream {
 public:
  explicit IncomingBodyStream(std::shared_ptr<BodyChannel> channel) noexcept : _channel(std::move(channel)) {}

  IncomingBodyStream(const IncomingBodyStream&) = delete;
  IncomingBodyStream(IncomingBodyStream&&) noexcept = default;
  IncomingBodyStream& operator=(const IncomingBodyStream&) = delete;
  IncomingBodyStream& operator=(IncomingBodyStream&&) noexcept = default;

  ~IncomingBodyStream() override;

  BodyPoll pollChunk() override { return _channel->poll(); }

  [[nodiscard]] bool readsFrom(const BodyChannel* channel) const noexcept { return _channel.get() == channel; }

 private:
  std::shared_ptr<BodyChannel> _channel;
};

}  // namespace tandem
