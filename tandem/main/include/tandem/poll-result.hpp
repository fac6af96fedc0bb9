#pragma once

#include <cstdint>
#include <string_view>

namespace tandem {

enum class PollStatus : uint8_t {
  Progress,       // work was done, poll again (returned when the per-poll byte budget is reached)
  Suspended,      // nothing can be done before 'reason' is satisfied
  PhaseComplete,  // the connection moved to its next phase, poll again
  Terminal        // the connection is finished, its stream is closed
};

enum class SuspendReason : uint8_t {
  None,
  Readable,  // waiting for the stream to become readable
  Writable,  // waiting for the stream to become writable
  Task       // waiting for the service, or for an outbound body stream
};

struct PollResult {
  static constexpr PollResult Progress() noexcept { return {PollStatus::Progress}; }
  static constexpr PollResult Suspended(SuspendReason reason) noexcept { return {PollStatus::Suspended, reason}; }
  static constexpr PollResult PhaseComplete() noexcept { return {PollStatus::PhaseComplete}; }
  static constexpr PollResult Terminal() noexcept { return {PollStatus::Terminal}; }

  constexpr bool operator==(const PollResult&) const noexcept = default;

  PollStatus status;
  SuspendReason reason{SuspendReason::None};
};

enum class TerminalReason : uint8_t { None, Closed, Error };

// Side responsible for a connection ending in error.
enum class ErrorSource : uint8_t { None, Codec, Transport, Service };

struct ConnectionStats {
  uint64_t exchanges{};
  uint64_t bytesRead{};
  uint64_t bytesWritten{};
};

constexpr std::string_view TerminalReasonToStr(TerminalReason reason) noexcept {
  switch (reason) {
    case TerminalReason::Closed:
      return "closed";
    case TerminalReason::Error:
      return "error";
    default:
      return "none";
  }
}

}  // namespace tandem
