#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include "tandem/transport.hpp"

namespace tandem {

namespace internal {
struct MemoryPipeState;
}  // namespace internal

// In-memory transport, for tests and for driving a connection without any socket.
// The other end of the pipe is a MemoryPeer, which scripts what the transport reads and inspects what it wrote.
// Reads of an empty pipe return ReadReady until the peer closes its write side, then an orderly end of stream.
class MemoryTransport : public ITransport {
 public:
  explicit MemoryTransport(std::shared_ptr<internal::MemoryPipeState> state) noexcept : _state(std::move(state)) {}

  MemoryTransport(const MemoryTransport&) = delete;
  MemoryTransport(MemoryTransport&&) noexcept = default;
  MemoryTransport& operator=(const MemoryTransport&) = delete;
  MemoryTransport& operator=(MemoryTransport&&) noexcept = default;

  ~MemoryTransport() override;

  TransportResult read(char* buf, std::size_t len) override;

  TransportResult write(std::string_view data) override;

 private:
  std::shared_ptr<internal::MemoryPipeState> _state;
};

class MemoryPeer {
 public:
  explicit MemoryPeer(std::shared_ptr<internal::MemoryPipeState> state) noexcept : _state(std::move(state)) {}

  // Makes 'data' available to the transport's reads.
  void send(std::string_view data);

  // Closes the peer's write side: once pending bytes are read, the transport reads an end of stream.
  void closeWrite();

  // Makes every subsequent transport read and write fail.
  void fail();

  // Limits how many bytes the transport may write before reporting WriteReady. 0 means unlimited.
  // Bytes consumed by takeOutput() free room again.
  void setWriteCapacity(std::size_t capacity);

  // Limits how many bytes a single transport read returns. 0 means unlimited.
  void setReadChunkLimit(std::size_t limit);

  // Bytes written by the transport and not yet taken.
  [[nodiscard]] std::string_view output() const noexcept;

  // Returns and consumes the bytes written by the transport.
  [[nodiscard]] std::string takeOutput();

  // Bytes sent but not yet read by the transport.
  [[nodiscard]] std::size_t pendingInput() const noexcept;

  // True once the transport has been destroyed, which is how an owning connection closes its stream.
  [[nodiscard]] bool isTransportClosed() const noexcept;

  [[nodiscard]] std::size_t nbReads() const noexcept;
  [[nodiscard]] std::size_t nbWrites() const noexcept;

 private:
  std::shared_ptr<internal::MemoryPipeState> _state;
};

// Creates both ends of an in-memory pipe.
std::pair<std::unique_ptr<MemoryTransport>, MemoryPeer> MakeMemoryPipe();

}  // namespace tandem
