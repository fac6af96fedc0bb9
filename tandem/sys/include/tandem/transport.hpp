#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <utility>

#include "tandem/base-fd.hpp"

namespace tandem {

// Indicates what the transport layer needs to proceed after a non-blocking I/O operation could not complete.
enum class TransportHint : uint8_t {
  None,        // No special action needed (operation completed, or orderly close on read)
  ReadReady,   // Need the stream readable before the operation can proceed
  WriteReady,  // Need the stream writable before the operation can proceed
  Error
};

// Byte stream abstraction the connection engine reads from and writes to.
// Implementations never block: they report through TransportHint what readiness they wait for.
class ITransport {
 public:
  virtual ~ITransport() = default;

  struct TransportResult {
    std::size_t bytesProcessed;  // bytes read for read operations, or written for write operations
    TransportHint want;
  };

  // Non-blocking read.
  // Returns bytesProcessed > 0 on success. bytesProcessed == 0 with want == None is an orderly end of stream.
  virtual TransportResult read(char* buf, std::size_t len) = 0;

  // Non-blocking write. May write less than data.size(): in that case want tells why.
  virtual TransportResult write(std::string_view data) = 0;
};

// Plain transport directly operating on a non-blocking fd, which it owns.
class PlainTransport : public ITransport {
 public:
  explicit PlainTransport(BaseFd fd) noexcept : _fd(std::move(fd)) {}

  TransportResult read(char* buf, std::size_t len) override;

  TransportResult write(std::string_view data) override;

  [[nodiscard]] int fd() const noexcept { return _fd.fd(); }

 private:
  BaseFd _fd;
};

}  // namespace tandem
