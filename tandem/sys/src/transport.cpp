#include "tandem/transport.hpp"

#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstddef>
#include <cstring>
#include <string_view>

#include "tandem/log.hpp"

namespace tandem {

static_assert(EAGAIN == EWOULDBLOCK, "Add handling for EWOULDBLOCK if different from EAGAIN");

ITransport::TransportResult PlainTransport::read(char* buf, std::size_t len) {
  while (true) {
    const auto nbRead = ::read(_fd.fd(), buf, len);
    if (nbRead >= 0) [[likely]] {
      return {static_cast<std::size_t>(nbRead), TransportHint::None};
    }
    if (errno == EINTR) {
      continue;
    }
    if (errno == EAGAIN) {
      return {0, TransportHint::ReadReady};
    }
    const auto err = errno;
    log::debug("read on fd # {} failed: {}", _fd.fd(), std::strerror(err));
    return {0, TransportHint::Error};
  }
}

ITransport::TransportResult PlainTransport::write(std::string_view data) {
  TransportResult ret{0, TransportHint::None};

  while (ret.bytesProcessed < data.size()) {
    // MSG_NOSIGNAL so that a peer reset surfaces as EPIPE instead of SIGPIPE. Fall back to write for non sockets.
    auto nbWritten =
        ::send(_fd.fd(), data.data() + ret.bytesProcessed, data.size() - ret.bytesProcessed, MSG_NOSIGNAL);
    if (nbWritten == -1 && errno == ENOTSOCK) {
      nbWritten = ::write(_fd.fd(), data.data() + ret.bytesProcessed, data.size() - ret.bytesProcessed);
    }
    if (nbWritten == -1) [[unlikely]] {
      if (errno == EINTR) {
        continue;
      }
      if (errno == EAGAIN) {
        // Kernel send buffer full, caller should wait for writable event
        ret.want = TransportHint::WriteReady;
      } else {
        const auto err = errno;
        log::debug("write on fd # {} failed: {}", _fd.fd(), std::strerror(err));
        ret.want = TransportHint::Error;
      }
      break;
    }

    ret.bytesProcessed += static_cast<std::size_t>(nbWritten);
  }

  return ret;
}

}  // namespace tandem
