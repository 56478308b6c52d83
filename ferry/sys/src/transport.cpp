#include "ferry/transport.hpp"

#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstddef>
#include <string_view>

namespace ferry {

static_assert(EAGAIN == EWOULDBLOCK, "Add handling for EWOULDBLOCK if different from EAGAIN");

ITransport::TransportResult PlainTransport::read(char* buf, std::size_t len) {
  while (true) {
    const auto nbRead = ::read(_fd, buf, len);
    if (nbRead >= 0) [[likely]] {
      return {static_cast<std::size_t>(nbRead), TransportHint::None};
    }
    if (errno == EINTR) {
      continue;
    }
    if (errno == EAGAIN) {
      return {0, TransportHint::ReadReady};
    }
    return {0, TransportHint::Error, errno};
  }
}

ITransport::TransportResult PlainTransport::write(std::string_view data) {
  TransportResult ret{0, TransportHint::None};

  while (ret.bytesProcessed < data.size()) {
    // MSG_NOSIGNAL: a peer that went away must surface as EPIPE, not kill the process with SIGPIPE.
    const auto nbWritten =
        ::send(_fd, data.data() + ret.bytesProcessed, data.size() - ret.bytesProcessed, MSG_NOSIGNAL);
    if (nbWritten == -1) [[unlikely]] {
      if (errno == EINTR) {
        continue;
      }
      if (errno == EAGAIN) {
        // Kernel send buffer full - caller should wait for writable event
        ret.want = TransportHint::WriteReady;
      } else {
        // Fatal error (ECONNRESET, EPIPE, etc.)
        ret.want = TransportHint::Error;
        ret.err = errno;
      }
      break;
    }

    ret.bytesProcessed += static_cast<std::size_t>(nbWritten);
  }

  return ret;
}

}  // namespace ferry
