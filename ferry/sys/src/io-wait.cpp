#include "ferry/io-wait.hpp"

#include <poll.h>
#include <sys/socket.h>

#include <cerrno>

#include "ferry/deadline.hpp"
#include "ferry/errno-throw.hpp"
#include "ferry/transport.hpp"

namespace ferry {

bool WaitReady(int fd, TransportHint hint, const Deadline& deadline) {
  pollfd pfd{};
  pfd.fd = fd;
  pfd.events = static_cast<short>(hint == TransportHint::WriteReady ? POLLOUT : POLLIN);

  while (true) {
    const int ret = ::poll(&pfd, 1, deadline.pollTimeoutMs());
    if (ret > 0) {
      // POLLERR / POLLHUP are reported as ready: the following read or write will surface the actual error.
      return true;
    }
    if (ret == 0) {
      return false;
    }
    if (errno != EINTR) {
      throw_errno("poll on fd # {} failed", fd);
    }
  }
}

bool IsIdleSocketAlive(int fd) noexcept {
  char probe;
  while (true) {
    const auto ret = ::recv(fd, &probe, 1, MSG_PEEK | MSG_DONTWAIT);
    if (ret == -1 && errno == EINTR) {
      continue;
    }
    return ret == -1 && errno == EAGAIN;
  }
}

}  // namespace ferry
