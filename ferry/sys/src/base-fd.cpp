#include "ferry/base-fd.hpp"

#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <utility>

#include "ferry/log.hpp"

namespace ferry {

BaseFd& BaseFd::operator=(BaseFd&& other) noexcept {
  if (this != &other) {
    close();
    _fd = other.release();
  }
  return *this;
}

void BaseFd::close() noexcept {
  if (_fd != kClosedFd) {
    // On Linux the descriptor is released even when close() reports EINTR, so it must not be retried.
    if (::close(_fd) != 0 && errno != EINTR) {
      log::error("close fd # {} failed: {}", _fd, std::strerror(errno));
    }
    log::trace("fd # {} closed", _fd);
    _fd = kClosedFd;
  }
}

int BaseFd::release() noexcept { return std::exchange(_fd, kClosedFd); }

}  // namespace ferry
