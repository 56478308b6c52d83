#include "ferry/tcp-connector.hpp"

#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>

#include <cerrno>
#include <cstring>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include "ferry/base-fd.hpp"
#include "ferry/deadline.hpp"
#include "ferry/io-wait.hpp"
#include "ferry/log.hpp"
#include "ferry/transport.hpp"

namespace ferry {

namespace {

// Waits for completion of a non-blocking connect. Returns 0 on success, or the errno of the failure.
// Returns ETIMEDOUT if the deadline expired.
int AwaitConnect(int fd, const Deadline& deadline) {
  if (!WaitReady(fd, TransportHint::WriteReady, deadline)) {
    return ETIMEDOUT;
  }
  int soError = 0;
  socklen_t len = sizeof(soError);
  if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &soError, &len) != 0) {
    return errno;
  }
  return soError;
}

void SetNoDelay(int fd) {
  static constexpr int kEnable = 1;
  if (::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &kEnable, sizeof(kEnable)) != 0) {
    log::warn("ConnectTCP: unable to set TCP_NODELAY on fd # {}: {}", fd, std::strerror(errno));
  }
}

}  // namespace

ConnectResult ConnectTCP(std::string_view host, std::string_view port, const Deadline& deadline, int family) {
  // getaddrinfo expects null-terminated strings
  const std::string hostStr(host);
  const std::string portStr(port);

  addrinfo hints{};
  hints.ai_family = family;
  hints.ai_socktype = SOCK_STREAM;

  addrinfo* res = nullptr;
  const int gai = ::getaddrinfo(hostStr.c_str(), portStr.c_str(), &hints, &res);
  std::unique_ptr<addrinfo, void (*)(addrinfo*)> resRAII(res, &::freeaddrinfo);
  ConnectResult connectResult;

  if (gai != 0) [[unlikely]] {
    log::error("ConnectTCP: getaddrinfo('{}', '{}') failed: {}", host, port, ::gai_strerror(gai));
    connectResult.err = gai == EAI_SYSTEM ? errno : EHOSTUNREACH;
    connectResult.failure = true;
    return connectResult;
  }

  for (addrinfo* rp = res; rp != nullptr; rp = rp->ai_next) {
    const int socktype = rp->ai_socktype | SOCK_NONBLOCK | SOCK_CLOEXEC;

    BaseFd fd(::socket(rp->ai_family, socktype, rp->ai_protocol));
    if (!fd) [[unlikely]] {
      connectResult.err = errno;
      log::error("ConnectTCP: socket() failed for family={}: {}", rp->ai_family, std::strerror(connectResult.err));
      if (connectResult.err == EMFILE || connectResult.err == ENFILE) {
        break;  // no point in continuing
      }
      continue;
    }

    int connectErr = 0;
    if (::connect(fd.fd(), rp->ai_addr, rp->ai_addrlen) != 0) {
      connectErr = errno;
      if (connectErr == EINPROGRESS || connectErr == EINTR) {
        connectErr = AwaitConnect(fd.fd(), deadline);
      }
    }

    if (connectErr == 0) {
      SetNoDelay(fd.fd());
      connectResult.fd = std::move(fd);
      connectResult.err = 0;
      return connectResult;
    }

    connectResult.err = connectErr;
    if (connectErr == ETIMEDOUT && deadline.expired()) {
      log::debug("ConnectTCP: connect to '{}:{}' timed out", host, port);
      connectResult.timedOut = true;
      break;
    }
    log::debug("ConnectTCP: connect to '{}:{}' (family={}) failed: {}", host, port, rp->ai_family,
               std::strerror(connectErr));
  }
  connectResult.failure = true;
  return connectResult;
}

}  // namespace ferry
