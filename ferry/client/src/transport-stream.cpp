#include "ferry/transport-stream.hpp"

#include <cerrno>
#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include "ferry/deadline.hpp"
#include "ferry/errno-throw.hpp"
#include "ferry/http-client-error.hpp"
#include "ferry/io-wait.hpp"
#include "ferry/log.hpp"
#include "ferry/tls-transport.hpp"
#include "ferry/transport.hpp"

namespace ferry {

TransportStream::TransportStream(BaseFd fd, std::unique_ptr<ITransport> transport, ConnDetail detail)
    : Stream(std::move(detail)), _fd(std::move(fd)), _transport(std::move(transport)) {}

void TransportStream::wait(TransportHint hint, const Deadline &deadline, std::string_view operation) const {
  if (!WaitReady(_fd.fd(), hint, deadline)) {
    throw HttpClientError(ErrorKind::Timeout, "timed out waiting for " + std::string(operation));
  }
}

void TransportStream::completeHandshake(const Deadline &deadline) {
  while (true) {
    const auto hint = _transport->handshake();
    if (hint == TransportHint::None) {
      return;
    }
    if (hint == TransportHint::Error) {
      std::string reason = "TLS handshake failed";
      if (auto *tls = dynamic_cast<TlsTransport *>(_transport.get()); tls != nullptr) {
        reason = tls->failureReason();
      }
      log::error("TLS handshake with {}:{} failed: {}", _detail.host, _detail.port, reason);
      throw HttpClientError(ErrorKind::Connect, ErrorPhase::Connect, reason);
    }
    wait(hint, deadline, "TLS handshake");
  }
}

std::size_t TransportStream::read(char *buf, std::size_t len, const Deadline &deadline) {
  while (true) {
    const auto res = _transport->read(buf, len);
    if (res.bytesProcessed != 0) {
      return res.bytesProcessed;
    }
    switch (res.want) {
      case TransportHint::None:
        return 0;
      case TransportHint::Error:
        throw_error_code(res.err == 0 ? EIO : res.err, "read on fd # {} failed", _fd.fd());
      default:
        wait(res.want, deadline, "response bytes");
        break;
    }
  }
}

void TransportStream::writeAll(std::string_view data, const Deadline &deadline) {
  while (!data.empty()) {
    const auto res = _transport->write(data);
    data.remove_prefix(res.bytesProcessed);
    if (data.empty()) {
      break;
    }
    switch (res.want) {
      case TransportHint::Error:
        throw_error_code(res.err == 0 ? EIO : res.err, "write on fd # {} failed", _fd.fd());
      case TransportHint::None:
        if (res.bytesProcessed == 0) {
          throw_error_code(EIO, "write on fd # {} made no progress", _fd.fd());
        }
        break;
      default:
        wait(res.want, deadline, "the connection to be writable");
        break;
    }
  }
}

bool TransportStream::isIdleAlive() noexcept { return _fd && IsIdleSocketAlive(_fd.fd()); }

void TransportStream::close() noexcept {
  if (_fd) {
    _transport->shutdown();
    _fd.close();
  }
}

}  // namespace ferry
