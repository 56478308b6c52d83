#include "ferry/tls-transport.hpp"

#include <openssl/err.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>

#include <cerrno>
#include <cstddef>
#include <string>
#include <string_view>

#include "ferry/log.hpp"
#include "ferry/tls-client-context.hpp"
#include "ferry/transport.hpp"

namespace ferry {

static_assert(EAGAIN == EWOULDBLOCK, "Add handling for EWOULDBLOCK if different from EAGAIN");

namespace {
inline bool isRetry(int code) { return code == SSL_ERROR_WANT_READ || code == SSL_ERROR_WANT_WRITE; }
}  // namespace

ITransport::TransportResult TlsTransport::read(char* buf, std::size_t len) {
  TransportResult ret{0, handshake(TransportHint::ReadReady)};
  if (ret.want != TransportHint::None) {
    return ret;
  }

  if (::SSL_read_ex(_ssl.get(), buf, len, &ret.bytesProcessed) == 1) [[likely]] {
    return ret;
  }

  ret.bytesProcessed = 0;

  const auto err = ::SSL_get_error(_ssl.get(), 0);
  if (err == SSL_ERROR_ZERO_RETURN) {
    // close_notify from the server
    return ret;
  }
  if (isRetry(err)) {
    ret.want = (err == SSL_ERROR_WANT_WRITE) ? TransportHint::WriteReady : TransportHint::ReadReady;
    return ret;
  }
  if (err == SSL_ERROR_SYSCALL) {
    const auto savedErrno = errno;
    if (savedErrno == EAGAIN) {
      ret.want = TransportHint::ReadReady;
      return ret;
    }
    if (savedErrno == 0 && ::ERR_peek_error() == 0) {
      // unexpected EOF without close_notify: many servers do this, report it as an orderly close
      return ret;
    }
    ret.err = savedErrno;
  }
  logErrorIfAny();
  ret.want = TransportHint::Error;
  return ret;
}

ITransport::TransportResult TlsTransport::write(std::string_view data) {
  TransportResult ret{0, handshake(TransportHint::WriteReady)};
  if (ret.want != TransportHint::None) {
    return ret;
  }

  // Some OpenSSL builds report 'bad length' for zero-length writes.
  if (data.empty() || ::SSL_write_ex(_ssl.get(), data.data(), data.size(), &ret.bytesProcessed) == 1) {
    return ret;
  }

  ret.bytesProcessed = 0;

  const auto err = ::SSL_get_error(_ssl.get(), 0);
  if (isRetry(err)) {
    ret.want = (err == SSL_ERROR_WANT_WRITE) ? TransportHint::WriteReady : TransportHint::ReadReady;
    return ret;
  }

  if (err == SSL_ERROR_SYSCALL) {
    const auto savedErrno = errno;
    if (savedErrno == EAGAIN || (savedErrno == 0 && ::ERR_peek_error() == 0)) {
      ret.want = TransportHint::WriteReady;
      return ret;
    }
    ret.err = savedErrno;
  }

  logErrorIfAny();

  ret.want = TransportHint::Error;
  return ret;
}

void TlsTransport::shutdown() noexcept {
  auto* ssl = _ssl.get();
  if (ssl == nullptr || !_handshakeDone) {
    return;
  }
  // At most two immediate calls, the socket is closed right after.
  auto rc = ::SSL_shutdown(ssl);
  if (rc == 0) {
    rc = ::SSL_shutdown(ssl);
  }
  if (rc < 0) {
    ::ERR_clear_error();
  }
}

void TlsTransport::logErrorIfAny() const noexcept {
  for (auto errVal = ::ERR_get_error(); errVal != 0; errVal = ::ERR_get_error()) {
    char errBuf[256];
    ::ERR_error_string_n(errVal, errBuf, sizeof(errBuf));
    log::error("TLS transport OpenSSL error: {} (handshake done={})", std::string_view(errBuf), _handshakeDone);
  }
}

std::string TlsTransport::failureReason() const {
  std::string reason;
  const long verifyResult = ::SSL_get_verify_result(_ssl.get());
  if (verifyResult != X509_V_OK) {
    reason.append("certificate verify failed: ");
    reason.append(::X509_verify_cert_error_string(verifyResult));
  }
  if (!_lastErrors.empty()) {
    if (!reason.empty()) {
      reason.append(" (");
      reason.append(_lastErrors);
      reason.push_back(')');
    } else {
      reason = _lastErrors;
    }
  }
  if (reason.empty()) {
    reason = "TLS handshake failed";
  }
  return reason;
}

TransportHint TlsTransport::handshake() { return handshake(TransportHint::ReadReady); }

TransportHint TlsTransport::handshake(TransportHint want) {
  if (!_handshakeDone) {
    const int handshakeRet = ::SSL_do_handshake(_ssl.get());
    if (handshakeRet == 1) {
      _handshakeDone = true;
      log::debug("TLS handshake complete, protocol {} cipher {}", ::SSL_get_version(_ssl.get()),
                 ::SSL_get_cipher_name(_ssl.get()));
    } else {
      const int err = ::SSL_get_error(_ssl.get(), handshakeRet);
      if (isRetry(err)) {
        return (err == SSL_ERROR_WANT_WRITE) ? TransportHint::WriteReady : TransportHint::ReadReady;
      }
      if (err == SSL_ERROR_SYSCALL && errno == EAGAIN) {
        return want;
      }
      _lastErrors = DrainOpenSslErrors();
      if (_lastErrors.empty() && err == SSL_ERROR_SYSCALL) {
        _lastErrors = "connection closed by peer during TLS handshake";
      }
      return TransportHint::Error;
    }
  }
  return TransportHint::None;
}

}  // namespace ferry
