#pragma once

#include <openssl/ssl.h>

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>

#include "ferry/tls-raii.hpp"
#include "ferry/transport.hpp"

namespace ferry {

// Client side TLS transport (OpenSSL) over a non-blocking socket.
class TlsTransport : public ITransport {
 public:
  explicit TlsTransport(SslPtr sslPtr) : _ssl(std::move(sslPtr)) {}

  TransportResult read(char* buf, std::size_t len) override;

  TransportResult write(std::string_view data) override;

  // Drives SSL_do_handshake. Returns None once the session is established.
  TransportHint handshake() override;

  [[nodiscard]] bool handshakeDone() const noexcept override { return _handshakeDone; }

  // Perform best-effort bidirectional TLS shutdown (non-blocking). Safe to call multiple times.
  void shutdown() noexcept override;

  // Human readable reason of the last handshake failure, including certificate verification errors.
  [[nodiscard]] std::string failureReason() const;

  [[nodiscard]] SSL* rawSsl() const noexcept { return _ssl.get(); }

  void logErrorIfAny() const noexcept;

 private:
  TransportHint handshake(TransportHint want);

  SslPtr _ssl;
  std::string _lastErrors;
  bool _handshakeDone{false};
};

}  // namespace ferry
