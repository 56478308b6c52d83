#pragma once

#include <string>
#include <string_view>

#include "ferry/tls-config.hpp"
#include "ferry/tls-raii.hpp"

namespace ferry {

// OpenSSL client context built from a TlsConfig, shared by all TLS connections of a connector.
class TlsClientContext {
 public:
  // Throws std::invalid_argument if the configuration is invalid, std::runtime_error if OpenSSL rejects it.
  explicit TlsClientContext(const TlsConfig& config);

  // Creates the client side SSL object of a new connection on 'fd' to 'host'.
  // SNI is sent for host names (not IP literals) and the peer certificate is checked against 'host'
  // when hostname verification is enabled.
  [[nodiscard]] SslPtr newSsl(int fd, std::string_view host) const;

  [[nodiscard]] SSL_CTX* raw() const noexcept { return _ctx.get(); }

 private:
  SslCtxPtr _ctx;
  bool _verifyPeer;
  bool _verifyHostname;
  bool _sni;
};

// Drains the OpenSSL error queue into a single message (empty if no error is queued).
std::string DrainOpenSslErrors();

}  // namespace ferry
