#pragma once

#include <cstdint>
#include <memory>
#include <string_view>

#include "ferry/connector-config.hpp"
#include "ferry/connector.hpp"
#include "ferry/deadline.hpp"
#include "ferry/stream.hpp"
#include "ferry/tls-client-context.hpp"
#include "ferry/transport-stream.hpp"
#include "ferry/uri.hpp"

namespace ferry {

// Default connector: TCP, TLS for 'https' targets, and an optional HTTP proxy.
// Through a proxy, plain HTTP streams are flagged as proxy streams (absolute-form targets)
// while HTTPS streams are tunnelled with CONNECT before the TLS handshake.
class HttpConnector final : public Connector {
 public:
  // Throws std::invalid_argument if the configuration is invalid.
  explicit HttpConnector(ConnectorConfig config = {});

  std::unique_ptr<Stream> connect(const Uri &uri, const Deadline &deadline) override;

  [[nodiscard]] const ConnectorConfig &config() const noexcept { return _config; }

 private:
  std::unique_ptr<TransportStream> connectTcp(std::string_view host, uint16_t port, ConnDetail detail,
                                              const Deadline &deadline) const;

  void openTunnel(TransportStream &stream, const Uri &uri, const Deadline &deadline) const;

  ConnectorConfig _config;
  std::unique_ptr<TlsClientContext> _tlsContext;
};

}  // namespace ferry
