#pragma once

#include <optional>
#include <utility>

#include "ferry/proxy-config.hpp"
#include "ferry/tls-config.hpp"

namespace ferry {

// Configuration of the default connector.
struct ConnectorConfig {
  // Throws std::invalid_argument if the TLS or proxy configuration is invalid.
  void validate() const;

  ConnectorConfig& withTls(TlsConfig value) {
    tls = std::move(value);
    return *this;
  }

  ConnectorConfig& withProxy(ProxyConfig value) {
    proxy = std::move(value);
    return *this;
  }

  bool operator==(const ConnectorConfig&) const noexcept = default;

  TlsConfig tls;
  std::optional<ProxyConfig> proxy;
};

}  // namespace ferry
