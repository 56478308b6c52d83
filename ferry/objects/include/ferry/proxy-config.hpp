#pragma once

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

namespace ferry {

// HTTP proxy used by the default connector.
// Plain HTTP targets are sent to the proxy with absolute-form request targets,
// HTTPS targets are tunnelled with CONNECT.
struct ProxyConfig {
  // Throws std::invalid_argument if the host is empty or the port is 0.
  void validate() const;

  ProxyConfig& withHost(std::string_view value) {
    host = value;
    return *this;
  }

  ProxyConfig& withPort(uint16_t value) {
    port = value;
    return *this;
  }

  ProxyConfig& withNoProxy(std::initializer_list<std::string_view> hosts) {
    noProxy.assign(hosts.begin(), hosts.end());
    return *this;
  }

  // Tells whether requests to 'targetHost' bypass the proxy.
  // A noProxy entry matches the host itself and its sub domains ("example.com" and ".example.com" both match
  // "api.example.com"), "*" matches every host. Comparison is case-insensitive.
  [[nodiscard]] bool bypass(std::string_view targetHost) const noexcept;

  bool operator==(const ProxyConfig&) const noexcept = default;

  std::string host;
  uint16_t port{0};
  std::vector<std::string> noProxy;
};

}  // namespace ferry
