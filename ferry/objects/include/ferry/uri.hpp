#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace ferry {

// Absolute URI as used by an HTTP client: scheme "://" authority path-abempty [ "?" query ].
// The fragment, if any, is dropped at parse time since it is never sent on the wire.
// Scheme and host are normalized to lower case.
class Uri {
 public:
  // Parses an absolute URI. Returns std::nullopt if it is malformed.
  static std::optional<Uri> Parse(std::string_view str);

  [[nodiscard]] std::string_view scheme() const noexcept { return _scheme; }

  // Host without IPv6 brackets.
  [[nodiscard]] std::string_view host() const noexcept { return _host; }

  // Effective port: the explicit one, or the default port of the scheme (0 if unknown).
  [[nodiscard]] uint16_t port() const noexcept { return _port; }

  [[nodiscard]] bool hasExplicitPort() const noexcept { return _explicitPort; }

  // Path as written, possibly empty.
  [[nodiscard]] std::string_view path() const noexcept { return _path; }

  [[nodiscard]] std::optional<std::string_view> query() const noexcept;

  [[nodiscard]] bool isHttps() const noexcept;

  [[nodiscard]] bool isIpv6Host() const noexcept { return _host.find(':') != std::string::npos; }

  // request-target in origin-form (RFC 9112 §3.2.1): path (at least "/") and query.
  [[nodiscard]] std::string originForm() const;

  // Host with port, port omitted when it is the default one of the scheme. Suitable for the Host header.
  [[nodiscard]] std::string authority() const;

  // Host with port always present. Suitable for the authority-form of CONNECT requests.
  [[nodiscard]] std::string hostAndPort() const;

  // request-target in absolute-form (RFC 9112 §3.2.2), used for plain HTTP requests through a proxy.
  [[nodiscard]] std::string absoluteForm() const;

  [[nodiscard]] std::string str() const { return absoluteForm(); }

  // Same scheme, host and effective port.
  [[nodiscard]] bool sameOrigin(const Uri &other) const noexcept;

  // Resolves a URI reference (as found in a Location header) against this URI (RFC 3986 §5.2).
  // Returns std::nullopt if the reference is malformed.
  [[nodiscard]] std::optional<Uri> resolve(std::string_view reference) const;

  bool operator==(const Uri &) const noexcept = default;

 private:
  std::string _scheme;
  std::string _host;
  std::string _path;
  std::string _query;
  uint16_t _port{0};
  bool _explicitPort{false};
  bool _hasQuery{false};
};

// Default port of given scheme (80 for http, 443 for https), 0 if unknown.
uint16_t DefaultPort(std::string_view scheme) noexcept;

// Removes "." and ".." segments from a path (RFC 3986 §5.2.4).
std::string RemoveDotSegments(std::string_view path);

}  // namespace ferry
