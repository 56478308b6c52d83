#pragma once

#include <string>
#include <string_view>

namespace ferry {

// Client side TLS configuration.
struct TlsConfig {
  static constexpr std::string_view kTls12 = "TLS1.2";
  static constexpr std::string_view kTls13 = "TLS1.3";

  // Throws std::invalid_argument if the configuration is inconsistent.
  void validate() const;

  TlsConfig& withVerifyPeer(bool enable = true) {
    verifyPeer = enable;
    return *this;
  }

  TlsConfig& withVerifyHostname(bool enable = true) {
    verifyHostname = enable;
    return *this;
  }

  TlsConfig& withDefaultVerifyPaths(bool enable = true) {
    useDefaultVerifyPaths = enable;
    return *this;
  }

  TlsConfig& withSni(bool enable = true) {
    sni = enable;
    return *this;
  }

  TlsConfig& withCaFile(std::string_view path) {
    caFile = path;
    return *this;
  }

  TlsConfig& withCaPath(std::string_view path) {
    caPath = path;
    return *this;
  }

  TlsConfig& withCaPem(std::string_view pem) {
    caPem = pem;
    return *this;
  }

  TlsConfig& withCipherList(std::string_view ciphers) {
    cipherList = ciphers;
    return *this;
  }

  TlsConfig& withTlsMinVersion(std::string_view version) {
    minVersion = version;
    return *this;
  }

  TlsConfig& withTlsMaxVersion(std::string_view version) {
    maxVersion = version;
    return *this;
  }

  bool operator==(const TlsConfig&) const noexcept = default;

  // Verify the server certificate chain.
  bool verifyPeer{true};
  // Check that the server certificate matches the requested host name (or IP address).
  bool verifyHostname{true};
  // Load the system default trust store in addition to the CA sources below.
  bool useDefaultVerifyPaths{true};
  // Send the Server Name Indication extension (never sent for IP literals).
  bool sni{true};

  // Additional trusted CA certificates: PEM file, hashed directory, or in-memory PEM.
  std::string caFile;
  std::string caPath;
  std::string caPem;

  // Optional OpenSSL cipher list string for TLS <= 1.2 (empty -> default)
  std::string cipherList;

  // "TLS1.2" or "TLS1.3", empty for the library default.
  std::string minVersion;
  std::string maxVersion;
};

}  // namespace ferry
