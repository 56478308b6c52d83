#include "ferry/tls-config.hpp"

#include <stdexcept>
#include <string_view>

namespace ferry {

namespace {

int VersionRank(std::string_view version) {
  if (version.empty()) {
    return 0;
  }
  if (version == TlsConfig::kTls12) {
    return 12;
  }
  if (version == TlsConfig::kTls13) {
    return 13;
  }
  throw std::invalid_argument("Unsupported TLS version, expected TLS1.2 or TLS1.3");
}

}  // namespace

void TlsConfig::validate() const {
  const int minRank = VersionRank(minVersion);
  const int maxRank = VersionRank(maxVersion);
  if (minRank != 0 && maxRank != 0 && maxRank < minRank) {
    throw std::invalid_argument("TLS max version cannot be lower than min version");
  }
  if (verifyHostname && !verifyPeer) {
    throw std::invalid_argument("TLS hostname verification requires peer verification");
  }
}

}  // namespace ferry
