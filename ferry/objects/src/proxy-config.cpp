#include "ferry/proxy-config.hpp"

#include <stdexcept>
#include <string_view>

#include "ferry/string-equal-ignore-case.hpp"

namespace ferry {

void ProxyConfig::validate() const {
  if (host.empty()) {
    throw std::invalid_argument("proxy host must not be empty");
  }
  if (port == 0) {
    throw std::invalid_argument("proxy port must be > 0");
  }
}

bool ProxyConfig::bypass(std::string_view targetHost) const noexcept {
  for (std::string_view entry : noProxy) {
    if (entry == "*") {
      return true;
    }
    if (!entry.empty() && entry.front() == '.') {
      entry.remove_prefix(1);
    }
    if (entry.empty() || entry.size() > targetHost.size()) {
      continue;
    }
    const auto suffix = targetHost.substr(targetHost.size() - entry.size());
    if (!CaseInsensitiveEqual(suffix, entry)) {
      continue;
    }
    if (suffix.size() == targetHost.size() || targetHost[targetHost.size() - entry.size() - 1] == '.') {
      return true;
    }
  }
  return false;
}

}  // namespace ferry
