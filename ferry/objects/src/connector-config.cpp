#include "ferry/connector-config.hpp"

namespace ferry {

void ConnectorConfig::validate() const {
  tls.validate();
  if (proxy) {
    proxy->validate();
  }
}

}  // namespace ferry
