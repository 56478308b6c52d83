#include "ferry/pool-config.hpp"

#include <chrono>
#include <stdexcept>

namespace ferry {

void PoolConfig::validate() const {
  if (idleTimeout < std::chrono::milliseconds{0}) {
    throw std::invalid_argument("idleTimeout must be >= 0");
  }
}

}  // namespace ferry
