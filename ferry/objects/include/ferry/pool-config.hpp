#pragma once

#include <chrono>
#include <cstdint>

namespace ferry {

// Idle connection pool configuration.
struct PoolConfig {
  // Throws std::invalid_argument if the idle timeout is negative.
  void validate() const;

  PoolConfig& withMaxIdlePerHost(uint32_t value) {
    maxIdlePerHost = value;
    return *this;
  }

  PoolConfig& withIdleTimeout(std::chrono::milliseconds value) {
    idleTimeout = value;
    return *this;
  }

  bool operator==(const PoolConfig&) const noexcept = default;

  // Maximum number of idle connections kept per (scheme, host, port). 0 disables connection reuse.
  uint32_t maxIdlePerHost{8};

  // Idle connections older than this are dropped instead of being reused. 0 means no expiry.
  std::chrono::milliseconds idleTimeout{std::chrono::seconds{90}};
};

}  // namespace ferry
