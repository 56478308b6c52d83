#pragma once

#include <cstddef>
#include <memory>

#include "ferry/conn.hpp"
#include "ferry/connector.hpp"
#include "ferry/deadline.hpp"
#include "ferry/pool-config.hpp"
#include "ferry/uri.hpp"

namespace ferry {

// Hands out connections to origins: an idle one when available, a new one from the connector otherwise.
// Thread-safe. A connection is exclusively owned by its holder between check-out and release.
class ConnPool {
 public:
  // Throws std::invalid_argument if the configuration is invalid or 'connector' is null.
  ConnPool(PoolConfig config, std::shared_ptr<Connector> connector);

  ConnPool(const ConnPool &) = delete;
  ConnPool(ConnPool &&) noexcept = default;
  ConnPool &operator=(const ConnPool &) = delete;
  ConnPool &operator=(ConnPool &&) noexcept = default;

  ~ConnPool();

  // Returns a connection to the origin of 'uri'.
  // Idle connections are tried most recent first. Those that expired or were closed by the peer are dropped.
  // Throws what the connector throws.
  Conn connectTo(const Uri &uri, const Deadline &deadline);

  // Number of idle connections, for all origins.
  [[nodiscard]] std::size_t idleCount() const;

  // Number of idle connections to the origin of 'uri'.
  [[nodiscard]] std::size_t idleCount(const Uri &uri) const;

  // Closes all idle connections.
  void clear();

  [[nodiscard]] const PoolConfig &config() const noexcept;

 private:
  class State;

  std::shared_ptr<State> _state;
  std::shared_ptr<Connector> _connector;
};

}  // namespace ferry
