#include "ferry/conn-pool.hpp"

#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <utility>
#include <vector>

#include "ferry/conn.hpp"
#include "ferry/deadline.hpp"
#include "ferry/log.hpp"
#include "ferry/pool-config.hpp"
#include "ferry/stream.hpp"
#include "ferry/timedef.hpp"
#include "ferry/uri.hpp"

namespace ferry {

class ConnPool::State final : public ConnRecycler {
 public:
  explicit State(PoolConfig config) : _config(config) {}

  void recycle(PoolKey key, std::unique_ptr<Stream> stream) override {
    if (_config.maxIdlePerHost == 0) {
      stream->close();
      return;
    }
    std::unique_ptr<Stream> evicted;
    {
      std::scoped_lock lock(_mutex);
      auto &idle = _idle[key];
      if (idle.size() >= _config.maxIdlePerHost) {
        evicted = std::move(idle.front().stream);
        idle.erase(idle.begin());
      }
      idle.push_back(IdleEntry{std::move(stream), SteadyClock::now()});
    }
    if (evicted) {
      log::debug("Idle pool of {}:{} full, closing its oldest connection", key.host, key.port);
      evicted->close();
    }
    log::trace("Connection to {}:{} returned to the pool", key.host, key.port);
  }

  // Pops the most recently used usable idle stream for 'key', or nullptr.
  std::unique_ptr<Stream> take(const PoolKey &key) {
    std::vector<std::unique_ptr<Stream>> stale;
    std::unique_ptr<Stream> ret;
    {
      std::scoped_lock lock(_mutex);
      auto it = _idle.find(key);
      if (it == _idle.end()) {
        return nullptr;
      }
      auto &idle = it->second;
      const auto now = SteadyClock::now();
      while (!idle.empty()) {
        IdleEntry entry = std::move(idle.back());
        idle.pop_back();
        const bool expired =
            _config.idleTimeout != std::chrono::milliseconds{0} && now - entry.since >= _config.idleTimeout;
        if (expired || !entry.stream->isIdleAlive()) {
          stale.push_back(std::move(entry.stream));
          continue;
        }
        ret = std::move(entry.stream);
        break;
      }
      if (idle.empty()) {
        _idle.erase(it);
      }
    }
    for (auto &stream : stale) {
      log::debug("Dropping stale idle connection to {}:{}", key.host, key.port);
      stream->close();
    }
    return ret;
  }

  std::size_t idleCount() const {
    std::scoped_lock lock(_mutex);
    std::size_t count = 0;
    for (const auto &[key, idle] : _idle) {
      count += idle.size();
    }
    return count;
  }

  std::size_t idleCount(const PoolKey &key) const {
    std::scoped_lock lock(_mutex);
    const auto it = _idle.find(key);
    return it == _idle.end() ? 0 : it->second.size();
  }

  void clear() {
    std::map<PoolKey, std::vector<IdleEntry>> idle;
    {
      std::scoped_lock lock(_mutex);
      idle.swap(_idle);
    }
    for (auto &[key, entries] : idle) {
      for (auto &entry : entries) {
        entry.stream->close();
      }
    }
  }

  [[nodiscard]] const PoolConfig &config() const noexcept { return _config; }

 private:
  struct IdleEntry {
    std::unique_ptr<Stream> stream;
    SteadyTimePoint since;
  };

  PoolConfig _config;
  mutable std::mutex _mutex;
  std::map<PoolKey, std::vector<IdleEntry>> _idle;
};

ConnPool::ConnPool(PoolConfig config, std::shared_ptr<Connector> connector)
    : _state(std::make_shared<State>(config)), _connector(std::move(connector)) {
  config.validate();
  if (!_connector) {
    throw std::invalid_argument("ConnPool requires a connector");
  }
}

ConnPool::~ConnPool() {
  if (_state) {
    _state->clear();
  }
}

Conn ConnPool::connectTo(const Uri &uri, const Deadline &deadline) {
  auto key = PoolKey::From(uri);
  if (auto stream = _state->take(key)) {
    log::debug("Reusing idle connection to {}:{}", key.host, key.port);
    return {std::move(stream), std::move(key), _state, true};
  }
  auto stream = _connector->connect(uri, deadline);
  log::debug("New connection to {}:{}", key.host, key.port);
  return {std::move(stream), std::move(key), _state};
}

std::size_t ConnPool::idleCount() const { return _state->idleCount(); }

std::size_t ConnPool::idleCount(const Uri &uri) const { return _state->idleCount(PoolKey::From(uri)); }

void ConnPool::clear() { _state->clear(); }

const PoolConfig &ConnPool::config() const noexcept { return _state->config(); }

}  // namespace ferry
