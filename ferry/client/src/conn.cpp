#include "ferry/conn.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include "ferry/deadline.hpp"
#include "ferry/log.hpp"
#include "ferry/stream.hpp"
#include "ferry/uri.hpp"

namespace ferry {

PoolKey PoolKey::From(const Uri &uri) { return {std::string(uri.scheme()), std::string(uri.host()), uri.port()}; }

Conn::Conn(std::unique_ptr<Stream> stream, PoolKey key, std::weak_ptr<ConnRecycler> recycler, bool reused)
    : _stream(std::move(stream)), _key(std::move(key)), _recycler(std::move(recycler)), _reused(reused) {}

Conn &Conn::operator=(Conn &&other) noexcept {
  if (this != &other) {
    close();
    _stream = std::move(other._stream);
    _key = std::move(other._key);
    _recycler = std::move(other._recycler);
    _shutdown = other._shutdown;
    _closable = other._closable;
    _reused = other._reused;
  }
  return *this;
}

std::size_t Conn::read(char *buf, std::size_t len, const Deadline &deadline) {
  return _stream->read(buf, len, deadline);
}

void Conn::writeAll(std::string_view data, const Deadline &deadline) { _stream->writeAll(data, deadline); }

void Conn::shutdown(std::string_view reason) noexcept {
  if (!_shutdown && _stream) {
    log::debug("Connection to {}:{} shut down: {}", _key.host, _key.port, reason);
  }
  _shutdown = true;
}

void Conn::release() {
  if (!_stream) {
    return;
  }
  if (!_shutdown) {
    if (auto recycler = _recycler.lock()) {
      recycler->recycle(_key, std::move(_stream));
      return;
    }
    log::debug("Pool of {}:{} is gone, closing released connection", _key.host, _key.port);
    close();
    return;
  }
  if (_closable) {
    close();
  }
}

void Conn::close() noexcept {
  if (_stream) {
    _stream->close();
    _stream.reset();
  }
}

}  // namespace ferry
