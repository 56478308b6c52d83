#pragma once

#include <compare>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include "ferry/deadline.hpp"
#include "ferry/stream.hpp"
#include "ferry/uri.hpp"

namespace ferry {

// Connections are pooled per origin.
struct PoolKey {
  static PoolKey From(const Uri &uri);

  auto operator<=>(const PoolKey &) const = default;

  std::string scheme;
  std::string host;
  uint16_t port{0};
};

// Receives the streams of released connections that can serve another request.
class ConnRecycler {
 public:
  virtual ~ConnRecycler() = default;

  virtual void recycle(PoolKey key, std::unique_ptr<Stream> stream) = 0;
};

// Exclusive handle on one stream for the duration of one exchange.
//
// States: open -> shut down (never reused again, an in-flight body read may still finish) -> closed.
// A connection that is released while still open goes back to its pool.
// A shut down connection is closed on release if it is 'closable', otherwise when the Conn is destroyed.
class Conn {
 public:
  Conn() noexcept = default;

  Conn(std::unique_ptr<Stream> stream, PoolKey key, std::weak_ptr<ConnRecycler> recycler, bool reused = false);

  Conn(const Conn &) = delete;
  Conn(Conn &&) noexcept = default;
  Conn &operator=(const Conn &) = delete;
  Conn &operator=(Conn &&other) noexcept;

  // A Conn that was not released is closed, never recycled.
  ~Conn() { close(); }

  // Throws HttpClientError (Timeout) if the deadline elapses, std::system_error on I/O failure.
  std::size_t read(char *buf, std::size_t len, const Deadline &deadline);

  // Throws HttpClientError (Timeout) if the deadline elapses, std::system_error on I/O failure.
  void writeAll(std::string_view data, const Deadline &deadline);

  // One way transition: the connection will not be reused.
  void shutdown(std::string_view reason) noexcept;

  [[nodiscard]] bool isShutdown() const noexcept { return _shutdown; }

  void setClosable(bool closable) noexcept { _closable = closable; }

  [[nodiscard]] bool closable() const noexcept { return _closable; }

  // Tells whether the stream was taken from the idle pool rather than freshly established.
  [[nodiscard]] bool reused() const noexcept { return _reused; }

  [[nodiscard]] bool valid() const noexcept { return _stream != nullptr; }

  [[nodiscard]] const PoolKey &key() const noexcept { return _key; }

  // Only valid while the Conn holds a stream.
  [[nodiscard]] const ConnDetail &detail() const noexcept { return _stream->detail(); }

  // Ends the exchange: the stream goes back to the pool if the connection is not shut down.
  void release();

  // Closes the stream immediately. Idempotent.
  void close() noexcept;

 private:
  std::unique_ptr<Stream> _stream;
  PoolKey _key;
  std::weak_ptr<ConnRecycler> _recycler;
  bool _shutdown{false};
  bool _closable{true};
  bool _reused{false};
};

}  // namespace ferry
