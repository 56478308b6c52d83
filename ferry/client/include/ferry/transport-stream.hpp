#pragma once

#include <cstddef>
#include <memory>
#include <string_view>
#include <utility>

#include "ferry/base-fd.hpp"
#include "ferry/deadline.hpp"
#include "ferry/stream.hpp"
#include "ferry/transport.hpp"

namespace ferry {

// Stream over a non-blocking socket, through a plain or TLS transport.
// Readiness waits are done with poll(2), bounded by the deadline of each call.
class TransportStream final : public Stream {
 public:
  TransportStream(BaseFd fd, std::unique_ptr<ITransport> transport, ConnDetail detail);

  ~TransportStream() override { close(); }

  // Drives the transport handshake to completion (TLS). No-op for plain transports.
  // Throws HttpClientError (Connect) if the handshake fails, HttpClientError (Timeout) if the deadline elapses.
  void completeHandshake(const Deadline &deadline);

  std::size_t read(char *buf, std::size_t len, const Deadline &deadline) override;

  void writeAll(std::string_view data, const Deadline &deadline) override;

  [[nodiscard]] bool isIdleAlive() noexcept override;

  void close() noexcept override;

  [[nodiscard]] int fd() const noexcept { return _fd.fd(); }

  // Gives up the socket without shutting down the transport, for instance to run TLS over a proxy tunnel.
  [[nodiscard]] BaseFd detachFd() noexcept { return std::move(_fd); }

  [[nodiscard]] ITransport &transport() noexcept { return *_transport; }

 private:
  void wait(TransportHint hint, const Deadline &deadline, std::string_view operation) const;

  // declared first, destroyed last: the transport may still reference it on shutdown
  BaseFd _fd;
  std::unique_ptr<ITransport> _transport;
};

}  // namespace ferry
