#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

#include "ferry/deadline.hpp"

namespace ferry {

// Connection-level metadata of an established stream.
struct ConnDetail {
  // The stream goes to a proxy without a tunnel: request targets must be in absolute-form.
  bool isProxy{false};
  // TLS is used to the origin (possibly inside a proxy tunnel).
  bool isTls{false};
  // Origin the stream was established for.
  std::string host;
  uint16_t port{0};
};

// Connected byte stream produced by a Connector.
// Every blocking call is bounded by a Deadline.
class Stream {
 public:
  Stream(const Stream &) = delete;
  Stream &operator=(const Stream &) = delete;

  virtual ~Stream() = default;

  // Reads up to 'len' bytes into 'buf'. Returns the number of bytes read, 0 if the peer closed the stream.
  // Throws HttpClientError (Timeout) if the deadline elapses, std::system_error on I/O failure.
  virtual std::size_t read(char *buf, std::size_t len, const Deadline &deadline) = 0;

  // Writes all of 'data'.
  // Throws HttpClientError (Timeout) if the deadline elapses, std::system_error on I/O failure.
  virtual void writeAll(std::string_view data, const Deadline &deadline) = 0;

  // Checks without blocking that an idle stream has not been closed by the peer and has no pending input.
  [[nodiscard]] virtual bool isIdleAlive() noexcept = 0;

  // Releases the underlying transport. Idempotent.
  virtual void close() noexcept = 0;

  [[nodiscard]] const ConnDetail &detail() const noexcept { return _detail; }

 protected:
  explicit Stream(ConnDetail detail) noexcept : _detail(std::move(detail)) {}

  ConnDetail _detail;
};

}  // namespace ferry
