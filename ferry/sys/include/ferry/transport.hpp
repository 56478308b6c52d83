#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace ferry {

// Indicates what the transport layer needs to proceed after a non-blocking I/O operation returns EAGAIN/WANT.
enum class TransportHint : uint8_t {
  None,        // No special action needed (operation completed, or orderly close for a 0 bytes read)
  ReadReady,   // Need socket readable before operation can proceed (SSL_ERROR_WANT_READ)
  WriteReady,  // Need socket writable before operation can proceed (SSL_ERROR_WANT_WRITE)
  Error
};

// Base transport abstraction; allows transparent TLS or plain socket IO.
class ITransport {
 public:
  virtual ~ITransport() = default;

  struct TransportResult {
    std::size_t bytesProcessed;  // bytes read for read operations, or written for write operations
    TransportHint want;          // indicates whether socket needs to be readable or writable for operation to proceed.
    int err{0};                  // errno value when want is Error (0 if unknown)
  };

  // Non-blocking read. bytesProcessed > 0 on success. bytesProcessed == 0 with want None means orderly close.
  virtual TransportResult read(char* buf, std::size_t len) = 0;

  // Non-blocking write. Returns the number of bytes written. If less than requested, check the want field.
  virtual TransportResult write(std::string_view data) = 0;

  // Advances a pending handshake, if the transport has one. Returns None once established.
  virtual TransportHint handshake() { return TransportHint::None; }

  // Best effort notification to the peer that no more data will be sent, before the socket is closed.
  virtual void shutdown() noexcept {}

  [[nodiscard]] virtual bool handshakeDone() const noexcept { return true; }
};

// Plain transport directly operates on a non-blocking fd.
class PlainTransport : public ITransport {
 public:
  explicit PlainTransport(int fd) : _fd(fd) {}

  TransportResult read(char* buf, std::size_t len) override;

  TransportResult write(std::string_view data) override;

 private:
  int _fd;
};

}  // namespace ferry
