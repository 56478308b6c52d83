#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "ferry/connector.hpp"
#include "ferry/deadline.hpp"
#include "ferry/stream.hpp"
#include "ferry/uri.hpp"

namespace ferry::test {

// In-memory Stream replaying scripted inbound chunks and capturing outbound bytes.
class MemoryStream final : public Stream {
 public:
  // What a read returns once all inbound chunks have been consumed.
  enum class AtEnd : uint8_t {
    Eof,    // 0 bytes (peer closed)
    Stall,  // nothing ever arrives: waits for the deadline and reports a timeout
    Error   // ECONNRESET
  };

  // Observable state, shared with the test after the stream has been handed to a connector.
  struct Probe {
    std::string outbound;
    std::size_t nbReads{0};
    bool closed{false};
  };

  explicit MemoryStream(std::vector<std::string> inbound, AtEnd atEnd = AtEnd::Eof, ConnDetail detail = {});

  std::size_t read(char *buf, std::size_t len, const Deadline &deadline) override;

  void writeAll(std::string_view data, const Deadline &deadline) override;

  [[nodiscard]] bool isIdleAlive() noexcept override { return !_probe->closed && _alive; }

  void close() noexcept override { _probe->closed = true; }

  // Writes fail with EPIPE once 'nbBytes' have been accepted.
  void failWritesAfter(std::size_t nbBytes) { _failWritesAfter = nbBytes; }

  // Marks the stream as closed by the peer while idle in a pool.
  void setIdleAlive(bool alive) noexcept { _alive = alive; }

  [[nodiscard]] std::shared_ptr<Probe> probe() const noexcept { return _probe; }

 private:
  std::deque<std::string> _inbound;
  std::shared_ptr<Probe> _probe;
  std::optional<std::size_t> _failWritesAfter;
  AtEnd _atEnd;
  bool _alive{true};
};

// Connector handing out scripted streams, or scripted failures, in order.
// Throws HttpClientError (Connect) when the script is exhausted.
class MemoryConnector final : public Connector {
 public:
  void push(std::unique_ptr<MemoryStream> stream);

  // The next connect attempt throws 'error'.
  void pushError(std::exception_ptr error);

  // Each connect waits this long before returning, ignoring the deadline.
  void setConnectDelay(std::chrono::milliseconds delay) noexcept { _connectDelay = delay; }

  std::unique_ptr<Stream> connect(const Uri &uri, const Deadline &deadline) override;

  [[nodiscard]] std::size_t nbConnects() const;

  // Origins of the connect calls, as "host:port".
  [[nodiscard]] std::vector<std::string> targets() const;

 private:
  mutable std::mutex _mutex;
  std::deque<std::variant<std::unique_ptr<MemoryStream>, std::exception_ptr>> _script;
  std::vector<std::string> _targets;
  std::chrono::milliseconds _connectDelay{0};
};

}  // namespace ferry::test
