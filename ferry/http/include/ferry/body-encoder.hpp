#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>

#include "ferry/request-body.hpp"

namespace ferry {

// Frames a request body into a caller supplied buffer.
// Each call writes the next framed bytes into 'out' and returns their count.
// 0 is returned only once the whole body, including its framing, has been written.
// 'out' should have room for at least kMinEncodeSpace bytes.
class BodyEncoder {
 public:
  static constexpr std::size_t kMinEncodeSpace = 32;

  virtual ~BodyEncoder() = default;

  virtual std::size_t encode(RequestBody &body, std::span<char> out) = 0;

  [[nodiscard]] bool done() const noexcept { return _done; }

 protected:
  bool _done{false};
};

// Identity framing: the body bytes are written as is.
// When the length has been declared with Content-Length, a body producing another number of bytes is an error.
class FixedBodyEncoder final : public BodyEncoder {
 public:
  explicit FixedBodyEncoder(std::optional<uint64_t> declaredLength = std::nullopt) noexcept
      : _declaredLength(declaredLength) {}

  // Throws HttpClientError (BodyTransfer) if the body size does not match the declared length.
  std::size_t encode(RequestBody &body, std::span<char> out) override;

  [[nodiscard]] uint64_t written() const noexcept { return _written; }

 private:
  std::optional<uint64_t> _declaredLength;
  uint64_t _written{0};
};

// Chunked transfer coding: each read of the body becomes one chunk, the body ends with the last (zero) chunk.
class ChunkedBodyEncoder final : public BodyEncoder {
 public:
  std::size_t encode(RequestBody &body, std::span<char> out) override;
};

}  // namespace ferry
