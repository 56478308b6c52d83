#pragma once

#include <cstddef>
#include <optional>
#include <string_view>

#include "ferry/raw-chars.hpp"
#include "ferry/response-head.hpp"

namespace ferry {

// Incremental parser of a response head (status line and header fields).
// Bytes are fed as they arrive from the connection. Bytes received after the end of the head
// belong to the body and are kept as 'leftover'.
class ResponseDecoder {
 public:
  static constexpr std::size_t kDefaultMaxHeadBytes = 64UL * 1024UL;

  explicit ResponseDecoder(std::size_t maxHeadBytes = kDefaultMaxHeadBytes) : _maxHeadBytes(maxHeadBytes) {}

  // Appends 'chunk' to the pending bytes and tries to parse a complete head.
  // Returns std::nullopt if more bytes are needed.
  // Throws HttpClientError (Protocol) if the head is malformed or larger than the maximum head size.
  std::optional<ResponseHead> decode(std::string_view chunk);

  // To be called when the peer closed the connection. Always throws HttpClientError (Protocol),
  // as a connection closed before the end of the head cannot be the end of a response.
  [[noreturn]] void eof() const;

  // Bytes following the last decoded head.
  [[nodiscard]] std::string_view leftover() const noexcept;

  // Moves out the bytes following the last decoded head.
  [[nodiscard]] RawChars takeLeftover();

  // Prepares the decoder for the next head of the same connection (after an interim 1xx response),
  // starting from the leftover bytes. Call decode with an empty chunk to parse them.
  void restart();

 private:
  RawChars _buf;
  std::size_t _maxHeadBytes;
  std::size_t _scanPos{0};
  std::size_t _headEnd{0};
  bool _headComplete{false};
};

}  // namespace ferry
