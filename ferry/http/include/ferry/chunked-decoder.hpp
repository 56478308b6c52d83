#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "ferry/headers.hpp"
#include "ferry/raw-chars.hpp"

namespace ferry {

// Incremental decoder of the chunked transfer coding (RFC 9112 §7.1).
// Chunk extensions are ignored, trailer fields are collected.
class ChunkedDecoder {
 public:
  static constexpr std::size_t kMaxLineBytes = 8UL * 1024UL;
  static constexpr std::size_t kMaxTrailerBytes = 64UL * 1024UL;

  // Decodes bytes from 'in', appending chunk data to 'out'.
  // Returns the number of bytes of 'in' consumed, which is less than 'in.size()' only once done.
  // Throws HttpClientError (Protocol) on a malformed chunk grammar.
  std::size_t decode(std::string_view in, RawChars &out);

  // Tells whether the last chunk and the trailer section have been fully decoded.
  [[nodiscard]] bool done() const noexcept { return _state == State::Done; }

  [[nodiscard]] const http::Headers &trailers() const noexcept { return _trailers; }

 private:
  enum class State : uint8_t { SizeLine, Data, DataCR, DataLF, TrailerLine, Done };

  // Accumulates 'in' into the current line until LF. Returns the number of consumed bytes.
  std::size_t accumulateLine(std::string_view in, bool &complete);

  void parseSizeLine();
  void parseTrailerLine();

  http::Headers _trailers;
  std::string _line;
  uint64_t _remaining{0};
  std::size_t _trailerBytes{0};
  State _state{State::SizeLine};
};

}  // namespace ferry
