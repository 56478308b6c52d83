#pragma once

#include <cstddef>
#include <memory>
#include <string_view>

#include "ferry/raw-chars.hpp"

namespace ferry {

// Streaming decoder of one content coding, fed with successive chunks of one response body.
// Implementations are not thread-safe.
class DecoderContext {
 public:
  virtual ~DecoderContext() = default;

  // Feed a compressed chunk into the context.
  // When finalChunk is true, the caller does not provide any additional input.
  // Implementations append plain bytes to 'out'.
  // Returns true on success, false on failure (e.g. decompression error or exceeding maxDecompressedBytes).
  virtual bool decompressChunk(std::string_view chunk, bool finalChunk, std::size_t maxDecompressedBytes,
                               std::size_t decoderChunkSize, RawChars &out) = 0;

  // Tells whether the end of the compressed stream has been seen.
  [[nodiscard]] virtual bool finished() const noexcept = 0;
};

// Creates a streaming decoder for the content coding token 'encoding' ("gzip", "x-gzip", "deflate", "br", "zstd").
// Returns nullptr if the coding is unknown or not compiled in.
std::unique_ptr<DecoderContext> MakeDecoderContext(std::string_view encoding);

// Value of the Accept-Encoding header advertising all compiled-in codings (empty if none).
std::string_view SupportedAcceptEncoding() noexcept;

}  // namespace ferry
