#pragma once

#include <cstddef>

namespace ferry {

// Response body decompression configuration.
struct DecompressionConfig {
  // Throws std::invalid_argument if the configuration is invalid.
  void validate() const;

  DecompressionConfig& withEnable(bool value = true) {
    enable = value;
    return *this;
  }

  DecompressionConfig& withMaxDecompressedBytes(std::size_t value) {
    maxDecompressedBytes = value;
    return *this;
  }

  bool operator==(const DecompressionConfig&) const noexcept = default;

  // Master enable flag. When true the client advertises the compiled-in codings in Accept-Encoding
  // (unless the request already sets it) and transparently decodes response bodies using them.
  // When false, bodies are delivered verbatim with their Content-Encoding.
  bool enable{false};

  // Absolute cap on the decompressed size (in bytes) of one response body. 0 => unlimited.
  // Default: 4 GiB.
  std::size_t maxDecompressedBytes{1UL << 32};

  // Minimal chunk size of buffer growths during decompression.
  std::size_t decoderChunkSize{32UL * 1024UL};
};

}  // namespace ferry
