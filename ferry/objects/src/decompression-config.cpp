#include "ferry/decompression-config.hpp"

#include <stdexcept>

namespace ferry {

void DecompressionConfig::validate() const {
  if (!enable) {
    return;
  }
  if (decoderChunkSize == 0) {
    throw std::invalid_argument("decoderChunkSize must be > 0");
  }
  if (maxDecompressedBytes != 0 && maxDecompressedBytes < decoderChunkSize) {
    throw std::invalid_argument("maxDecompressedBytes must be >= decoderChunkSize");
  }
}

}  // namespace ferry
