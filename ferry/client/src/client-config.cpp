#include "ferry/client-config.hpp"

#include <chrono>
#include <stdexcept>

#include "ferry/body-encoder.hpp"

namespace ferry {

void ClientConfig::validate() const {
  if (connectTimeout < std::chrono::milliseconds{0} || requestTimeout < std::chrono::milliseconds{0}) {
    throw std::invalid_argument("timeouts must be >= 0");
  }
  if (!redirect) {
    throw std::invalid_argument("redirect policy must not be null");
  }
  if (maxHeaderBytes < 64) {
    throw std::invalid_argument("maxHeaderBytes must be >= 64");
  }
  if (transferBufferSize < 2 * BodyEncoder::kMinEncodeSpace) {
    throw std::invalid_argument("transferBufferSize must be >= 64");
  }
  pool.validate();
  connector.validate();
  decompression.validate();
}

}  // namespace ferry
