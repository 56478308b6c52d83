#pragma once

#include <memory>

#include "ferry/decoder.hpp"

namespace ferry {

// Streaming decoder of the 'zstd' content coding.
std::unique_ptr<DecoderContext> MakeZstdDecoderContext();

}  // namespace ferry
