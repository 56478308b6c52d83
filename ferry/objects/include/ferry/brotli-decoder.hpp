#pragma once

#include <memory>

#include "ferry/decoder.hpp"

namespace ferry {

// Streaming decoder of the 'br' content coding.
std::unique_ptr<DecoderContext> MakeBrotliDecoderContext();

}  // namespace ferry
