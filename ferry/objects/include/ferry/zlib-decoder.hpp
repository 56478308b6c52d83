#pragma once

#include <memory>

#include "ferry/decoder.hpp"

namespace ferry {

// Streaming inflate of 'gzip' (isGzip) or 'deflate' (zlib wrapped) content codings.
std::unique_ptr<DecoderContext> MakeZlibDecoderContext(bool isGzip);

}  // namespace ferry
