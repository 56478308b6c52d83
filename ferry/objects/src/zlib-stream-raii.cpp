#include "ferry/zlib-stream-raii.hpp"

#include <spdlog/fmt/fmt.h>
#include <zconf.h>
#include <zlib.h>

#include <stdexcept>

#include "ferry/log.hpp"

namespace ferry {

namespace {
constexpr int ComputeWindowBits(ZStreamRAII::Variant variant) {
  // 'deflate' content coding is the zlib format (RFC 1950), windowBits + 32 would also auto-detect gzip.
  return variant == ZStreamRAII::Variant::gzip ? MAX_WBITS + 16 : MAX_WBITS;
}
}  // namespace

ZStreamRAII::ZStreamRAII(Variant variant) {
  const auto ret = inflateInit2(&stream, ComputeWindowBits(variant));
  if (ret != Z_OK) {
    throw std::runtime_error(fmt::format("Error from inflateInit2 - error {}", ret));
  }
}

ZStreamRAII::~ZStreamRAII() {
  const auto ret = inflateEnd(&stream);
  if (ret != Z_OK) {
    log::error("zlib: inflateEnd returned {} (ignored)", ret);
  }
}

}  // namespace ferry
