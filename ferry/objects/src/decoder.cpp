#include "ferry/decoder.hpp"

#include <memory>
#include <string_view>

#include "ferry/http-constants.hpp"
#include "ferry/string-equal-ignore-case.hpp"

#ifdef FERRY_ENABLE_ZLIB
#include "ferry/zlib-decoder.hpp"
#endif
#ifdef FERRY_ENABLE_BROTLI
#include "ferry/brotli-decoder.hpp"
#endif
#ifdef FERRY_ENABLE_ZSTD
#include "ferry/zstd-decoder.hpp"
#endif

namespace ferry {

std::unique_ptr<DecoderContext> MakeDecoderContext([[maybe_unused]] std::string_view encoding) {
#ifdef FERRY_ENABLE_ZLIB
  if (CaseInsensitiveEqual(encoding, http::gzip) || CaseInsensitiveEqual(encoding, "x-gzip")) {
    return MakeZlibDecoderContext(true);
  }
  if (CaseInsensitiveEqual(encoding, http::deflate)) {
    return MakeZlibDecoderContext(false);
  }
#endif
#ifdef FERRY_ENABLE_BROTLI
  if (CaseInsensitiveEqual(encoding, http::br)) {
    return MakeBrotliDecoderContext();
  }
#endif
#ifdef FERRY_ENABLE_ZSTD
  if (CaseInsensitiveEqual(encoding, http::zstd)) {
    return MakeZstdDecoderContext();
  }
#endif
  return nullptr;
}

std::string_view SupportedAcceptEncoding() noexcept {
  // Preference order: zstd, br, gzip, deflate.
  static constexpr std::string_view kValue =
#ifdef FERRY_ENABLE_ZSTD
#if defined(FERRY_ENABLE_BROTLI) || defined(FERRY_ENABLE_ZLIB)
      "zstd, "
#else
      "zstd"
#endif
#endif
#ifdef FERRY_ENABLE_BROTLI
#ifdef FERRY_ENABLE_ZLIB
      "br, "
#else
      "br"
#endif
#endif
#ifdef FERRY_ENABLE_ZLIB
      "gzip, deflate"
#endif
      "";
  return kValue;
}

}  // namespace ferry
