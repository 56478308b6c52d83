#include "ferry/zlib-decoder.hpp"

#include <zconf.h>
#include <zlib.h>

#include <cstddef>
#include <memory>
#include <string_view>

#include "ferry/decoder.hpp"
#include "ferry/log.hpp"
#include "ferry/output-budget.hpp"
#include "ferry/raw-chars.hpp"
#include "ferry/zlib-stream-raii.hpp"

namespace ferry {

namespace {

class ZlibStreamingContext final : public DecoderContext {
 public:
  explicit ZlibStreamingContext(bool isGzip)
      : _context(isGzip ? ZStreamRAII::Variant::gzip : ZStreamRAII::Variant::deflate) {}

  bool decompressChunk(std::string_view chunk, bool finalChunk, std::size_t maxDecompressedBytes,
                       std::size_t decoderChunkSize, RawChars &out) override {
    if (_finished) {
      // trailing garbage after the end of the compressed stream is an error
      return chunk.empty();
    }
    if (chunk.empty()) {
      return !finalChunk;
    }

    auto &stream = _context.stream;

    stream.next_in = reinterpret_cast<Bytef *>(const_cast<char *>(chunk.data()));
    stream.avail_in = static_cast<uInt>(chunk.size());

    OutputBudget budget(out, decoderChunkSize, maxDecompressedBytes);

    while (true) {
      const bool lastStep = budget.reserveStep();

      stream.avail_out = static_cast<uInt>(out.availableCapacity());
      stream.next_out = reinterpret_cast<unsigned char *>(out.data() + out.size());

      const auto ret = inflate(&stream, Z_NO_FLUSH);
      out.setSize(out.capacity() - stream.avail_out);
      if (ret == Z_STREAM_END) {
        _finished = true;
        return stream.avail_in == 0;
      }
      if (ret != Z_OK && ret != Z_BUF_ERROR) {
        log::error("ZlibDecoder - inflate failed with error {}", ret);
        return false;
      }
      if (stream.avail_in == 0 && stream.avail_out != 0) {
        return !finalChunk;
      }
      if (lastStep) {
        log::debug("ZlibDecoder - reached max decompressed size of {}", maxDecompressedBytes);
        return false;
      }
    }
  }

  [[nodiscard]] bool finished() const noexcept override { return _finished; }

 private:
  ZStreamRAII _context;
  bool _finished{false};
};

}  // namespace

std::unique_ptr<DecoderContext> MakeZlibDecoderContext(bool isGzip) {
  return std::make_unique<ZlibStreamingContext>(isGzip);
}

}  // namespace ferry
