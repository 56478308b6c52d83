#include "ferry/zstd-decoder.hpp"

#include <zstd.h>

#include <cstddef>
#include <memory>
#include <new>
#include <string_view>

#include "ferry/decoder.hpp"
#include "ferry/log.hpp"
#include "ferry/output-budget.hpp"
#include "ferry/raw-chars.hpp"

namespace ferry {

namespace {

class ZstdStreamingContext final : public DecoderContext {
 public:
  ZstdStreamingContext() {
    if (!_stream) {
      throw std::bad_alloc();
    }
    ZSTD_initDStream(_stream.get());
  }

  bool decompressChunk(std::string_view chunk, bool finalChunk, std::size_t maxDecompressedBytes,
                       std::size_t decoderChunkSize, RawChars &out) override {
    if (_finished) {
      return chunk.empty();
    }
    if (chunk.empty()) {
      return !finalChunk;
    }
    OutputBudget budget(out, decoderChunkSize, maxDecompressedBytes);

    ZSTD_inBuffer in{chunk.data(), chunk.size(), 0};
    while (true) {
      const bool lastStep = budget.reserveStep();
      ZSTD_outBuffer output{out.data() + out.size(), out.availableCapacity(), 0};
      const std::size_t ret = ZSTD_decompressStream(_stream.get(), &output, &in);
      if (ZSTD_isError(ret) != 0U) [[unlikely]] {
        log::error("ZstdDecoder - ZSTD_decompressStream failed with error {}", ZSTD_getErrorName(ret));
        return false;
      }
      out.addSize(output.pos);
      if (ret == 0) {
        // end of frame
        _finished = true;
        _stream.reset();
        return in.pos == in.size;
      }
      if (in.pos == in.size && output.pos < output.size) {
        return !finalChunk;
      }
      if (lastStep) {
        return false;
      }
    }
  }

  [[nodiscard]] bool finished() const noexcept override { return _finished; }

 private:
  std::unique_ptr<ZSTD_DStream, decltype(&ZSTD_freeDStream)> _stream{ZSTD_createDStream(), &ZSTD_freeDStream};
  bool _finished{false};
};

}  // namespace

std::unique_ptr<DecoderContext> MakeZstdDecoderContext() { return std::make_unique<ZstdStreamingContext>(); }

}  // namespace ferry
