#include "ferry/brotli-decoder.hpp"

#include <brotli/decode.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <new>
#include <string_view>

#include "ferry/decoder.hpp"
#include "ferry/log.hpp"
#include "ferry/output-budget.hpp"
#include "ferry/raw-chars.hpp"

namespace ferry {

namespace {

class BrotliResponseDecoder final : public DecoderContext {
 public:
  BrotliResponseDecoder()
      : _state(BrotliDecoderCreateInstance(nullptr, nullptr, nullptr), &BrotliDecoderDestroyInstance) {
    if (!_state) {
      throw std::bad_alloc();
    }
  }

  bool decompressChunk(std::string_view chunk, bool finalChunk, std::size_t maxDecompressedBytes,
                       std::size_t decoderChunkSize, RawChars &out) override {
    if (!_state) {
      // stream already complete, only an empty tail is acceptable
      return chunk.empty();
    }
    if (chunk.empty()) {
      return !finalChunk;
    }

    OutputBudget budget(out, decoderChunkSize, maxDecompressedBytes);
    const auto *in = reinterpret_cast<const uint8_t *>(chunk.data());
    std::size_t inLeft = chunk.size();

    for (;;) {
      const bool lastStep = budget.reserveStep();
      auto *dst = reinterpret_cast<uint8_t *>(out.data() + out.size());
      std::size_t dstLeft = out.availableCapacity();
      const std::size_t dstSize = dstLeft;

      const BrotliDecoderResult res =
          BrotliDecoderDecompressStream(_state.get(), &inLeft, &in, &dstLeft, &dst, nullptr);
      out.addSize(dstSize - dstLeft);

      switch (res) {
        case BROTLI_DECODER_RESULT_SUCCESS:
          _state.reset();
          return inLeft == 0;
        case BROTLI_DECODER_RESULT_NEEDS_MORE_INPUT:
          return !finalChunk;
        case BROTLI_DECODER_RESULT_NEEDS_MORE_OUTPUT:
          if (lastStep) {
            log::debug("Brotli response body exceeds {} decoded bytes", maxDecompressedBytes);
            return false;
          }
          break;
        default:
          log::error("Brotli decoding of response body failed: {}",
                     BrotliDecoderErrorString(BrotliDecoderGetErrorCode(_state.get())));
          return false;
      }
    }
  }

  [[nodiscard]] bool finished() const noexcept override { return !_state; }

 private:
  std::unique_ptr<BrotliDecoderState, decltype(&BrotliDecoderDestroyInstance)> _state;
};

}  // namespace

std::unique_ptr<DecoderContext> MakeBrotliDecoderContext() { return std::make_unique<BrotliResponseDecoder>(); }

}  // namespace ferry
