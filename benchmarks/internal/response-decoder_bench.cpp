#include <benchmark/benchmark.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <optional>
#include <string>
#include <string_view>

#include "ferry/chunked-decoder.hpp"
#include "ferry/raw-chars.hpp"
#include "ferry/response-decoder.hpp"
#include "ferry/response-head.hpp"
#include "ferry/string-equal-ignore-case.hpp"

using namespace ferry;

namespace {

constexpr std::string_view kSmallHead =
    "HTTP/1.1 200 OK\r\nContent-Length: 5\r\nContent-Type: text/plain\r\n\r\nhello";

std::string MakeLargeHead(int nbHeaders) {
  std::string head("HTTP/1.1 200 OK\r\n");
  for (int headerPos = 0; headerPos < nbHeaders; ++headerPos) {
    head.append("X-Custom-Header-").append(std::to_string(headerPos)).append(": some moderately long value\r\n");
  }
  head.append("Content-Length: 0\r\n\r\n");
  return head;
}

std::string MakeChunkedBody(std::size_t totalSize, std::size_t chunkSize) {
  std::string body;
  char sizeLine[32];
  for (std::size_t pos = 0; pos < totalSize; pos += chunkSize) {
    const std::size_t len = std::min(chunkSize, totalSize - pos);
    const int lineLen = std::snprintf(sizeLine, sizeof(sizeLine), "%zx\r\n", len);
    body.append(sizeLine, static_cast<std::size_t>(lineLen));
    body.append(len, 'x');
    body.append("\r\n");
  }
  body.append("0\r\n\r\n");
  return body;
}

void BM_ResponseDecoder_SmallHead(benchmark::State& state) {
  for ([[maybe_unused]] auto iter : state) {
    ResponseDecoder decoder;
    std::optional<ResponseHead> head = decoder.decode(kSmallHead);
    benchmark::DoNotOptimize(head);
  }
  state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(kSmallHead.size()));
}
BENCHMARK(BM_ResponseDecoder_SmallHead);

void BM_ResponseDecoder_ManyHeaders(benchmark::State& state) {
  const std::string raw = MakeLargeHead(static_cast<int>(state.range(0)));
  for ([[maybe_unused]] auto iter : state) {
    ResponseDecoder decoder;
    std::optional<ResponseHead> head = decoder.decode(raw);
    benchmark::DoNotOptimize(head);
  }
  state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(raw.size()));
}
BENCHMARK(BM_ResponseDecoder_ManyHeaders)->Arg(8)->Arg(32)->Arg(128);

// Head delivered in small pieces, as from a slow connection.
void BM_ResponseDecoder_SplitHead(benchmark::State& state) {
  const std::string raw = MakeLargeHead(32);
  const auto pieceSize = static_cast<std::size_t>(state.range(0));
  for ([[maybe_unused]] auto iter : state) {
    ResponseDecoder decoder;
    std::optional<ResponseHead> head;
    for (std::size_t pos = 0; pos < raw.size() && !head; pos += pieceSize) {
      head = decoder.decode(std::string_view(raw).substr(pos, pieceSize));
    }
    benchmark::DoNotOptimize(head);
  }
  state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(raw.size()));
}
BENCHMARK(BM_ResponseDecoder_SplitHead)->Arg(16)->Arg(256);

void BM_ChunkedDecoder(benchmark::State& state) {
  const std::string raw = MakeChunkedBody(1UL << 20, static_cast<std::size_t>(state.range(0)));
  RawChars out(1UL << 20);
  for ([[maybe_unused]] auto iter : state) {
    ChunkedDecoder decoder;
    out.clear();
    benchmark::DoNotOptimize(decoder.decode(raw, out));
    if (!decoder.done()) {
      state.SkipWithError("chunked body not fully decoded");
      break;
    }
  }
  state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(raw.size()));
}
BENCHMARK(BM_ChunkedDecoder)->Arg(64)->Arg(4096)->Arg(65536);

void BM_ListContains(benchmark::State& state) {
  static constexpr std::string_view kConnection = "Upgrade, HTTP2-Settings, Keep-Alive, TE,  close";
  for ([[maybe_unused]] auto iter : state) {
    benchmark::DoNotOptimize(CaseInsensitiveListContains(kConnection, "close"));
  }
}
BENCHMARK(BM_ListContains);

}  // namespace

BENCHMARK_MAIN();
