#include "ferry/chunked-decoder.hpp"

#include <gtest/gtest.h>

#include <string>
#include <string_view>

#include "ferry/http-client-error.hpp"
#include "ferry/raw-chars.hpp"

namespace ferry {

namespace {

// Feeds 'raw' in pieces of 'step' bytes, returns the total consumed bytes.
std::size_t DecodeInPieces(ChunkedDecoder &decoder, std::string_view raw, std::size_t step, RawChars &out) {
  std::size_t consumed = 0;
  while (consumed < raw.size() && !decoder.done()) {
    const auto piece = raw.substr(consumed, step);
    consumed += decoder.decode(piece, out);
  }
  return consumed;
}

void ExpectProtocolError(std::string_view raw) {
  ChunkedDecoder decoder;
  RawChars out;
  try {
    decoder.decode(raw, out);
    ADD_FAILURE() << "expected an error for '" << raw << "'";
  } catch (const HttpClientError &err) {
    EXPECT_EQ(err.kind(), ErrorKind::Protocol);
  }
}

}  // namespace

TEST(ChunkedDecoder, SimpleBody) {
  const std::string_view raw = "5\r\nhello\r\n7;ext=1\r\n, world\r\n0\r\n\r\nNEXT";
  for (std::size_t step : {1UL, 2UL, 3UL, 7UL, 1000UL}) {
    ChunkedDecoder decoder;
    RawChars out;
    const std::size_t consumed = DecodeInPieces(decoder, raw, step, out);
    EXPECT_TRUE(decoder.done());
    EXPECT_EQ(consumed, raw.size() - 4) << step;
    EXPECT_EQ(std::string_view(out), "hello, world") << step;
    EXPECT_TRUE(decoder.trailers().empty());
  }
}

TEST(ChunkedDecoder, UpperCaseHexAndWhitespaceBeforeExtension) {
  ChunkedDecoder decoder;
  RawChars out;
  const std::string data(26, 'z');
  const std::string raw = "1A ;name\r\n" + data + "\r\n0\r\n\r\n";
  EXPECT_EQ(decoder.decode(raw, out), raw.size());
  EXPECT_TRUE(decoder.done());
  EXPECT_EQ(std::string_view(out), data);
}

TEST(ChunkedDecoder, Trailers) {
  ChunkedDecoder decoder;
  RawChars out;
  const std::string_view raw = "3\r\nabc\r\n0\r\nX-Checksum: 42\r\nX-Other:  v \r\n\r\n";
  EXPECT_EQ(DecodeInPieces(decoder, raw, 4, out), raw.size());
  ASSERT_TRUE(decoder.done());
  EXPECT_EQ(decoder.trailers().size(), 2U);
  EXPECT_EQ(decoder.trailers().get("x-checksum"), "42");
  EXPECT_EQ(decoder.trailers().get("X-Other"), "v");
}

TEST(ChunkedDecoder, NotDoneUntilFinalCrlf) {
  ChunkedDecoder decoder;
  RawChars out;
  EXPECT_EQ(decoder.decode("0\r\n", out), 3U);
  EXPECT_FALSE(decoder.done());
  EXPECT_EQ(decoder.decode("\r\n", out), 2U);
  EXPECT_TRUE(decoder.done());
  EXPECT_EQ(decoder.decode("extra", out), 0U);
}

TEST(ChunkedDecoder, MalformedGrammar) {
  ExpectProtocolError("zz\r\n");
  ExpectProtocolError("\r\n");
  ExpectProtocolError("5\nhello\r\n");
  ExpectProtocolError("5\r\nhelloXY");
  ExpectProtocolError("5\r\nhello\rX");
  ExpectProtocolError("11111111111111111\r\n");
  ExpectProtocolError("0\r\nbad trailer\r\n\r\n");
  ExpectProtocolError(std::string(ChunkedDecoder::kMaxLineBytes + 1, '1'));
}

}  // namespace ferry
