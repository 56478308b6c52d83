#include "ferry/response-decoder.hpp"

#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <string_view>

#include "ferry/http-client-error.hpp"
#include "ferry/http-version.hpp"
#include "ferry/response-head.hpp"

namespace ferry {

namespace {

ErrorKind DecodeErrorKind(std::string_view raw) {
  ResponseDecoder decoder;
  try {
    decoder.decode(raw);
  } catch (const HttpClientError &err) {
    return err.kind();
  }
  return ErrorKind::Other;
}

}  // namespace

TEST(ResponseDecoder, CompleteHeadInOneChunk) {
  ResponseDecoder decoder;
  auto head = decoder.decode("HTTP/1.1 200 OK\r\nContent-Length: 5\r\nX-A:  b \r\n\r\nhello");
  ASSERT_TRUE(head);
  EXPECT_EQ(head->version, http::HTTP_1_1);
  EXPECT_EQ(head->statusCode, 200);
  EXPECT_EQ(head->reason, "OK");
  EXPECT_EQ(head->headers.get("content-length"), "5");
  EXPECT_EQ(head->headers.get("x-a"), "b");
  EXPECT_EQ(decoder.leftover(), "hello");
  EXPECT_TRUE(head->keepAlive());
}

TEST(ResponseDecoder, ByteByByte) {
  const std::string raw = "HTTP/1.0 404 Not Found\r\nServer: test\r\n\r\nbody";
  ResponseDecoder decoder;
  std::optional<ResponseHead> head;
  std::size_t pos = 0;
  for (; pos < raw.size() && !head; ++pos) {
    head = decoder.decode(std::string_view(raw).substr(pos, 1));
  }
  ASSERT_TRUE(head);
  EXPECT_EQ(pos, raw.size() - 4);
  EXPECT_EQ(head->version, http::HTTP_1_0);
  EXPECT_EQ(head->statusCode, 404);
  EXPECT_EQ(head->reason, "Not Found");
  EXPECT_FALSE(head->keepAlive());
  EXPECT_EQ(decoder.leftover(), "");
}

TEST(ResponseDecoder, MissingReasonPhrase) {
  ResponseDecoder decoder;
  auto head = decoder.decode("HTTP/1.1 204\r\n\r\n");
  ASSERT_TRUE(head);
  EXPECT_EQ(head->statusCode, 204);
  EXPECT_TRUE(head->reason.empty());
  EXPECT_TRUE(head->headers.empty());
}

TEST(ResponseDecoder, InterimResponseThenFinal) {
  ResponseDecoder decoder;
  auto interim = decoder.decode("HTTP/1.1 100 Continue\r\n\r\nHTTP/1.1 200 OK\r\nContent-Length: 2\r\n\r\nok");
  ASSERT_TRUE(interim);
  EXPECT_EQ(interim->statusCode, 100);
  decoder.restart();
  auto final = decoder.decode({});
  ASSERT_TRUE(final);
  EXPECT_EQ(final->statusCode, 200);
  EXPECT_EQ(decoder.leftover(), "ok");
  RawChars leftover = decoder.takeLeftover();
  EXPECT_EQ(std::string_view(leftover), "ok");
  EXPECT_EQ(decoder.leftover(), "");
}

TEST(ResponseDecoder, KeepAliveRules) {
  ResponseDecoder decoder1;
  EXPECT_FALSE(decoder1.decode("HTTP/1.1 200 OK\r\nConnection: Close\r\n\r\n")->keepAlive());
  ResponseDecoder decoder2;
  EXPECT_TRUE(decoder2.decode("HTTP/1.0 200 OK\r\nConnection: Keep-Alive\r\n\r\n")->keepAlive());
  ResponseDecoder decoder3;
  EXPECT_TRUE(decoder3.decode("HTTP/1.1 200 OK\r\nConnection: keep-alive\r\n\r\n")->keepAlive());
}

TEST(ResponseDecoder, MalformedHeads) {
  EXPECT_EQ(DecodeErrorKind("HTTP/1.1 2000 OK\r\n\r\n"), ErrorKind::Protocol);
  EXPECT_EQ(DecodeErrorKind("HTTP/1.1 20 OK\r\n\r\n"), ErrorKind::Protocol);
  EXPECT_EQ(DecodeErrorKind("HTTP/2.0 200 OK\r\n\r\n"), ErrorKind::Protocol);
  EXPECT_EQ(DecodeErrorKind("ICY 200 OK\r\n\r\n"), ErrorKind::Protocol);
  EXPECT_EQ(DecodeErrorKind("HTTP/1.1 200 OK\r\nNo colon here\r\n\r\n"), ErrorKind::Protocol);
  EXPECT_EQ(DecodeErrorKind("HTTP/1.1 200 OK\r\nBad Name: x\r\n\r\n"), ErrorKind::Protocol);
  EXPECT_EQ(DecodeErrorKind("HTTP/1.1 200 OK\r\nName : x\r\n\r\n"), ErrorKind::Protocol);
  EXPECT_EQ(DecodeErrorKind("HTTP/1.1 200 OK\r\nA: b\r\n folded\r\n\r\n"), ErrorKind::Protocol);
  EXPECT_EQ(DecodeErrorKind("HTTP/1.1 200 OK\nA: b\r\n\r\n"), ErrorKind::Protocol);
  EXPECT_EQ(DecodeErrorKind("HTTP/1.1 200 OK\r\nA: b\nC: d\r\n\r\n"), ErrorKind::Protocol);
}

TEST(ResponseDecoder, HeadTooLarge) {
  ResponseDecoder decoder(64);
  EXPECT_FALSE(decoder.decode("HTTP/1.1 200 OK\r\n"));
  try {
    decoder.decode("X-Long: " + std::string(100, 'a'));
    FAIL() << "expected a Protocol error";
  } catch (const HttpClientError &err) {
    EXPECT_EQ(err.kind(), ErrorKind::Protocol);
    EXPECT_EQ(err.phase(), ErrorPhase::Receive);
  }
}

TEST(ResponseDecoder, EofBeforeHeadIsProtocolError) {
  ResponseDecoder decoder;
  EXPECT_FALSE(decoder.decode("HTTP/1.1 200 OK\r\nContent-"));
  try {
    decoder.eof();
  } catch (const HttpClientError &err) {
    EXPECT_EQ(err.kind(), ErrorKind::Protocol);
  }
  ResponseDecoder empty;
  EXPECT_THROW(empty.eof(), HttpClientError);
}

}  // namespace ferry
