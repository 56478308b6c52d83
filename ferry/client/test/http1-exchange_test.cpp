#include "ferry/http1-exchange.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <cstddef>
#include <memory>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include "ferry/body-length.hpp"
#include "ferry/conn-pool.hpp"
#include "ferry/conn.hpp"
#include "ferry/deadline.hpp"
#include "ferry/http-client-error.hpp"
#include "ferry/http-method.hpp"
#include "ferry/http-version.hpp"
#include "ferry/interceptor.hpp"
#include "ferry/memory-stream.hpp"
#include "ferry/pool-config.hpp"
#include "ferry/request-body.hpp"
#include "ferry/request-formatter.hpp"
#include "ferry/request.hpp"
#include "ferry/response.hpp"
#include "ferry/stream.hpp"
#include "ferry/uri.hpp"

#ifdef FERRY_ENABLE_ZLIB
#include <zlib.h>
#endif

namespace ferry {

namespace {

class ThrowingReader : public BodyReader {
 public:
  explicit ThrowingReader(bool systemError) : _systemError(systemError) {}

  std::size_t read(std::span<char> dst) override {
    if (_sent) {
      if (_systemError) {
        throw std::system_error(std::make_error_code(std::errc::operation_canceled), "upload cancelled");
      }
      throw std::runtime_error("producer broken");
    }
    _sent = true;
    dst[0] = 'x';
    return 1;
  }

 private:
  bool _systemError;
  bool _sent{false};
};

class ChunksReader : public BodyReader {
 public:
  explicit ChunksReader(std::vector<std::string> chunks) : _chunks(std::move(chunks)) {}

  std::size_t read(std::span<char> dst) override {
    if (_pos == _chunks.size()) {
      return 0;
    }
    const auto &chunk = _chunks[_pos++];
    chunk.copy(dst.data(), dst.size());
    return chunk.size();
  }

 private:
  std::vector<std::string> _chunks;
  std::size_t _pos{0};
};

class RecordingInterceptor : public Interceptor {
 public:
  void onRequest(const Request &) override { ++nbRequests; }

  void onOutboundBytes(std::string_view bytes) override { outbound.append(bytes); }

  void onInboundBytes(std::string_view bytes) override { inbound.append(bytes); }

  void onResponse(const Response &) override { ++nbResponses; }

  std::string outbound;
  std::string inbound;
  int nbRequests{0};
  int nbResponses{0};
};

class FailingInterceptor : public Interceptor {
 public:
  void onRequest(const Request &) override { throw std::runtime_error("rejected by interceptor"); }
};

class Http1ExchangeTest : public ::testing::Test {
 protected:
  Conn connect(std::vector<std::string> inbound, test::MemoryStream::AtEnd atEnd = test::MemoryStream::AtEnd::Eof,
               ConnDetail detail = {}) {
    auto stream = std::make_unique<test::MemoryStream>(std::move(inbound), atEnd, std::move(detail));
    rawStream = stream.get();
    probe = stream->probe();
    connector->push(std::move(stream));
    return pool.connectTo(uri, Deadline::Never());
  }

  Response exchange(Request &request, std::vector<std::string> inbound,
                    test::MemoryStream::AtEnd atEnd = test::MemoryStream::AtEnd::Eof) {
    FormatRequest(request);
    return SendRequest(connect(std::move(inbound), atEnd), request, options);
  }

  HttpClientError exchangeError(Request &request, std::vector<std::string> inbound,
                                test::MemoryStream::AtEnd atEnd = test::MemoryStream::AtEnd::Eof) {
    try {
      auto response = exchange(request, std::move(inbound), atEnd);
      response.body().readAll();
    } catch (const HttpClientError &err) {
      EXPECT_TRUE(probe->closed);
      return err;
    }
    ADD_FAILURE() << "expected an error";
    return {ErrorKind::Other, "no error"};
  }

  Uri uri = *Uri::Parse("http://example.com/hello");
  std::shared_ptr<test::MemoryConnector> connector = std::make_shared<test::MemoryConnector>();
  ConnPool pool{PoolConfig{}, connector};
  ExchangeOptions options;
  test::MemoryStream *rawStream{nullptr};
  std::shared_ptr<test::MemoryStream::Probe> probe;
};

}  // namespace

TEST_F(Http1ExchangeTest, SimpleGetKeepsConnection) {
  Request request(http::Method::GET, uri);
  auto response = exchange(request, {"HTTP/1.1 200 OK\r\nContent-Length: 5\r\n\r\nhello"});

  EXPECT_EQ(response.statusCode(), 200);
  EXPECT_EQ(response.reason(), "OK");
  EXPECT_EQ(response.version(), http::HTTP_1_1);
  EXPECT_EQ(response.headers().get("content-length"), "5");
  EXPECT_EQ(response.body().length(), BodyLength::Fixed(5));
  EXPECT_EQ(response.body().readAll(), "hello");
  EXPECT_EQ(pool.idleCount(), 1U);
  EXPECT_FALSE(probe->closed);

  EXPECT_TRUE(probe->outbound.starts_with("GET /hello HTTP/1.1\r\n"));
  EXPECT_NE(probe->outbound.find("\r\nHost: example.com\r\n"), std::string::npos);
  EXPECT_TRUE(probe->outbound.ends_with("\r\n\r\n"));

  EXPECT_TRUE(request.timeGroup().transferStart().has_value());
  EXPECT_TRUE(request.timeGroup().transferEnd().has_value());
}

TEST_F(Http1ExchangeTest, ResponseSplitInManyReads) {
  Request request(http::Method::GET, uri);
  auto response = exchange(request, {"HTTP/1.1 2", "00 OK\r\nContent-", "Length: 5\r\n", "\r\nhe", "llo"});
  EXPECT_EQ(response.statusCode(), 200);
  EXPECT_EQ(response.body().readAll(), "hello");
  EXPECT_EQ(pool.idleCount(), 1U);
}

TEST_F(Http1ExchangeTest, Http10ResponseIsNotReused) {
  Request request(http::Method::GET, uri);
  auto response = exchange(request, {"HTTP/1.0 200 OK\r\nContent-Length: 2\r\n\r\nok"});
  EXPECT_EQ(response.version(), http::HTTP_1_0);
  EXPECT_EQ(response.body().readAll(), "ok");
  EXPECT_EQ(pool.idleCount(), 0U);
  EXPECT_TRUE(probe->closed);
}

TEST_F(Http1ExchangeTest, Http10KeepAliveResponseIsReused) {
  Request request(http::Method::GET, uri);
  auto response = exchange(request, {"HTTP/1.0 200 OK\r\nConnection: keep-alive\r\nContent-Length: 2\r\n\r\nok"});
  EXPECT_EQ(response.body().readAll(), "ok");
  EXPECT_EQ(pool.idleCount(), 1U);
}

TEST_F(Http1ExchangeTest, ConnectionCloseResponseIsNotReused) {
  Request request(http::Method::GET, uri);
  auto response = exchange(request, {"HTTP/1.1 200 OK\r\nConnection: close\r\nContent-Length: 2\r\n\r\nok"});
  EXPECT_EQ(response.body().readAll(), "ok");
  EXPECT_EQ(pool.idleCount(), 0U);
}

TEST_F(Http1ExchangeTest, RequestAskingToCloseIsNotReused) {
  Request request(http::Method::GET, uri);
  request.withHeader("Connection", "close");
  auto response = exchange(request, {"HTTP/1.1 200 OK\r\nContent-Length: 2\r\n\r\nok"});
  EXPECT_EQ(response.body().readAll(), "ok");
  EXPECT_EQ(pool.idleCount(), 0U);
}

TEST_F(Http1ExchangeTest, Http10RequestIsNotReused) {
  Request request(http::Method::GET, uri);
  request.withVersion(http::HTTP_1_0);
  auto response = exchange(request, {"HTTP/1.1 200 OK\r\nContent-Length: 2\r\n\r\nok"});
  EXPECT_TRUE(probe->outbound.starts_with("GET /hello HTTP/1.0\r\n"));
  EXPECT_EQ(response.body().readAll(), "ok");
  EXPECT_EQ(pool.idleCount(), 0U);
}

TEST_F(Http1ExchangeTest, BodyUntilCloseIsNotReused) {
  Request request(http::Method::GET, uri);
  auto response = exchange(request, {"HTTP/1.1 200 OK\r\n\r\nall ", "of it"});
  EXPECT_EQ(response.body().length(), BodyLength::UntilClose());
  EXPECT_EQ(response.body().readAll(), "all of it");
  EXPECT_EQ(pool.idleCount(), 0U);
  EXPECT_TRUE(probe->closed);
}

TEST_F(Http1ExchangeTest, ChunkedResponse) {
  Request request(http::Method::GET, uri);
  auto response =
      exchange(request, {"HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n5\r\nhello\r\n", "0\r\n\r\n"});
  EXPECT_EQ(response.body().readAll(), "hello");
  EXPECT_EQ(pool.idleCount(), 1U);
}

TEST_F(Http1ExchangeTest, HeadResponseHasNoBody) {
  Request request(http::Method::HEAD, uri);
  auto response = exchange(request, {"HTTP/1.1 200 OK\r\nContent-Length: 5\r\n\r\n"});
  EXPECT_EQ(response.body().length(), BodyLength::Zero());
  EXPECT_TRUE(response.body().finished());
  EXPECT_EQ(response.body().readAll(), "");
  EXPECT_EQ(pool.idleCount(), 1U);
}

TEST_F(Http1ExchangeTest, NoContentAndNotModifiedHaveNoBody) {
  for (std::string_view statusLine : {"HTTP/1.1 204 No Content\r\n", "HTTP/1.1 304 Not Modified\r\n"}) {
    pool.clear();
    Request request(http::Method::GET, uri);
    auto response = exchange(request, {std::string(statusLine) + "Content-Length: 5\r\n\r\n"});
    EXPECT_EQ(response.body().length(), BodyLength::Zero());
    EXPECT_EQ(response.body().readAll(), "");
  }
  EXPECT_EQ(pool.idleCount(), 1U);
}

TEST_F(Http1ExchangeTest, InterimResponsesAreSkipped) {
  Request request(http::Method::GET, uri);
  auto response = exchange(request, {"HTTP/1.1 100 Continue\r\n\r\nHTTP/1.1 103 Early Hints\r\nLink: </a>\r\n\r\n",
                                     "HTTP/1.1 200 OK\r\nContent-Length: 2\r\n\r\nok"});
  EXPECT_EQ(response.statusCode(), 200);
  EXPECT_FALSE(response.headers().contains("Link"));
  EXPECT_EQ(response.body().readAll(), "ok");
}

TEST_F(Http1ExchangeTest, SwitchingProtocolsIsReturnedAndNotReused) {
  Request request(http::Method::GET, uri);
  request.withHeader("Upgrade", "websocket");
  auto response = exchange(request, {"HTTP/1.1 101 Switching Protocols\r\nUpgrade: websocket\r\n\r\n"});
  EXPECT_EQ(response.statusCode(), 101);
  EXPECT_EQ(pool.idleCount(), 0U);
}

TEST_F(Http1ExchangeTest, InvalidContentLengthIsProtocolError) {
  Request request(http::Method::GET, uri);
  const auto err = exchangeError(request, {"HTTP/1.1 200 OK\r\nContent-Length: abc\r\n\r\nhello"});
  EXPECT_EQ(err.kind(), ErrorKind::Protocol);
  EXPECT_EQ(err.phase(), ErrorPhase::Receive);
  EXPECT_EQ(pool.idleCount(), 0U);
}

TEST_F(Http1ExchangeTest, MalformedStatusLineIsProtocolError) {
  Request request(http::Method::GET, uri);
  EXPECT_EQ(exchangeError(request, {"HTTP/1.1 OK\r\n\r\n"}).kind(), ErrorKind::Protocol);
}

TEST_F(Http1ExchangeTest, ClosedBeforeHeadIsProtocolError) {
  Request request(http::Method::GET, uri);
  const auto err = exchangeError(request, {"HTTP/1.1 200 OK\r\nContent-"});
  EXPECT_EQ(err.kind(), ErrorKind::Protocol);
  EXPECT_EQ(err.phase(), ErrorPhase::Receive);
}

TEST_F(Http1ExchangeTest, HeadTooLargeIsProtocolError) {
  options.maxHeadBytes = 64;
  Request request(http::Method::GET, uri);
  const auto err = exchangeError(request, {"HTTP/1.1 200 OK\r\nX-Big: " + std::string(200, 'a') + "\r\n\r\n"});
  EXPECT_EQ(err.kind(), ErrorKind::Protocol);
}

TEST_F(Http1ExchangeTest, ResetWhileWaitingHeadIsRequestError) {
  Request request(http::Method::GET, uri);
  const auto err = exchangeError(request, {}, test::MemoryStream::AtEnd::Error);
  EXPECT_EQ(err.kind(), ErrorKind::Request);
  EXPECT_EQ(err.phase(), ErrorPhase::Receive);
  EXPECT_TRUE(err.ioErrorCode());
  EXPECT_TRUE(err.isRetryable());
}

TEST_F(Http1ExchangeTest, TimeoutWaitingHead) {
  options.deadline = Deadline::In(std::chrono::milliseconds{20});
  Request request(http::Method::GET, uri);
  const auto err = exchangeError(request, {}, test::MemoryStream::AtEnd::Stall);
  EXPECT_EQ(err.kind(), ErrorKind::Timeout);
  EXPECT_EQ(err.phase(), ErrorPhase::Receive);
}

TEST_F(Http1ExchangeTest, WriteFailureOnHeadIsRequestError) {
  Request request(http::Method::GET, uri);
  FormatRequest(request);
  Conn conn = connect({});
  rawStream->failWritesAfter(0);
  try {
    (void)SendRequest(std::move(conn), request, options);
    FAIL() << "expected an error";
  } catch (const HttpClientError &err) {
    EXPECT_EQ(err.kind(), ErrorKind::Request);
    EXPECT_EQ(err.phase(), ErrorPhase::Send);
  }
  EXPECT_TRUE(probe->closed);
  EXPECT_EQ(pool.idleCount(), 0U);
}

TEST_F(Http1ExchangeTest, WriteFailureOnBodyIsBodyTransferError) {
  options.bufferSize = 64;
  Request request(http::Method::POST, uri);
  request.withBody(RequestBody::FromString(std::string(1000, 'b')));
  FormatRequest(request);
  Conn conn = connect({});
  rawStream->failWritesAfter(200);
  try {
    (void)SendRequest(std::move(conn), request, options);
    FAIL() << "expected an error";
  } catch (const HttpClientError &err) {
    EXPECT_EQ(err.kind(), ErrorKind::BodyTransfer);
    EXPECT_EQ(err.phase(), ErrorPhase::Send);
  }
  EXPECT_EQ(probe->outbound.size(), 200U);
}

TEST_F(Http1ExchangeTest, PostWithBody) {
  Request request(http::Method::POST, uri);
  request.withBody(RequestBody::FromString("payload"));
  auto response = exchange(request, {"HTTP/1.1 201 Created\r\nContent-Length: 0\r\n\r\n"});
  EXPECT_EQ(response.statusCode(), 201);
  EXPECT_NE(probe->outbound.find("\r\nContent-Length: 7\r\n"), std::string::npos);
  EXPECT_TRUE(probe->outbound.ends_with("\r\n\r\npayload"));
  EXPECT_EQ(pool.idleCount(), 1U);
}

TEST_F(Http1ExchangeTest, LargeBodyThroughSmallBuffer) {
  options.bufferSize = 64;
  const std::string payload(5000, 'p');
  Request request(http::Method::PUT, uri);
  request.withBody(RequestBody::FromString(payload));
  auto response = exchange(request, {"HTTP/1.1 204 No Content\r\n\r\n"});
  EXPECT_EQ(response.statusCode(), 204);
  EXPECT_TRUE(probe->outbound.ends_with("\r\n\r\n" + payload));
}

TEST_F(Http1ExchangeTest, StreamedBodyIsChunked) {
  Request request(http::Method::POST, uri);
  request.withBody(RequestBody::FromReader(std::make_unique<ChunksReader>(std::vector<std::string>{"abc", "de"})));
  auto response = exchange(request, {"HTTP/1.1 200 OK\r\nContent-Length: 0\r\n\r\n"});
  EXPECT_NE(probe->outbound.find("\r\nTransfer-Encoding: chunked\r\n"), std::string::npos);
  EXPECT_EQ(probe->outbound.find("Content-Length"), std::string::npos);
  EXPECT_TRUE(probe->outbound.ends_with("0\r\n\r\n"));
  const auto bodyPos = probe->outbound.find("\r\n\r\n") + 4;
  std::string decoded;
  std::string_view rest(probe->outbound);
  rest.remove_prefix(bodyPos);
  while (true) {
    const auto sizeEnd = rest.find("\r\n");
    ASSERT_NE(sizeEnd, std::string_view::npos);
    const auto size = std::stoul(std::string(rest.substr(0, sizeEnd)), nullptr, 16);
    rest.remove_prefix(sizeEnd + 2);
    if (size == 0) {
      break;
    }
    decoded.append(rest.substr(0, size));
    rest.remove_prefix(size + 2);
  }
  EXPECT_EQ(decoded, "abcde");
}

TEST_F(Http1ExchangeTest, BodyProducerSystemErrorIsUserAbort) {
  Request request(http::Method::POST, uri);
  request.withBody(RequestBody::FromReader(std::make_unique<ThrowingReader>(true)));
  const auto err = exchangeError(request, {"HTTP/1.1 200 OK\r\nContent-Length: 0\r\n\r\n"});
  EXPECT_EQ(err.kind(), ErrorKind::UserAborted);
  EXPECT_EQ(err.phase(), ErrorPhase::Send);
  EXPECT_FALSE(err.isRetryable());
}

TEST_F(Http1ExchangeTest, BodyProducerFailureIsBodyTransfer) {
  Request request(http::Method::POST, uri);
  request.withBody(RequestBody::FromReader(std::make_unique<ThrowingReader>(false)));
  const auto err = exchangeError(request, {"HTTP/1.1 200 OK\r\nContent-Length: 0\r\n\r\n"});
  EXPECT_EQ(err.kind(), ErrorKind::BodyTransfer);
}

TEST_F(Http1ExchangeTest, AbsoluteFormThroughProxy) {
  Request request(http::Method::GET, uri);
  FormatRequest(request);
  auto response = SendRequest(connect({"HTTP/1.1 200 OK\r\nContent-Length: 0\r\n\r\n"},
                                      test::MemoryStream::AtEnd::Eof, ConnDetail{true, false, "proxy", 3128}),
                              request, options);
  EXPECT_TRUE(probe->outbound.starts_with("GET http://example.com/hello HTTP/1.1\r\n"));
}

TEST_F(Http1ExchangeTest, InterceptorObservesExchange) {
  auto interceptor = std::make_shared<RecordingInterceptor>();
  options.interceptor = interceptor;
  Request request(http::Method::GET, uri);
  const std::string_view raw = "HTTP/1.1 200 OK\r\nContent-Length: 5\r\n\r\nhello";
  auto response = exchange(request, {std::string(raw.substr(0, 20)), std::string(raw.substr(20))});
  EXPECT_EQ(response.body().readAll(), "hello");
  EXPECT_EQ(interceptor->nbRequests, 1);
  EXPECT_EQ(interceptor->nbResponses, 1);
  EXPECT_EQ(interceptor->outbound, probe->outbound);
  EXPECT_EQ(interceptor->inbound, raw);
}

TEST_F(Http1ExchangeTest, InterceptorFailureIsOther) {
  options.interceptor = std::make_shared<FailingInterceptor>();
  Request request(http::Method::GET, uri);
  const auto err = exchangeError(request, {"HTTP/1.1 200 OK\r\nContent-Length: 0\r\n\r\n"});
  EXPECT_EQ(err.kind(), ErrorKind::Other);
  EXPECT_EQ(err.phase(), ErrorPhase::Send);
  EXPECT_TRUE(probe->outbound.empty());
}

#ifdef FERRY_ENABLE_ZLIB

namespace {

std::string Gzip(std::string_view data) {
  z_stream stream{};
  EXPECT_EQ(deflateInit2(&stream, Z_DEFAULT_COMPRESSION, Z_DEFLATED, 15 + 16, 8, Z_DEFAULT_STRATEGY), Z_OK);
  std::string out(deflateBound(&stream, static_cast<uLong>(data.size())), '\0');
  stream.next_in = reinterpret_cast<Bytef *>(const_cast<char *>(data.data()));
  stream.avail_in = static_cast<uInt>(data.size());
  stream.next_out = reinterpret_cast<Bytef *>(out.data());
  stream.avail_out = static_cast<uInt>(out.size());
  EXPECT_EQ(deflate(&stream, Z_FINISH), Z_STREAM_END);
  out.resize(stream.total_out);
  deflateEnd(&stream);
  return out;
}

}  // namespace

TEST_F(Http1ExchangeTest, GzipBodyIsDecodedWhenEnabled) {
  options.decompression.enable = true;
  const std::string plain = "compressed hello, compressed hello, compressed hello";
  const auto compressed = Gzip(plain);
  Request request(http::Method::GET, uri);
  auto response = exchange(request, {"HTTP/1.1 200 OK\r\nContent-Encoding: gzip\r\nContent-Length: " +
                                     std::to_string(compressed.size()) + "\r\n\r\n" + compressed});
  EXPECT_FALSE(response.headers().contains("Content-Encoding"));
  EXPECT_FALSE(response.headers().contains("Content-Length"));
  EXPECT_EQ(response.body().readAll(), plain);
  EXPECT_EQ(pool.idleCount(), 1U);
}

TEST_F(Http1ExchangeTest, GzipBodyIsVerbatimWhenDisabled) {
  const auto compressed = Gzip("hello");
  Request request(http::Method::GET, uri);
  auto response = exchange(request, {"HTTP/1.1 200 OK\r\nContent-Encoding: gzip\r\nContent-Length: " +
                                     std::to_string(compressed.size()) + "\r\n\r\n" + compressed});
  EXPECT_EQ(response.headers().get("Content-Encoding"), "gzip");
  EXPECT_EQ(response.body().readAll(), compressed);
}

#endif

}  // namespace ferry
