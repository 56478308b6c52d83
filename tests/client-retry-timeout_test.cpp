#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "ferry/client-config.hpp"
#include "ferry/client.hpp"
#include "ferry/http-client-error.hpp"
#include "ferry/http-method.hpp"
#include "ferry/request-body.hpp"
#include "ferry/request.hpp"
#include "ferry/scripted-server.hpp"

using namespace std::chrono_literals;
using namespace ferry;

namespace {

std::optional<HttpClientError> SendError(Client &client, Request &request) {
  try {
    client.send(request).body().readAll();
  } catch (const HttpClientError &err) {
    return err;
  }
  return std::nullopt;
}

// Closes the connection without answering the first 'nbFailures' requests.
test::ScriptedServer::Handler FlakyHandler(int nbFailures) {
  auto counter = std::make_shared<std::atomic<int>>(0);
  return [counter, nbFailures](const test::RecordedRequest &req) {
    if (counter->fetch_add(1) < nbFailures) {
      test::Reply reply;
      reply.closeAfter = true;
      return reply;
    }
    return test::Reply::Ok("finally " + req.body);
  };
}

}  // namespace

TEST(ClientRetry, RetriesReusableBody) {
  test::ScriptedServer server(FlakyHandler(1));
  Client client(ClientConfig{}.withRetryTimes(1));

  Request request(http::Method::POST, server.url());
  request.withBody(RequestBody::FromString("data"));
  EXPECT_EQ(client.send(request).body().readAll(), "finally data");
  const auto requests = server.requests();
  ASSERT_EQ(requests.size(), 2U);
  EXPECT_EQ(requests[0].body, "data");
  EXPECT_EQ(requests[1].body, "data");
}

TEST(ClientRetry, NoRetryByDefault) {
  test::ScriptedServer server(FlakyHandler(1));
  Client client;

  Request request(http::Method::GET, server.url());
  const auto err = SendError(client, request);
  ASSERT_TRUE(err);
  EXPECT_EQ(err->kind(), ErrorKind::Protocol);
  EXPECT_EQ(err->phase(), ErrorPhase::Receive);
  EXPECT_EQ(server.requests().size(), 1U);
}

TEST(ClientRetry, RetriesExhausted) {
  test::ScriptedServer server(FlakyHandler(10));
  Client client(ClientConfig{}.withRetryTimes(2));

  Request request(http::Method::GET, server.url());
  const auto err = SendError(client, request);
  ASSERT_TRUE(err);
  EXPECT_TRUE(err->isRetryable());
  EXPECT_EQ(server.requests().size(), 3U);
}

TEST(ClientTimeout, RequestTimeout) {
  test::ScriptedServer server([](const test::RecordedRequest &) {
    auto reply = test::Reply::Ok("too late");
    reply.delay = 500ms;
    return reply;
  });
  Client client(ClientConfig{}.withRequestTimeout(50ms));

  Request request(http::Method::GET, server.url());
  const auto start = std::chrono::steady_clock::now();
  const auto err = SendError(client, request);
  const auto elapsed = std::chrono::steady_clock::now() - start;
  ASSERT_TRUE(err);
  EXPECT_EQ(err->kind(), ErrorKind::Timeout);
  EXPECT_EQ(err->phase(), ErrorPhase::Receive);
  EXPECT_GE(elapsed, 50ms);
  EXPECT_LT(elapsed, 450ms);
}

TEST(ClientTimeout, BodyReadTimeout) {
  test::ScriptedServer server([](const test::RecordedRequest &) {
    test::Reply reply;
    reply.raw = "HTTP/1.1 200 OK\r\nContent-Length: 100\r\n\r\npartial";
    return reply;
  });
  Client client(ClientConfig{}.withRequestTimeout(100ms));

  auto response = client.send(Request(http::Method::GET, server.url()));
  EXPECT_EQ(response.statusCode(), 200);
  try {
    response.body().readAll();
    FAIL() << "expected a timeout";
  } catch (const HttpClientError &err) {
    EXPECT_EQ(err.kind(), ErrorKind::Timeout);
  }
}

TEST(ClientConnect, ConnectionRefused) {
  uint16_t port;
  {
    test::ScriptedServer server([](const test::RecordedRequest &) { return test::Reply::Ok(""); });
    port = server.port();
  }
  Client client(ClientConfig{}.withConnectTimeout(1s));

  Request request(http::Method::GET, "http://127.0.0.1:" + std::to_string(port) + "/");
  const auto err = SendError(client, request);
  ASSERT_TRUE(err);
  EXPECT_EQ(err->kind(), ErrorKind::Connect);
  EXPECT_EQ(err->phase(), ErrorPhase::Connect);
  EXPECT_TRUE(err->isRetryable());
}

TEST(ClientConnect, UnresolvableHost) {
  Client client(ClientConfig{}.withConnectTimeout(2s));
  Request request(http::Method::GET, "http://does-not-exist.invalid/");
  const auto err = SendError(client, request);
  ASSERT_TRUE(err);
  EXPECT_EQ(err->kind(), ErrorKind::Connect);
}

TEST(ClientConnect, UnsupportedScheme) {
  Client client;
  Request request(http::Method::GET, "ftp://127.0.0.1/file");
  const auto err = SendError(client, request);
  ASSERT_TRUE(err);
  EXPECT_EQ(err->kind(), ErrorKind::Build);
}
