#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

#include "ferry/client-config.hpp"
#include "ferry/client.hpp"
#include "ferry/http-method.hpp"
#include "ferry/http-version.hpp"
#include "ferry/pool-config.hpp"
#include "ferry/request.hpp"
#include "ferry/scripted-server.hpp"

using namespace std::chrono_literals;
using namespace ferry;

TEST(ClientKeepAlive, SequentialRequestsShareOneConnection) {
  test::ScriptedServer server(
      [](const test::RecordedRequest &req) { return test::Reply::Ok("echo " + req.target); });
  Client client;

  for (const char *path : {"/one", "/two", "/three"}) {
    auto response = client.send(Request(http::Method::GET, server.url(path)));
    EXPECT_EQ(response.body().readAll(), std::string("echo ") + path);
  }
  EXPECT_EQ(server.connectionCount(), 1U);
  EXPECT_EQ(client.pool().idleCount(), 1U);
}

TEST(ClientKeepAlive, UnreadBodyPreventsReuse) {
  test::ScriptedServer server([](const test::RecordedRequest &) { return test::Reply::Ok("some body"); });
  Client client;

  {
    auto response = client.send(Request(http::Method::GET, server.url()));
    EXPECT_EQ(response.statusCode(), 200);
  }
  client.send(Request(http::Method::GET, server.url())).body().readAll();
  EXPECT_EQ(server.connectionCount(), 2U);
}

TEST(ClientKeepAlive, Http10ResponseClosesConnection) {
  test::ScriptedServer server([](const test::RecordedRequest &) {
    test::Reply reply;
    reply.raw = "HTTP/1.0 200 OK\r\nContent-Length: 2\r\n\r\nok";
    reply.closeAfter = true;
    return reply;
  });
  Client client;

  EXPECT_EQ(client.send(Request(http::Method::GET, server.url())).body().readAll(), "ok");
  EXPECT_EQ(client.pool().idleCount(), 0U);
  EXPECT_EQ(client.send(Request(http::Method::GET, server.url())).body().readAll(), "ok");
  EXPECT_EQ(server.connectionCount(), 2U);
}

TEST(ClientKeepAlive, Http10RequestWithKeepAlive) {
  test::ScriptedServer server([](const test::RecordedRequest &) {
    return test::Reply::Ok("ok", "Connection: keep-alive\r\n");
  });
  Client client;

  for (int idx = 0; idx < 2; ++idx) {
    Request request(http::Method::GET, server.url());
    request.withVersion(http::HTTP_1_0).withHeader("Connection", "keep-alive");
    EXPECT_EQ(client.send(request).body().readAll(), "ok");
  }
  EXPECT_EQ(server.connectionCount(), 1U);
  EXPECT_EQ(server.requests()[0].version, "HTTP/1.0");
}

TEST(ClientKeepAlive, ConnectionCloseRequest) {
  test::ScriptedServer server([](const test::RecordedRequest &) { return test::Reply::Ok("bye"); });
  Client client;

  Request request(http::Method::GET, server.url());
  request.withHeader("Connection", "close");
  EXPECT_EQ(client.send(request).body().readAll(), "bye");
  EXPECT_EQ(client.pool().idleCount(), 0U);
}

TEST(ClientKeepAlive, ConnectionClosedByServerWhileIdleIsNotReused) {
  test::ScriptedServer server([](const test::RecordedRequest &) {
    auto reply = test::Reply::Ok("once");
    reply.closeAfter = true;
    return reply;
  });
  Client client;

  EXPECT_EQ(client.send(Request(http::Method::GET, server.url())).body().readAll(), "once");
  EXPECT_EQ(client.pool().idleCount(), 1U);
  std::this_thread::sleep_for(50ms);

  EXPECT_EQ(client.send(Request(http::Method::GET, server.url())).body().readAll(), "once");
  EXPECT_EQ(server.connectionCount(), 2U);
}

TEST(ClientKeepAlive, IdleTimeout) {
  test::ScriptedServer server([](const test::RecordedRequest &) { return test::Reply::Ok("ok"); });
  Client client(ClientConfig{}.withPool(PoolConfig{}.withIdleTimeout(20ms)));

  client.send(Request(http::Method::GET, server.url())).body().readAll();
  std::this_thread::sleep_for(60ms);
  client.send(Request(http::Method::GET, server.url())).body().readAll();
  EXPECT_EQ(server.connectionCount(), 2U);
}

TEST(ClientKeepAlive, ReuseDisabled) {
  test::ScriptedServer server([](const test::RecordedRequest &) { return test::Reply::Ok("ok"); });
  Client client(ClientConfig{}.withPool(PoolConfig{}.withMaxIdlePerHost(0)));

  for (int idx = 0; idx < 3; ++idx) {
    client.send(Request(http::Method::GET, server.url())).body().readAll();
  }
  EXPECT_EQ(server.connectionCount(), 3U);
}

TEST(ClientKeepAlive, ConcurrentRequests) {
  test::ScriptedServer server([](const test::RecordedRequest &req) { return test::Reply::Ok(req.target); });
  Client client;

  std::vector<std::jthread> threads;
  std::atomic<int> nbOk{0};
  for (int threadIdx = 0; threadIdx < 4; ++threadIdx) {
    threads.emplace_back([&, threadIdx] {
      for (int idx = 0; idx < 10; ++idx) {
        const auto path = "/t" + std::to_string(threadIdx) + "/" + std::to_string(idx);
        if (client.send(Request(http::Method::GET, server.url(path))).body().readAll() == path) {
          ++nbOk;
        }
      }
    });
  }
  threads.clear();
  EXPECT_EQ(nbOk.load(), 40);
  EXPECT_LE(server.connectionCount(), 4U);
}
