#include "ferry/tcp-connector.hpp"

#include <arpa/inet.h>
#include <gtest/gtest.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include <cerrno>
#include <chrono>
#include <cstdint>
#include <string>

#include "ferry/base-fd.hpp"
#include "ferry/deadline.hpp"

namespace ferry {

using namespace std::chrono_literals;

namespace {

// Returns a listening loopback socket bound to an ephemeral port.
BaseFd MakeListener(uint16_t &port) {
  BaseFd listener(::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0));
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  addr.sin_port = 0;
  if (::bind(listener.fd(), reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) != 0 ||
      ::listen(listener.fd(), 8) != 0) {
    return BaseFd{};
  }
  socklen_t len = sizeof(addr);
  ::getsockname(listener.fd(), reinterpret_cast<sockaddr *>(&addr), &len);
  port = ntohs(addr.sin_port);
  return listener;
}

}  // namespace

TEST(TcpConnector, ConnectsToLoopbackListener) {
  uint16_t port = 0;
  BaseFd listener = MakeListener(port);
  ASSERT_TRUE(listener);

  auto result = ConnectTCP("127.0.0.1", std::to_string(port), Deadline::In(2s));
  EXPECT_FALSE(result.failure);
  EXPECT_FALSE(result.timedOut);
  EXPECT_TRUE(result.fd);
  EXPECT_EQ(result.err, 0);
}

TEST(TcpConnector, RefusedWhenNobodyListens) {
  uint16_t port = 0;
  {
    BaseFd listener = MakeListener(port);
    ASSERT_TRUE(listener);
  }
  auto result = ConnectTCP("127.0.0.1", std::to_string(port), Deadline::In(2s));
  EXPECT_TRUE(result.failure);
  EXPECT_FALSE(result.fd);
  EXPECT_EQ(result.err, ECONNREFUSED);
}

TEST(TcpConnector, UnresolvableHostFails) {
  auto result = ConnectTCP("invalid.host.name.invalid", "80", Deadline::In(2s));
  EXPECT_TRUE(result.failure);
  EXPECT_FALSE(result.fd);
}

}  // namespace ferry
