#include "ferry/tls-client-context.hpp"

#include <gtest/gtest.h>
#include <openssl/ssl.h>
#include <sys/socket.h>

#include <stdexcept>

#include "ferry/base-fd.hpp"
#include "ferry/tls-config.hpp"

namespace ferry {

namespace {
struct SocketPair {
  SocketPair() {
    int fds[2];
    if (::socketpair(AF_UNIX, SOCK_STREAM, 0, fds) == 0) {
      first = BaseFd(fds[0]);
      second = BaseFd(fds[1]);
    }
  }

  BaseFd first;
  BaseFd second;
};
}  // namespace

TEST(TlsClientContext, DefaultConfig) {
  TlsClientContext ctx{TlsConfig{}};
  ASSERT_NE(ctx.raw(), nullptr);
  EXPECT_EQ(::SSL_CTX_get_verify_mode(ctx.raw()), SSL_VERIFY_PEER);
}

TEST(TlsClientContext, NoVerification) {
  TlsConfig cfg;
  cfg.withVerifyHostname(false).withVerifyPeer(false);
  TlsClientContext ctx{cfg};
  EXPECT_EQ(::SSL_CTX_get_verify_mode(ctx.raw()), SSL_VERIFY_NONE);
}

TEST(TlsClientContext, ProtocolBounds) {
  TlsConfig cfg;
  cfg.withTlsMinVersion(TlsConfig::kTls12).withTlsMaxVersion(TlsConfig::kTls13);
  TlsClientContext ctx{cfg};
  EXPECT_EQ(::SSL_CTX_get_min_proto_version(ctx.raw()), TLS1_2_VERSION);
  EXPECT_EQ(::SSL_CTX_get_max_proto_version(ctx.raw()), TLS1_3_VERSION);
}

TEST(TlsClientContext, InvalidConfigThrows) {
  TlsConfig cfg;
  cfg.withTlsMinVersion("SSL3");
  EXPECT_THROW(TlsClientContext{cfg}, std::invalid_argument);
}

TEST(TlsClientContext, InvalidCipherListThrows) {
  TlsConfig cfg;
  cfg.withCipherList("NOT-A-CIPHER");
  EXPECT_THROW(TlsClientContext{cfg}, std::runtime_error);
}

TEST(TlsClientContext, InvalidCaPemThrows) {
  TlsConfig cfg;
  cfg.withCaPem("this is not a certificate");
  EXPECT_THROW(TlsClientContext{cfg}, std::invalid_argument);
}

TEST(TlsClientContext, MissingCaFileThrows) {
  TlsConfig cfg;
  cfg.withCaFile("/nonexistent/ferry-ca.pem");
  EXPECT_THROW(TlsClientContext{cfg}, std::runtime_error);
}

TEST(TlsClientContext, NewSslSetsServerName) {
  TlsClientContext ctx{TlsConfig{}};
  SocketPair pair;
  ASSERT_TRUE(pair.first);
  auto ssl = ctx.newSsl(pair.first.fd(), "example.com");
  ASSERT_NE(ssl, nullptr);
  const char* serverName = ::SSL_get_servername(ssl.get(), TLSEXT_NAMETYPE_host_name);
  ASSERT_NE(serverName, nullptr);
  EXPECT_STREQ(serverName, "example.com");
  EXPECT_EQ(::SSL_get_fd(ssl.get()), pair.first.fd());
}

TEST(TlsClientContext, NoServerNameForIpLiteral) {
  TlsClientContext ctx{TlsConfig{}};
  SocketPair pair;
  ASSERT_TRUE(pair.first);
  auto ssl = ctx.newSsl(pair.first.fd(), "127.0.0.1");
  ASSERT_NE(ssl, nullptr);
  EXPECT_EQ(::SSL_get_servername(ssl.get(), TLSEXT_NAMETYPE_host_name), nullptr);
}

TEST(TlsClientContext, SniCanBeDisabled) {
  TlsConfig cfg;
  cfg.withSni(false);
  TlsClientContext ctx{cfg};
  SocketPair pair;
  ASSERT_TRUE(pair.first);
  auto ssl = ctx.newSsl(pair.first.fd(), "example.com");
  EXPECT_EQ(::SSL_get_servername(ssl.get(), TLSEXT_NAMETYPE_host_name), nullptr);
}

}  // namespace ferry
