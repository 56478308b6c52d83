#include "ferry/tls-config.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

namespace ferry {

TEST(TlsConfig, DefaultIsValid) {
  TlsConfig cfg;
  EXPECT_NO_THROW(cfg.validate());
  EXPECT_TRUE(cfg.verifyPeer);
  EXPECT_TRUE(cfg.verifyHostname);
}

TEST(TlsConfig, Versions) {
  TlsConfig cfg;
  cfg.withTlsMinVersion(TlsConfig::kTls12).withTlsMaxVersion(TlsConfig::kTls13);
  EXPECT_NO_THROW(cfg.validate());
  cfg.withTlsMinVersion(TlsConfig::kTls13).withTlsMaxVersion(TlsConfig::kTls12);
  EXPECT_THROW(cfg.validate(), std::invalid_argument);
  cfg.withTlsMinVersion("SSL3").withTlsMaxVersion("");
  EXPECT_THROW(cfg.validate(), std::invalid_argument);
}

TEST(TlsConfig, HostnameVerificationNeedsPeerVerification) {
  TlsConfig cfg;
  cfg.withVerifyPeer(false);
  EXPECT_THROW(cfg.validate(), std::invalid_argument);
  cfg.withVerifyHostname(false);
  EXPECT_NO_THROW(cfg.validate());
}

}  // namespace ferry
