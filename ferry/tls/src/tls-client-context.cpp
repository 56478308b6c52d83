#include "ferry/tls-client-context.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <openssl/err.h>
#include <openssl/pem.h>
#include <openssl/ssl.h>
#include <openssl/tls1.h>
#include <openssl/x509.h>
#include <openssl/x509_vfy.h>
#include <openssl/x509v3.h>

#include <new>
#include <stdexcept>
#include <string>
#include <string_view>

#include "ferry/log.hpp"
#include "ferry/tls-config.hpp"
#include "ferry/tls-raii.hpp"

namespace ferry {

namespace {

int ParseTlsVersion(std::string_view version) {
  if (version == TlsConfig::kTls12) {
    return TLS1_2_VERSION;
  }
  if (version == TlsConfig::kTls13) {
    return TLS1_3_VERSION;
  }
  return 0;
}

bool IsIpLiteral(const std::string& host) {
  in6_addr addr6{};
  in_addr addr4{};
  return ::inet_pton(AF_INET, host.c_str(), &addr4) == 1 || ::inet_pton(AF_INET6, host.c_str(), &addr6) == 1;
}

void ConfigureProtocolBounds(SSL_CTX* ctx, const TlsConfig& cfg) {
  if (!cfg.minVersion.empty()) {
    const int version = ParseTlsVersion(cfg.minVersion);
    if (version == 0 || ::SSL_CTX_set_min_proto_version(ctx, version) != 1) {
      throw std::runtime_error("Failed to set minimum TLS version");
    }
  }
  if (!cfg.maxVersion.empty()) {
    const int version = ParseTlsVersion(cfg.maxVersion);
    if (version == 0 || ::SSL_CTX_set_max_proto_version(ctx, version) != 1) {
      throw std::runtime_error("Failed to set maximum TLS version");
    }
  }
}

void AddPemCertificates(SSL_CTX* ctx, std::string_view pem) {
  auto bio = MakeMemBio(pem.data(), static_cast<int>(pem.size()));
  X509_STORE* store = ::SSL_CTX_get_cert_store(ctx);
  if (store == nullptr) {
    throw std::runtime_error("No cert store available in SSL_CTX");
  }
  int nbCerts = 0;
  while (true) {
    X509Ptr cert(::PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr), ::X509_free);
    if (!cert) {
      break;
    }
    if (::X509_STORE_add_cert(store, cert.get()) != 1) {
      throw std::runtime_error("Failed to add trusted certificate to store");
    }
    ++nbCerts;
  }
  // the loop stops on the expected 'no start line' error at the end of the PEM data
  ::ERR_clear_error();
  if (nbCerts == 0) {
    throw std::invalid_argument("No certificate found in CA PEM");
  }
}

void ConfigureVerification(SSL_CTX* ctx, const TlsConfig& cfg) {
  if (!cfg.verifyPeer) {
    ::SSL_CTX_set_verify(ctx, SSL_VERIFY_NONE, nullptr);
    return;
  }
  ::SSL_CTX_set_verify(ctx, SSL_VERIFY_PEER, nullptr);
  if (cfg.useDefaultVerifyPaths && ::SSL_CTX_set_default_verify_paths(ctx) != 1) {
    log::warn("Unable to load the default trust store: {}", DrainOpenSslErrors());
  }
  if (!cfg.caFile.empty() || !cfg.caPath.empty()) {
    const char* caFile = cfg.caFile.empty() ? nullptr : cfg.caFile.c_str();
    const char* caPath = cfg.caPath.empty() ? nullptr : cfg.caPath.c_str();
    if (::SSL_CTX_load_verify_locations(ctx, caFile, caPath) != 1) {
      throw std::runtime_error("Failed to load CA file or directory: " + DrainOpenSslErrors());
    }
  }
  if (!cfg.caPem.empty()) {
    AddPemCertificates(ctx, cfg.caPem);
  }
}

}  // namespace

std::string DrainOpenSslErrors() {
  std::string ret;
  for (auto errVal = ::ERR_get_error(); errVal != 0; errVal = ::ERR_get_error()) {
    char errBuf[256];
    ::ERR_error_string_n(errVal, errBuf, sizeof(errBuf));
    if (!ret.empty()) {
      ret.append("; ");
    }
    ret.append(errBuf);
  }
  return ret;
}

TlsClientContext::TlsClientContext(const TlsConfig& config)
    : _ctx(::SSL_CTX_new(::TLS_client_method()), ::SSL_CTX_free),
      _verifyPeer(config.verifyPeer),
      _verifyHostname(config.verifyHostname),
      _sni(config.sni) {
  if (!_ctx) {
    throw std::bad_alloc();
  }
  config.validate();

  ConfigureProtocolBounds(_ctx.get(), config);
  if (!config.cipherList.empty() && ::SSL_CTX_set_cipher_list(_ctx.get(), config.cipherList.c_str()) != 1) {
    throw std::runtime_error("Failed to set cipher list");
  }
  ConfigureVerification(_ctx.get(), config);
  ::SSL_CTX_set_mode(_ctx.get(), SSL_MODE_ENABLE_PARTIAL_WRITE | SSL_MODE_ACCEPT_MOVING_WRITE_BUFFER);
}

SslPtr TlsClientContext::newSsl(int fd, std::string_view host) const {
  SslPtr ssl(::SSL_new(_ctx.get()), ::SSL_free);
  if (!ssl) {
    throw std::bad_alloc();
  }
  if (::SSL_set_fd(ssl.get(), fd) != 1) {
    throw std::runtime_error("SSL_set_fd failed");
  }
  ::SSL_set_connect_state(ssl.get());

  const std::string hostStr(host);
  const bool ipLiteral = IsIpLiteral(hostStr);
  if (_sni && !ipLiteral && ::SSL_set_tlsext_host_name(ssl.get(), hostStr.c_str()) != 1) {
    throw std::runtime_error("Failed to set TLS server name indication");
  }
  if (_verifyPeer && _verifyHostname) {
    if (ipLiteral) {
      X509_VERIFY_PARAM* param = ::SSL_get0_param(ssl.get());
      if (::X509_VERIFY_PARAM_set1_ip_asc(param, hostStr.c_str()) != 1) {
        throw std::runtime_error("Failed to set expected peer IP address");
      }
    } else {
      ::SSL_set_hostflags(ssl.get(), X509_CHECK_FLAG_NO_PARTIAL_WILDCARDS);
      if (::SSL_set1_host(ssl.get(), hostStr.c_str()) != 1) {
        throw std::runtime_error("Failed to set expected peer host name");
      }
    }
  }
  return ssl;
}

}  // namespace ferry
