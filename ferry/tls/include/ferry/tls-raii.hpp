#pragma once

#include <openssl/bio.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>

#include <memory>
#include <new>

namespace ferry {

using SslCtxPtr = std::unique_ptr<SSL_CTX, decltype(&::SSL_CTX_free)>;
using SslPtr = std::unique_ptr<SSL, decltype(&::SSL_free)>;
using BioPtr = std::unique_ptr<BIO, decltype(&::BIO_free)>;
using X509Ptr = std::unique_ptr<X509, decltype(&::X509_free)>;

inline BioPtr MakeMemBio(const void* data, int len) {
  BIO* bio = ::BIO_new_mem_buf(data, len);
  if (bio == nullptr) {
    throw std::bad_alloc();
  }
  return {bio, ::BIO_free};
}

}  // namespace ferry
