#include "ferry/test-tls-helper.hpp"

#include <openssl/asn1.h>
#include <openssl/bio.h>
#include <openssl/evp.h>
#include <openssl/obj_mac.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>
#include <openssl/x509.h>
#include <openssl/x509v3.h>

#include <cstddef>
#include <memory>
#include <string>
#include <utility>

namespace ferry::test {

namespace {

using PkeyPtr = std::unique_ptr<EVP_PKEY, decltype(&::EVP_PKEY_free)>;
using PkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, decltype(&::EVP_PKEY_CTX_free)>;
using ExtPtr = std::unique_ptr<X509_EXTENSION, decltype(&::X509_EXTENSION_free)>;

PkeyPtr GenerateRsaKey() {
  EVP_PKEY* pkey = nullptr;
  PkeyCtxPtr kctx(::EVP_PKEY_CTX_new_from_name(nullptr, "RSA", nullptr), ::EVP_PKEY_CTX_free);
  if (kctx == nullptr) {
    return {nullptr, ::EVP_PKEY_free};
  }
  if (::EVP_PKEY_keygen_init(kctx.get()) != 1 || ::EVP_PKEY_CTX_set_rsa_keygen_bits(kctx.get(), 2048) != 1 ||
      ::EVP_PKEY_keygen(kctx.get(), &pkey) != 1) {
    return {nullptr, ::EVP_PKEY_free};
  }
  return {pkey, ::EVP_PKEY_free};
}

template <class WriteFunc>
std::string ToPem(WriteFunc writeFunc) {
  std::string pem;
  std::unique_ptr<BIO, decltype(&::BIO_free)> bio(::BIO_new(::BIO_s_mem()), ::BIO_free);
  if (bio != nullptr && writeFunc(bio.get()) == 1) {
    char* data = nullptr;
    const long len = BIO_get_mem_data(bio.get(), &data);
    pem.assign(data, static_cast<std::size_t>(len));
  }
  return pem;
}

}  // namespace

std::pair<std::string, std::string> MakeEphemeralCertKey(const char* commonName, int validSeconds) {
  auto pkey = GenerateRsaKey();
  if (!pkey) {
    return {"", ""};
  }

  std::unique_ptr<X509, decltype(&X509_free)> x509Ptr(X509_new(), &X509_free);
  X509* x509 = x509Ptr.get();
  if (x509 == nullptr) {
    return {"", ""};
  }
  X509_set_version(x509, 2);
  ASN1_INTEGER_set(X509_get_serialNumber(x509), 1);
  X509_gmtime_adj(X509_get_notBefore(x509), 0);
  X509_gmtime_adj(X509_get_notAfter(x509), validSeconds);
  X509_set_pubkey(x509, pkey.get());
  X509_NAME* name = X509_get_subject_name(x509);
  X509_NAME_add_entry_by_txt(name, "C", MBSTRING_ASC, reinterpret_cast<const unsigned char*>("XX"), -1, -1, 0);
  X509_NAME_add_entry_by_txt(name, "O", MBSTRING_ASC, reinterpret_cast<const unsigned char*>("FerryTest"), -1, -1, 0);
  X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC, reinterpret_cast<const unsigned char*>(commonName), -1, -1, 0);
  X509_set_issuer_name(x509, name);

  X509V3_CTX extCtx;
  X509V3_set_ctx_nodb(&extCtx);
  X509V3_set_ctx(&extCtx, x509, x509, nullptr, nullptr, 0);
  const std::string san = std::string("DNS:") + commonName + ",IP:127.0.0.1";
  ExtPtr ext(X509V3_EXT_conf_nid(nullptr, &extCtx, NID_subject_alt_name, san.c_str()), ::X509_EXTENSION_free);
  if (!ext || X509_add_ext(x509, ext.get(), -1) != 1) {
    return {"", ""};
  }

  if (X509_sign(x509, pkey.get(), EVP_sha256()) <= 0) {
    return {"", ""};
  }

  std::string certPem = ToPem([x509](BIO* bio) { return PEM_write_bio_X509(bio, x509); });
  std::string keyPem = ToPem([&pkey](BIO* bio) {
    return PEM_write_bio_PrivateKey(bio, pkey.get(), nullptr, nullptr, 0, nullptr, nullptr);
  });
  return {std::move(certPem), std::move(keyPem)};
}

}  // namespace ferry::test
