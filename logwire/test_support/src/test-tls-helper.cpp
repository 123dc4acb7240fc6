#include "logwire/test-tls-helper.hpp"

#include <openssl/asn1.h>
#include <openssl/bio.h>
#include <openssl/ec.h>
#include <openssl/evp.h>
#include <openssl/obj_mac.h>
#include <openssl/pem.h>
#include <openssl/x509.h>

#include <cstddef>
#include <memory>
#include <string>
#include <utility>

namespace logwire::test {

namespace {

using PkeyPtr = std::unique_ptr<EVP_PKEY, decltype(&::EVP_PKEY_free)>;
using PkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, decltype(&::EVP_PKEY_CTX_free)>;
using BioPtr = std::unique_ptr<BIO, decltype(&::BIO_free)>;

PkeyPtr GenerateEcKey() {
  EVP_PKEY* pkey = nullptr;
  PkeyCtxPtr kctx(::EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr), ::EVP_PKEY_CTX_free);
  if (kctx == nullptr || ::EVP_PKEY_keygen_init(kctx.get()) != 1 ||
      ::EVP_PKEY_CTX_set_ec_paramgen_curve_nid(kctx.get(), NID_X9_62_prime256v1) != 1 ||
      ::EVP_PKEY_keygen(kctx.get(), &pkey) != 1) {
    return {nullptr, ::EVP_PKEY_free};
  }
  return {pkey, ::EVP_PKEY_free};
}

template <class WriteFn>
std::string ToPem(WriteFn writeFn) {
  BioPtr bio(::BIO_new(::BIO_s_mem()), ::BIO_free);
  if (bio == nullptr || writeFn(bio.get()) != 1) {
    return {};
  }
  char* data = nullptr;
  const long len = BIO_get_mem_data(bio.get(), &data);
  return {data, static_cast<std::size_t>(len)};
}

}  // namespace

std::pair<std::string, std::string> MakeEphemeralCertKey(const char* commonName, int validSeconds) {
  auto pkey = GenerateEcKey();
  if (!pkey) {
    return {};
  }

  std::unique_ptr<X509, decltype(&::X509_free)> x509(::X509_new(), ::X509_free);
  if (x509 == nullptr) {
    return {};
  }
  ::X509_set_version(x509.get(), 2);
  ::ASN1_INTEGER_set(::X509_get_serialNumber(x509.get()), 1);
  ::X509_gmtime_adj(X509_get_notBefore(x509.get()), 0);
  ::X509_gmtime_adj(X509_get_notAfter(x509.get()), validSeconds);
  ::X509_set_pubkey(x509.get(), pkey.get());
  X509_NAME* name = ::X509_get_subject_name(x509.get());
  ::X509_NAME_add_entry_by_txt(name, "O", MBSTRING_ASC, reinterpret_cast<const unsigned char*>("LogwireTest"), -1, -1,
                               0);
  ::X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC, reinterpret_cast<const unsigned char*>(commonName), -1, -1,
                               0);
  ::X509_set_issuer_name(x509.get(), name);
  if (::X509_sign(x509.get(), pkey.get(), ::EVP_sha256()) <= 0) {
    return {};
  }

  std::string certPem = ToPem([&](BIO* bio) { return ::PEM_write_bio_X509(bio, x509.get()); });
  std::string keyPem = ToPem(
      [&](BIO* bio) { return ::PEM_write_bio_PrivateKey(bio, pkey.get(), nullptr, nullptr, 0, nullptr, nullptr); });
  return {std::move(certPem), std::move(keyPem)};
}

}  // namespace logwire::test
