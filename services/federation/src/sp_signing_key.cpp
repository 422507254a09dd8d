#include "sp_signing_key.h"

#include <stdexcept>
#include <utility>
#include <vector>

#include <openssl/pem.h>
#include <openssl/x509.h>

#include "saml_error.h"
#include "warden/auth/encoding.h"

namespace warden::federation {
namespace {

struct BioDeleter {
  void operator()(BIO* bio) const { BIO_free(bio); }
};

struct X509Deleter {
  void operator()(X509* cert) const { X509_free(cert); }
};

struct Pkcs8Deleter {
  void operator()(PKCS8_PRIV_KEY_INFO* info) const {
    PKCS8_PRIV_KEY_INFO_free(info);
  }
};

struct MdCtxDeleter {
  void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

using X509Ptr = std::unique_ptr<X509, X509Deleter>;

[[noreturn]] void Fail(const std::string& message) {
  throw SamlError(SamlError::Kind::Configuration, message);
}

bool IsPem(const std::string& value) {
  return value.find("-----BEGIN") != std::string::npos;
}

std::unique_ptr<BIO, BioDeleter> MemoryBio(const std::string& data) {
  std::unique_ptr<BIO, BioDeleter> bio(
      BIO_new_mem_buf(data.data(), static_cast<int>(data.size())));
  if (!bio) {
    Fail("failed to allocate BIO");
  }
  return bio;
}

std::string DecodeDer(const std::string& value, const char* what) {
  try {
    return auth::Base64Decode(value);
  } catch (const std::invalid_argument&) {
    Fail(std::string(what) + " is neither PEM nor base64 DER");
  }
}

X509Ptr LoadCertificate(const std::string& value) {
  if (IsPem(value)) {
    auto bio = MemoryBio(value);
    X509Ptr cert(PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr));
    if (!cert) {
      Fail("invalid SP certificate PEM");
    }
    return cert;
  }
  const auto der = DecodeDer(value, "SP certificate");
  const auto* cursor = reinterpret_cast<const unsigned char*>(der.data());
  X509Ptr cert(d2i_X509(nullptr, &cursor, static_cast<long>(der.size())));
  if (!cert) {
    Fail("invalid SP certificate DER");
  }
  return cert;
}

EvpPkeyPtr LoadPrivateKey(const std::string& value) {
  if (IsPem(value)) {
    auto bio = MemoryBio(value);
    EvpPkeyPtr key(
        PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr));
    if (!key) {
      Fail("invalid SP private key PEM");
    }
    return key;
  }

  const auto der = DecodeDer(value, "SP private key");
  const auto* cursor = reinterpret_cast<const unsigned char*>(der.data());
  std::unique_ptr<PKCS8_PRIV_KEY_INFO, Pkcs8Deleter> pkcs8(
      d2i_PKCS8_PRIV_KEY_INFO(nullptr, &cursor, static_cast<long>(der.size())));
  if (pkcs8) {
    EvpPkeyPtr key(EVP_PKCS82PKEY(pkcs8.get()));
    if (key) {
      return key;
    }
  }
  cursor = reinterpret_cast<const unsigned char*>(der.data());
  EvpPkeyPtr key(d2i_PrivateKey(EVP_PKEY_RSA, nullptr, &cursor,
                                static_cast<long>(der.size())));
  if (!key) {
    Fail("SP private key is neither PKCS#8 nor PKCS#1");
  }
  return key;
}

std::string CertificateBase64(X509* cert) {
  const int length = i2d_X509(cert, nullptr);
  if (length <= 0) {
    Fail("failed to encode SP certificate");
  }
  std::string der(static_cast<size_t>(length), '\0');
  auto* cursor = reinterpret_cast<unsigned char*>(der.data());
  if (i2d_X509(cert, &cursor) != length) {
    Fail("failed to encode SP certificate");
  }
  return auth::Base64Encode(der);
}

}  // namespace

std::shared_ptr<const SpSigningKey> SpSigningKey::Load(
    const std::string& certificate, const std::string& private_key) {
  if (certificate.empty() || private_key.empty()) {
    Fail("SP signing requires both certificate and private key");
  }
  auto cert = LoadCertificate(certificate);
  auto key = LoadPrivateKey(private_key);
  if (EVP_PKEY_base_id(key.get()) != EVP_PKEY_RSA) {
    Fail("SP private key must be RSA");
  }
  if (X509_check_private_key(cert.get(), key.get()) != 1) {
    Fail("SP private key does not match certificate");
  }
  auto certificate_base64 = CertificateBase64(cert.get());
  return std::shared_ptr<const SpSigningKey>(
      new SpSigningKey(std::move(certificate_base64), std::move(key)));
}

SpSigningKey::SpSigningKey(std::string certificate_base64, EvpPkeyPtr key)
    : certificate_base64_(std::move(certificate_base64)),
      key_(std::move(key)) {}

std::string SpSigningKey::SignRsaSha256(std::string_view data) const {
  std::unique_ptr<EVP_MD_CTX, MdCtxDeleter> ctx(EVP_MD_CTX_new());
  if (!ctx) {
    Fail("failed to allocate digest context");
  }
  if (EVP_DigestSignInit(ctx.get(), nullptr, EVP_sha256(), nullptr,
                         key_.get()) != 1) {
    Fail("failed to initialize RSA-SHA256 signing");
  }
  size_t length = 0;
  const auto* input = reinterpret_cast<const unsigned char*>(data.data());
  if (EVP_DigestSign(ctx.get(), nullptr, &length, input, data.size()) != 1) {
    Fail("failed to size RSA-SHA256 signature");
  }
  std::vector<unsigned char> signature(length);
  if (EVP_DigestSign(ctx.get(), signature.data(), &length, input,
                     data.size()) != 1) {
    Fail("failed to compute RSA-SHA256 signature");
  }
  return std::string(reinterpret_cast<const char*>(signature.data()), length);
}

bool VerifyRsaSha256(const std::string& certificate_base64,
                     std::string_view data, std::string_view signature) {
  std::string der;
  try {
    der = auth::Base64Decode(certificate_base64);
  } catch (const std::invalid_argument&) {
    return false;
  }
  const auto* cursor = reinterpret_cast<const unsigned char*>(der.data());
  X509Ptr cert(d2i_X509(nullptr, &cursor, static_cast<long>(der.size())));
  if (!cert) {
    return false;
  }
  EvpPkeyPtr key(X509_get_pubkey(cert.get()));
  if (!key || EVP_PKEY_base_id(key.get()) != EVP_PKEY_RSA) {
    return false;
  }
  std::unique_ptr<EVP_MD_CTX, MdCtxDeleter> ctx(EVP_MD_CTX_new());
  if (!ctx || EVP_DigestVerifyInit(ctx.get(), nullptr, EVP_sha256(), nullptr,
                                   key.get()) != 1) {
    return false;
  }
  return EVP_DigestVerify(
             ctx.get(),
             reinterpret_cast<const unsigned char*>(signature.data()),
             signature.size(),
             reinterpret_cast<const unsigned char*>(data.data()),
             data.size()) == 1;
}

}  // namespace warden::federation
