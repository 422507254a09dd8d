#pragma once

#include <memory>
#include <string>
#include <string_view>

#include <openssl/evp.h>

namespace warden::federation {

struct EvpPkeyDeleter {
  void operator()(EVP_PKEY* key) const { EVP_PKEY_free(key); }
};

using EvpPkeyPtr = std::unique_ptr<EVP_PKEY, EvpPkeyDeleter>;

// SP certificate and RSA private key used to sign SLO redirect messages.
class SpSigningKey {
 public:
  // Accepts PEM or bare base64 DER. Keys are tried as PKCS#8 first, then
  // PKCS#1. Throws SamlError::Kind::Configuration.
  static std::shared_ptr<const SpSigningKey> Load(
      const std::string& certificate, const std::string& private_key);

  SpSigningKey(const SpSigningKey&) = delete;
  SpSigningKey& operator=(const SpSigningKey&) = delete;

  // Base64 DER, for KeyDescriptor elements.
  const std::string& certificate_base64() const { return certificate_base64_; }

  // RSASSA-PKCS1-v1_5 over SHA-256.
  std::string SignRsaSha256(std::string_view data) const;

 private:
  SpSigningKey(std::string certificate_base64, EvpPkeyPtr key);

  std::string certificate_base64_;
  EvpPkeyPtr key_;
};

// Checks an RSASSA-PKCS1-v1_5 SHA-256 signature with the public key of a
// base64 DER certificate. False for a bad signature or an unusable
// certificate.
bool VerifyRsaSha256(const std::string& certificate_base64,
                     std::string_view data, std::string_view signature);

}  // namespace warden::federation
