#include "sp_signing_key.h"

#include <functional>
#include <string>

#include <gtest/gtest.h>
#include <openssl/bio.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>

#include "federation/saml_fixtures.h"
#include "saml_error.h"

namespace warden::federation {
namespace {

SamlError::Kind FailureKind(const std::function<void()>& fn) {
  try {
    fn();
  } catch (const SamlError& ex) {
    return ex.kind();
  }
  ADD_FAILURE() << "call should have failed";
  return SamlError::Kind::ProviderNotFound;
}

std::string OtherPrivateKeyPem() {
  EVP_PKEY_CTX* ctx = EVP_PKEY_CTX_new_id(EVP_PKEY_RSA, nullptr);
  EVP_PKEY* key = nullptr;
  EVP_PKEY_keygen_init(ctx);
  EVP_PKEY_CTX_set_rsa_keygen_bits(ctx, 2048);
  EVP_PKEY_keygen(ctx, &key);
  EVP_PKEY_CTX_free(ctx);
  BIO* bio = BIO_new(BIO_s_mem());
  PEM_write_bio_PrivateKey(bio, key, nullptr, nullptr, 0, nullptr, nullptr);
  EVP_PKEY_free(key);
  return testing::DrainBio(bio);
}

}  // namespace

TEST(SpSigningKeyTest, SignaturesVerifyWithItsCertificate) {
  const auto key = testing::TestSigningKey();
  const auto signature = key->SignRsaSha256("SAMLRequest=abc&SigAlg=x");

  EXPECT_TRUE(VerifyRsaSha256(key->certificate_base64(),
                              "SAMLRequest=abc&SigAlg=x", signature));
  EXPECT_FALSE(VerifyRsaSha256(key->certificate_base64(),
                               "SAMLRequest=abd&SigAlg=x", signature));
  EXPECT_FALSE(VerifyRsaSha256(testing::kFakeCertificate,
                               "SAMLRequest=abc&SigAlg=x", signature));
  EXPECT_FALSE(VerifyRsaSha256("%%%", "SAMLRequest=abc&SigAlg=x", signature));
}

TEST(SpSigningKeyTest, AcceptsBareBase64Certificate) {
  const auto& credentials = testing::TestSpCredentials();
  const auto from_pem = testing::TestSigningKey();
  const auto from_der = SpSigningKey::Load(from_pem->certificate_base64(),
                                           credentials.private_key_pem);
  EXPECT_EQ(from_der->certificate_base64(), from_pem->certificate_base64());
}

TEST(SpSigningKeyTest, RejectsUnusableKeyMaterial) {
  const auto& credentials = testing::TestSpCredentials();
  EXPECT_EQ(FailureKind([&] {
              SpSigningKey::Load(credentials.certificate_pem, "");
            }),
            SamlError::Kind::Configuration);
  EXPECT_EQ(FailureKind([&] {
              SpSigningKey::Load(credentials.certificate_pem,
                                 OtherPrivateKeyPem());
            }),
            SamlError::Kind::Configuration);
  EXPECT_EQ(FailureKind([&] {
              SpSigningKey::Load("not a certificate",
                                 credentials.private_key_pem);
            }),
            SamlError::Kind::Configuration);
}

}  // namespace warden::federation
