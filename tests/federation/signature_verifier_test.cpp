#include "signature_verifier.h"

#include <memory>
#include <string>

#include <gtest/gtest.h>
#include <openssl/bio.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <xsec/dsig/DSIGConstants.hpp>
#include <xsec/dsig/DSIGReference.hpp>
#include <xsec/dsig/DSIGSignature.hpp>
#include <xsec/enc/OpenSSL/OpenSSLCryptoKeyRSA.hpp>
#include <xsec/framework/XSECProvider.hpp>

#include "federation/saml_fixtures.h"
#include "xml_document.h"

namespace warden::federation {
namespace {

struct SignedResponse {
  XmlDocument document;
  xercesc::DOMElement* response = nullptr;
  xercesc::DOMElement* assertion = nullptr;
};

SignedResponse ParseResponse() {
  auto spec = testing::ValidSpec(FromUnixSeconds(1700000000));
  spec.sign_assertion = false;
  spec.sign_response = false;
  SignedResponse out{XmlDocument::Parse(testing::BuildResponseXml(spec))};
  out.response = out.document.root();
  out.assertion = FindChild(out.response, kSamlAssertionNs, "Assertion");
  XmlCh id("ID");
  out.response->setIdAttribute(id.get(), true);
  out.assertion->setIdAttribute(id.get(), true);
  return out;
}

EVP_PKEY* ReadTestKey() {
  const auto& pem = testing::TestSpCredentials().private_key_pem;
  BIO* bio = BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size()));
  EVP_PKEY* key = PEM_read_bio_PrivateKey(bio, nullptr, nullptr, nullptr);
  BIO_free(bio);
  return key;
}

// Signs the element whose ID is `reference_id` with the test key, using an
// enveloped-signature transform and exclusive c14n, and places the
// ds:Signature right after the Issuer of `parent`.
void SignInto(xercesc::DOMDocument* document, xercesc::DOMElement* parent,
              const std::string& reference_id) {
  XSECProvider provider;
  DSIGSignature* signature = provider.newSignature();
  XmlCh prefix("ds");
  signature->setDSIGNSPrefix(prefix.get());
  signature->setIdByAttributeName(false);
  xercesc::DOMElement* node = signature->createBlankSignature(
      document, DSIGConstants::s_unicodeStrURIEXC_C14N_NOC,
      DSIGConstants::s_unicodeStrURIRSA_SHA256);
  parent->insertBefore(
      node, FindChild(parent, kSamlAssertionNs, "Issuer")->getNextSibling());

  XmlCh uri("#" + reference_id);
  DSIGReference* reference = signature->createReference(
      uri.get(), DSIGConstants::s_unicodeStrURISHA256);
  reference->appendEnvelopedSignatureTransform();
  reference->appendCanonicalizationTransform(
      DSIGConstants::s_unicodeStrURIEXC_C14N_NOC);

  EVP_PKEY* key = ReadTestKey();
  signature->setSigningKey(new OpenSSLCryptoKeyRSA(key));
  EVP_PKEY_free(key);
  signature->sign();
  provider.releaseSignature(signature);
}

xercesc::DOMElement* SignatureOf(xercesc::DOMElement* parent) {
  return FindChild(parent, kXmlDsigNs, "Signature");
}

std::string Certificate() {
  return testing::TestSigningKey()->certificate_base64();
}

}  // namespace

TEST(XsecSignatureVerifierTest, AcceptsSignedResponse) {
  auto signed_response = ParseResponse();
  SignInto(signed_response.document.document(), signed_response.response,
           "_response-1");

  XsecSignatureVerifier verifier;
  std::string error;
  EXPECT_TRUE(verifier.Verify(signed_response.document.document(),
                              signed_response.response,
                              SignatureOf(signed_response.response),
                              Certificate(), &error))
      << error;
}

TEST(XsecSignatureVerifierTest, RejectsTamperedAssertion) {
  auto signed_response = ParseResponse();
  SignInto(signed_response.document.document(), signed_response.assertion,
           "_assertion-1");
  auto* subject =
      FindChild(signed_response.assertion, kSamlAssertionNs, "Subject");
  auto* name_id = FindChild(subject, kSamlAssertionNs, "NameID");
  XmlCh forged("mallory@example.com");
  name_id->setTextContent(forged.get());

  XsecSignatureVerifier verifier;
  std::string error;
  EXPECT_FALSE(verifier.Verify(signed_response.document.document(),
                               signed_response.assertion,
                               SignatureOf(signed_response.assertion),
                               Certificate(), &error));
  EXPECT_NE(error.find("verification failed"), std::string::npos) << error;
}

TEST(XsecSignatureVerifierTest, RejectsReferenceToAnotherElement) {
  auto signed_response = ParseResponse();
  // Valid signature over the assertion, presented as the response's.
  SignInto(signed_response.document.document(), signed_response.response,
           "_assertion-1");

  XsecSignatureVerifier verifier;
  std::string error;
  EXPECT_FALSE(verifier.Verify(signed_response.document.document(),
                               signed_response.response,
                               SignatureOf(signed_response.response),
                               Certificate(), &error));
  EXPECT_NE(error.find("does not reference element _response-1"),
            std::string::npos)
      << error;
}

TEST(XsecSignatureVerifierTest, RejectsSignatureOutsideSignedElement) {
  auto signed_response = ParseResponse();
  SignInto(signed_response.document.document(), signed_response.response,
           "_assertion-1");

  XsecSignatureVerifier verifier;
  std::string error;
  EXPECT_FALSE(verifier.Verify(signed_response.document.document(),
                               signed_response.assertion,
                               SignatureOf(signed_response.response),
                               Certificate(), &error));
  EXPECT_NE(error.find("not enveloped"), std::string::npos) << error;
}

TEST(XsecSignatureVerifierTest, RejectsForeignCertificate) {
  auto signed_response = ParseResponse();
  SignInto(signed_response.document.document(), signed_response.response,
           "_response-1");

  XsecSignatureVerifier verifier;
  std::string error;
  EXPECT_FALSE(verifier.Verify(signed_response.document.document(),
                               signed_response.response,
                               SignatureOf(signed_response.response),
                               testing::kFakeCertificate, &error));
  EXPECT_FALSE(verifier.Verify(signed_response.document.document(),
                               signed_response.response,
                               SignatureOf(signed_response.response), "",
                               &error));
  EXPECT_EQ(error, "IdP signing certificate is missing");
}

}  // namespace warden::federation
