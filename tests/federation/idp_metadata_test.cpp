#include "idp_metadata.h"

#include <string>

#include <gtest/gtest.h>

#include "federation/saml_fixtures.h"
#include "saml_error.h"

namespace warden::federation {
namespace {

SamlError::Kind ParseFailure(const std::string& xml) {
  try {
    ParseIdpMetadata(xml);
  } catch (const SamlError& ex) {
    return ex.kind();
  }
  ADD_FAILURE() << "metadata should have been rejected";
  return SamlError::Kind::Configuration;
}

std::string Replace(std::string text, const std::string& from,
                    const std::string& to) {
  const auto pos = text.find(from);
  if (pos != std::string::npos) {
    text.replace(pos, from.size(), to);
  }
  return text;
}

}  // namespace

TEST(IdpMetadataTest, ParsesEntityDescriptor) {
  const auto idp = ParseIdpMetadata(testing::IdpMetadataXml());
  EXPECT_EQ(idp.entity_id, testing::kIdpEntityId);
  EXPECT_EQ(idp.sso_url, "https://idp.example.com/sso");
  EXPECT_EQ(idp.sso_binding, SamlBinding::HttpRedirect);
  EXPECT_EQ(idp.slo_url, "https://idp.example.com/slo");
  EXPECT_EQ(idp.slo_binding, SamlBinding::HttpRedirect);
  EXPECT_EQ(idp.signing_certificate, testing::kFakeCertificate);
}

TEST(IdpMetadataTest, FallsBackToPostBinding) {
  const auto xml =
      Replace(testing::IdpMetadataXml(),
              std::string("<md:SingleSignOnService Binding=\"") +
                  kBindingHttpRedirect +
                  "\" Location=\"https://idp.example.com/sso\"/>",
              "");
  const auto idp = ParseIdpMetadata(xml);
  EXPECT_EQ(idp.sso_url, "https://idp.example.com/sso/post");
  EXPECT_EQ(idp.sso_binding, SamlBinding::HttpPost);
}

TEST(IdpMetadataTest, PicksIdpFromEntitiesDescriptor) {
  auto entity = testing::IdpMetadataXml("https://second.example.com");
  entity = Replace(entity,
                   " xmlns:md=\"urn:oasis:names:tc:SAML:2.0:metadata\"", "");
  entity = Replace(entity, " xmlns:ds=\"http://www.w3.org/2000/09/xmldsig#\"",
                   "");
  const std::string xml =
      "<md:EntitiesDescriptor xmlns:md=\"urn:oasis:names:tc:SAML:2.0:metadata\""
      " xmlns:ds=\"http://www.w3.org/2000/09/xmldsig#\">"
      "<md:EntityDescriptor entityID=\"https://sp-only.example.com\">"
      "<md:SPSSODescriptor/></md:EntityDescriptor>" +
      entity + "</md:EntitiesDescriptor>";

  const auto idp = ParseIdpMetadata(xml);
  EXPECT_EQ(idp.entity_id, "https://second.example.com");
}

TEST(IdpMetadataTest, EncryptionOnlyKeysDoNotCount) {
  const auto xml = Replace(testing::IdpMetadataXml(), "use=\"signing\"",
                           "use=\"encryption\"");
  EXPECT_EQ(ParseFailure(xml), SamlError::Kind::MetadataParseFailed);
}

TEST(IdpMetadataTest, RejectsMalformedDocuments) {
  EXPECT_EQ(ParseFailure("<not-xml"), SamlError::Kind::MetadataParseFailed);
  EXPECT_EQ(ParseFailure("<root/>"), SamlError::Kind::MetadataParseFailed);
  EXPECT_EQ(ParseFailure("<!DOCTYPE x [<!ENTITY e SYSTEM \"file:///etc/passwd\">]>" +
                         testing::IdpMetadataXml()),
            SamlError::Kind::MetadataParseFailed);
  EXPECT_EQ(ParseFailure(Replace(testing::IdpMetadataXml(),
                                 std::string("entityID=\"") +
                                     testing::kIdpEntityId + "\"",
                                 "")),
            SamlError::Kind::MetadataParseFailed);
  auto artifact_only = testing::IdpMetadataXml();
  artifact_only = Replace(artifact_only,
                          std::string("<md:SingleSignOnService Binding=\"") +
                              kBindingHttpPost,
                          "<md:SingleSignOnService Binding=\"urn:example:a");
  artifact_only = Replace(artifact_only,
                          std::string("<md:SingleSignOnService Binding=\"") +
                              kBindingHttpRedirect,
                          "<md:SingleSignOnService Binding=\"urn:example:b");
  EXPECT_EQ(ParseFailure(artifact_only), SamlError::Kind::MetadataParseFailed);
}

TEST(IdpMetadataTest, MetadataUrlMustBeHttps) {
  EXPECT_NO_THROW(ValidateMetadataUrl("https://idp.example.com/md", false));
  EXPECT_NO_THROW(ValidateMetadataUrl("HTTPS://idp.example.com/md", false));
  EXPECT_NO_THROW(ValidateMetadataUrl("http://idp.internal/md", true));
  try {
    ValidateMetadataUrl("http://idp.example.com/md", false);
    FAIL() << "plain http must be refused";
  } catch (const SamlError& ex) {
    EXPECT_EQ(ex.kind(), SamlError::Kind::MetadataInsecureURL);
  }
  EXPECT_THROW(ValidateMetadataUrl("idp.example.com/md", true), SamlError);
}

}  // namespace warden::federation
