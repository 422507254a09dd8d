#include "assertion_validator.h"

#include <chrono>
#include <memory>
#include <optional>

#include <gtest/gtest.h>

#include "federation/saml_fixtures.h"
#include "saml_error.h"
#include "warden/shared/replay_ledger.h"

namespace warden::federation {
namespace {

using testing::EncodeResponse;
using testing::FakeSignatureVerifier;
using testing::MakeProvider;
using testing::ResponseSpec;
using testing::ValidSpec;

struct Fixture {
  TimePoint now = FromUnixSeconds(1700000000);
  Clock clock = [this] { return now; };
  std::shared_ptr<FakeSignatureVerifier> verifier =
      std::make_shared<FakeSignatureVerifier>();
  std::shared_ptr<ReplayGuard> replay = std::make_shared<ReplayGuard>(
      shared::CreateReplayLedger(shared::SharedStoreConfig{}, clock),
      std::chrono::seconds(1), clock);
  AssertionValidator validator{verifier, replay, clock};
  std::shared_ptr<SamlProvider> provider = MakeProvider();

  SamlAssertion Validate(const ResponseSpec& spec,
                         const std::optional<std::string>& request_id =
                             std::nullopt) {
    return validator.Validate(*provider, EncodeResponse(spec), request_id);
  }

  SamlError::Kind FailureKind(const ResponseSpec& spec,
                              const std::optional<std::string>& request_id =
                                  std::nullopt) {
    try {
      Validate(spec, request_id);
    } catch (const SamlError& ex) {
      return ex.kind();
    }
    ADD_FAILURE() << "validation should have failed";
    return SamlError::Kind::Configuration;
  }
};

}  // namespace

TEST(AssertionValidatorTest, AcceptsValidUnsolicitedResponse) {
  Fixture f;
  const auto assertion = f.Validate(ValidSpec(f.now));

  EXPECT_EQ(assertion.id, "_assertion-1");
  EXPECT_EQ(assertion.issuer, testing::kIdpEntityId);
  EXPECT_EQ(assertion.name_id, "ada@example.com");
  EXPECT_EQ(assertion.name_id_format, kNameIdFormatEmail);
  EXPECT_EQ(assertion.session_index, "session-idx-1");
  EXPECT_EQ(assertion.not_on_or_after, f.now + std::chrono::minutes(5));
  EXPECT_EQ(f.verifier->calls(), 1);
  EXPECT_EQ(f.verifier->last_signed_element(), "Assertion");
  EXPECT_EQ(f.verifier->last_certificate(), testing::kFakeCertificate);
}

TEST(AssertionValidatorTest, AttributesAreIndexedByNameAndFriendlyName) {
  Fixture f;
  const auto assertion = f.Validate(ValidSpec(f.now));

  ASSERT_EQ(assertion.attributes.count(kDefaultEmailAttribute), 1u);
  ASSERT_EQ(assertion.attributes.count("email"), 1u);
  EXPECT_EQ(assertion.attributes.at("email").front(), "ada@example.com");
  EXPECT_EQ(assertion.attributes.at("displayName").front(), "Ada Lovelace");
  EXPECT_EQ(assertion.attributes.at("groups").size(), 2u);
}

TEST(AssertionValidatorTest, FallsBackToResponseSignature) {
  Fixture f;
  auto spec = ValidSpec(f.now);
  spec.sign_assertion = false;
  spec.sign_response = true;
  EXPECT_NO_THROW(f.Validate(spec));
  EXPECT_EQ(f.verifier->last_signed_element(), "Response");
}

TEST(AssertionValidatorTest, RejectsUnsignedAndBadlySignedResponses) {
  Fixture f;
  auto spec = ValidSpec(f.now);
  spec.sign_assertion = false;
  EXPECT_EQ(f.FailureKind(spec), SamlError::Kind::AssertionInvalid);

  auto rejecting = std::make_shared<FakeSignatureVerifier>(false);
  AssertionValidator strict(rejecting, f.replay, f.clock);
  EXPECT_THROW(strict.Validate(*f.provider, EncodeResponse(ValidSpec(f.now)),
                               std::nullopt),
               SamlError);
}

TEST(AssertionValidatorTest, TimeWindowIsEnforced) {
  Fixture f;
  auto early = ValidSpec(f.now);
  early.not_before = f.now + std::chrono::seconds(30);
  EXPECT_EQ(f.FailureKind(early), SamlError::Kind::AssertionInvalid);

  auto expired = ValidSpec(f.now);
  expired.assertion_id = "_expired";
  expired.not_on_or_after = f.now;
  EXPECT_EQ(f.FailureKind(expired), SamlError::Kind::AssertionExpired);
}

TEST(AssertionValidatorTest, AudienceMustNameThisServiceProvider) {
  Fixture f;
  auto spec = ValidSpec(f.now);
  spec.audience = "https://other.example.com/sp";
  EXPECT_EQ(f.FailureKind(spec), SamlError::Kind::AudienceMismatch);

  auto metadata_audience = ValidSpec(f.now);
  metadata_audience.assertion_id = "_metadata-audience";
  metadata_audience.audience = f.provider->sp.metadata_url;
  EXPECT_NO_THROW(f.Validate(metadata_audience));
}

TEST(AssertionValidatorTest, IssuerAndDestinationMustMatch) {
  Fixture f;
  auto wrong_issuer = ValidSpec(f.now);
  wrong_issuer.issuer = "https://evil.example.com";
  EXPECT_EQ(f.FailureKind(wrong_issuer), SamlError::Kind::AssertionInvalid);

  auto wrong_destination = ValidSpec(f.now);
  wrong_destination.destination = "https://evil.example.com/acs";
  EXPECT_EQ(f.FailureKind(wrong_destination),
            SamlError::Kind::AssertionInvalid);
}

TEST(AssertionValidatorTest, StructuralProblemsAreRejected) {
  Fixture f;
  auto failed_status = ValidSpec(f.now);
  failed_status.status = "urn:oasis:names:tc:SAML:2.0:status:Requester";
  EXPECT_EQ(f.FailureKind(failed_status), SamlError::Kind::AssertionInvalid);

  auto two_assertions = ValidSpec(f.now);
  two_assertions.assertion_count = 2;
  EXPECT_EQ(f.FailureKind(two_assertions), SamlError::Kind::AssertionInvalid);

  auto shared_id = ValidSpec(f.now);
  shared_id.assertion_id = shared_id.response_id;
  EXPECT_EQ(f.FailureKind(shared_id), SamlError::Kind::AssertionInvalid);

  auto no_conditions = ValidSpec(f.now);
  no_conditions.include_conditions = false;
  EXPECT_EQ(f.FailureKind(no_conditions), SamlError::Kind::AssertionInvalid);

  EXPECT_THROW(f.validator.Validate(*f.provider, "%%%", std::nullopt),
               SamlError);
}

TEST(AssertionValidatorTest, DoctypeIsRefused) {
  Fixture f;
  const std::string xml =
      "<?xml version=\"1.0\"?><!DOCTYPE r [<!ENTITY x \"y\">]>" +
      testing::BuildResponseXml(ValidSpec(f.now));
  try {
    f.validator.Validate(*f.provider, auth::Base64Encode(xml), std::nullopt);
    FAIL() << "DOCTYPE must be refused";
  } catch (const SamlError& ex) {
    EXPECT_EQ(ex.kind(), SamlError::Kind::AssertionInvalid);
  }
}

TEST(AssertionValidatorTest, SolicitedResponsesMustAnswerTheRequest) {
  Fixture f;
  auto spec = ValidSpec(f.now);
  spec.in_response_to = "_request-1";
  EXPECT_NO_THROW(f.Validate(spec, std::string("_request-1")));

  auto mismatched = ValidSpec(f.now);
  mismatched.assertion_id = "_assertion-2";
  mismatched.in_response_to = "_request-other";
  EXPECT_EQ(f.FailureKind(mismatched, std::string("_request-1")),
            SamlError::Kind::AssertionInvalid);

  auto unsolicited = ValidSpec(f.now);
  unsolicited.assertion_id = "_assertion-3";
  EXPECT_EQ(f.FailureKind(unsolicited, std::string("_request-1")),
            SamlError::Kind::AssertionInvalid);

  auto stray = ValidSpec(f.now);
  stray.assertion_id = "_assertion-4";
  stray.in_response_to = "_request-1";
  EXPECT_EQ(f.FailureKind(stray), SamlError::Kind::AssertionInvalid);
}

TEST(AssertionValidatorTest, ReplayIsRejectedAfterGraceWindow) {
  Fixture f;
  const auto spec = ValidSpec(f.now);
  EXPECT_NO_THROW(f.Validate(spec));

  f.now += std::chrono::milliseconds(500);
  EXPECT_NO_THROW(f.Validate(spec));

  f.now += std::chrono::seconds(2);
  EXPECT_EQ(f.FailureKind(spec), SamlError::Kind::AssertionReplayed);
}

}  // namespace warden::federation
