#include "saml_engine.h"

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "federation/saml_fixtures.h"
#include "redirect_binding.h"
#include "saml_error.h"
#include "warden/auth/encoding.h"
#include "warden/shared/replay_ledger.h"
#include "warden/token/token_codec.h"

namespace warden::federation {
namespace {

constexpr char kSecret[] = "federation-engine-test-secret-0123456789";

struct Fixture {
  TimePoint now = FromUnixSeconds(1700000000);
  Clock clock = [this] { return now; };
  std::shared_ptr<InMemoryProviderRegistry> registry =
      std::make_shared<InMemoryProviderRegistry>();
  std::shared_ptr<shared::StateStore> states = MakeStateStore();
  std::shared_ptr<shared::RevocationLedger> revocation = MakeRevocation();
  std::shared_ptr<SamlSessionIndex> sessions =
      std::make_shared<SamlSessionIndex>(clock);
  std::shared_ptr<InMemoryIdentityLinker> linker =
      std::make_shared<InMemoryIdentityLinker>();
  std::shared_ptr<token::TokenIssuer> issuer =
      std::make_shared<token::TokenIssuer>(
          std::make_shared<token::TokenCodec>(kSecret, clock));
  std::shared_ptr<testing::FakeSignatureVerifier> verifier =
      std::make_shared<testing::FakeSignatureVerifier>();
  std::shared_ptr<AssertionValidator> validator =
      std::make_shared<AssertionValidator>(
          verifier,
          std::make_shared<ReplayGuard>(
              shared::CreateReplayLedger(shared::SharedStoreConfig{}, clock),
              std::chrono::seconds(1), clock),
          clock);
  SamlEngine engine{SamlEngineDeps{registry, states, validator, linker,
                                   issuer, revocation, sessions, clock}};

  std::shared_ptr<shared::StateStore> MakeStateStore() {
    shared::StateStoreOptions options;
    options.background_cleanup = false;
    options.clock = [this] { return now; };
    return shared::CreateStateStore(shared::SharedStoreConfig{}, options);
  }

  std::shared_ptr<shared::RevocationLedger> MakeRevocation() {
    shared::RevocationLedgerOptions options;
    options.clock = [this] { return now; };
    return shared::CreateRevocationLedger(shared::SharedStoreConfig{},
                                          options);
  }

  std::string SolicitedResponse(const SamlLoginStart& start,
                                const std::string& assertion_id) {
    auto spec = testing::ValidSpec(now);
    spec.assertion_id = assertion_id;
    spec.in_response_to = start.request_id;
    return testing::EncodeResponse(spec);
  }

  SamlLoginResult Login(const std::string& provider = "okta") {
    const auto start = engine.BeginLogin(provider, "/after");
    return engine.CompleteLogin(
        provider, SolicitedResponse(start, "_login-" + start.request_id),
        start.relay_state);
  }
};

SamlError::Kind FailureKind(const std::function<void()>& fn) {
  try {
    fn();
  } catch (const SamlError& ex) {
    return ex.kind();
  }
  ADD_FAILURE() << "call should have failed";
  return SamlError::Kind::Configuration;
}

std::string IdpLogoutRequestXml(const std::string& name_id,
                                const std::string& session_index,
                                bool enveloped_signature = false) {
  std::string xml = "<samlp:LogoutRequest xmlns:samlp=\"";
  xml += kSamlProtocolNs;
  xml += "\" xmlns:saml=\"";
  xml += kSamlAssertionNs;
  xml += "\" ID=\"_idp-logout-7\" Version=\"2.0\"><saml:Issuer>";
  xml += testing::kIdpEntityId;
  xml += "</saml:Issuer>";
  if (enveloped_signature) {
    xml += testing::SignatureStub();
  }
  xml += "<saml:NameID>" + name_id + "</saml:NameID>";
  if (!session_index.empty()) {
    xml += "<samlp:SessionIndex>" + session_index + "</samlp:SessionIndex>";
  }
  xml += "</samlp:LogoutRequest>";
  return xml;
}

std::string SignedLogoutQuery(const std::string& name_id,
                              const std::string& session_index,
                              const std::string& relay_state) {
  return testing::SignedRedirectQuery(
      "SAMLRequest", IdpLogoutRequestXml(name_id, session_index), relay_state);
}

std::string IdpLogoutResponse(const std::string& in_response_to) {
  std::string xml = "<samlp:LogoutResponse xmlns:samlp=\"";
  xml += kSamlProtocolNs;
  xml += "\" xmlns:saml=\"";
  xml += kSamlAssertionNs;
  xml += "\" ID=\"_idp-resp\" Version=\"2.0\" InResponseTo=\"" +
         in_response_to + "\"><saml:Issuer>";
  xml += testing::kIdpEntityId;
  xml += "</saml:Issuer><samlp:Status><samlp:StatusCode Value=\"";
  xml += kStatusSuccess;
  xml += "\"/></samlp:Status></samlp:LogoutResponse>";
  return EncodeRedirectPayload(xml);
}

}  // namespace

TEST(SamlEngineTest, BeginLoginStoresRelayState) {
  Fixture f;
  f.registry->Register(testing::MakeProvider());

  const auto start = f.engine.BeginLogin("okta", "https://app.example.com/x");
  EXPECT_EQ(start.binding, SamlBinding::HttpRedirect);
  EXPECT_EQ(start.url.rfind("https://idp.example.com/sso?SAMLRequest=", 0),
            0u);
  EXPECT_NE(start.url.find("RelayState=" + auth::UrlEncode(start.relay_state)),
            std::string::npos);

  const auto entry = f.states->ValidateAndConsume(start.relay_state);
  ASSERT_TRUE(entry.has_value());
  EXPECT_EQ(entry->provider, "okta");
  EXPECT_EQ(entry->nonce, start.request_id);
  EXPECT_EQ(entry->redirect_uri, "https://app.example.com/x");
}

TEST(SamlEngineTest, BeginLoginValidatesRedirect) {
  Fixture f;
  f.registry->Register(testing::MakeProvider());
  EXPECT_EQ(FailureKind([&] { f.engine.BeginLogin("okta", "https://evil.com"); }),
            SamlError::Kind::InvalidRedirect);
  EXPECT_EQ(FailureKind([&] { f.engine.BeginLogin("missing", ""); }),
            SamlError::Kind::ProviderNotFound);
}

TEST(SamlEngineTest, CompleteLoginIssuesTokensAndRecordsSession) {
  Fixture f;
  f.registry->Register(testing::MakeProvider());

  const auto result = f.Login();
  EXPECT_EQ(result.provider, "okta");
  EXPECT_TRUE(result.user.created);
  EXPECT_EQ(result.user.email, "ada@example.com");
  EXPECT_EQ(result.info.name, "Ada Lovelace");
  EXPECT_EQ(result.groups, (std::vector<std::string>{"staff", "engineering"}));
  EXPECT_EQ(result.redirect_to, "/after");

  const auto& access = result.tokens.access.claims;
  EXPECT_EQ(access.subject, result.user.user_id);
  EXPECT_EQ(access.email, "ada@example.com");
  EXPECT_EQ(access.role, "authenticated");
  EXPECT_NE(access.app_metadata.find("saml:okta"), std::string::npos);
  EXPECT_EQ(result.tokens.refresh.claims.session_id, access.session_id);

  const auto session = f.sessions->FindByUser("okta", result.user.user_id);
  ASSERT_TRUE(session.has_value());
  EXPECT_EQ(session->id, result.saml_session_id);
  EXPECT_EQ(session->name_id, "ada@example.com");
  EXPECT_EQ(session->session_index, "session-idx-1");
}

TEST(SamlEngineTest, SecondLoginLinksToSameUser) {
  Fixture f;
  f.registry->Register(testing::MakeProvider());
  const auto first = f.Login();
  const auto second = f.Login();
  EXPECT_FALSE(second.user.created);
  EXPECT_EQ(second.user.user_id, first.user.user_id);
}

TEST(SamlEngineTest, RelayStateIsSingleUseAndProviderBound) {
  Fixture f;
  f.registry->Register(testing::MakeProvider("okta"));
  f.registry->Register(testing::MakeProvider("azure"));

  const auto start = f.engine.BeginLogin("okta", "");
  EXPECT_EQ(FailureKind([&] {
              f.engine.CompleteLogin("azure", f.SolicitedResponse(start, "_a1"),
                                     start.relay_state);
            }),
            SamlError::Kind::StateInvalid);
  EXPECT_EQ(FailureKind([&] {
              f.engine.CompleteLogin("okta", f.SolicitedResponse(start, "_a2"),
                                     start.relay_state);
            }),
            SamlError::Kind::StateInvalid);
  EXPECT_EQ(FailureKind([&] {
              f.engine.CompleteLogin("okta", f.SolicitedResponse(start, "_a3"),
                                     "never-issued");
            }),
            SamlError::Kind::StateInvalid);
}

TEST(SamlEngineTest, ExpiredRelayStateIsRejected) {
  Fixture f;
  f.registry->Register(testing::MakeProvider());
  const auto start = f.engine.BeginLogin("okta", "");
  f.now += std::chrono::minutes(11);
  EXPECT_EQ(FailureKind([&] {
              f.engine.CompleteLogin("okta", f.SolicitedResponse(start, "_a1"),
                                     start.relay_state);
            }),
            SamlError::Kind::StateInvalid);
}

TEST(SamlEngineTest, IdpInitiatedLoginNeedsOptIn) {
  Fixture f;
  auto provider = testing::MakeProvider();
  f.registry->Register(provider);
  const auto unsolicited = testing::EncodeResponse(testing::ValidSpec(f.now));

  EXPECT_EQ(FailureKind([&] {
              f.engine.CompleteLogin("okta", unsolicited, "/welcome");
            }),
            SamlError::Kind::StateInvalid);

  auto permissive = testing::MakeProvider();
  permissive->config.allow_idp_initiated = true;
  f.registry->Register(permissive);
  const auto result = f.engine.CompleteLogin("okta", unsolicited, "/welcome");
  EXPECT_EQ(result.redirect_to, "/welcome");

  auto evil = testing::ValidSpec(f.now);
  evil.assertion_id = "_evil";
  EXPECT_EQ(FailureKind([&] {
              f.engine.CompleteLogin("okta", testing::EncodeResponse(evil),
                                     "https://evil.com/");
            }),
            SamlError::Kind::InvalidRedirect);
}

TEST(SamlEngineTest, GroupRulesAndProvisioningAreEnforced) {
  Fixture f;
  auto denied = testing::MakeProvider();
  denied->config.group_rules.denied = {"staff"};
  f.registry->Register(denied);
  EXPECT_EQ(FailureKind([&] { f.Login(); }),
            SamlError::Kind::GroupAccessDenied);

  auto closed = testing::MakeProvider();
  closed->config.auto_create_users = false;
  f.registry->Register(closed);
  EXPECT_EQ(FailureKind([&] { f.Login(); }),
            SamlError::Kind::UserNotProvisioned);

  LinkedUser existing;
  existing.user_id = "user-ada";
  existing.email = "ADA@example.com";
  existing.role = "admin";
  f.linker->AddUser(existing);
  const auto result = f.Login();
  EXPECT_EQ(result.user.user_id, "user-ada");
  EXPECT_EQ(result.tokens.access.claims.role, "admin");
}

TEST(SamlEngineTest, IdpLogoutRevokesMatchingUsers) {
  Fixture f;
  f.registry->Register(testing::MakeSignedIdpProvider());
  const auto login = f.Login();
  const auto issued_at = login.tokens.access.claims.issued_at;

  const auto outcome = f.engine.HandleRedirectLogoutRequest(
      SignedLogoutQuery("ada@example.com", "session-idx-1", "relay-1"));
  EXPECT_EQ(outcome.provider, "okta");
  EXPECT_EQ(outcome.user_ids, (std::vector<std::string>{login.user.user_id}));
  EXPECT_EQ(outcome.response_url.rfind("https://idp.example.com/slo?", 0), 0u);
  EXPECT_NE(outcome.response_url.find("RelayState=relay-1"), std::string::npos);
  EXPECT_TRUE(f.revocation->IsUserRevoked(login.user.user_id, issued_at));
  EXPECT_FALSE(f.sessions->FindByUser("okta", login.user.user_id).has_value());
}

TEST(SamlEngineTest, IdpLogoutForUnknownSessionStillAnswers) {
  Fixture f;
  f.registry->Register(testing::MakeSignedIdpProvider());
  const auto outcome = f.engine.HandleRedirectLogoutRequest(
      SignedLogoutQuery("nobody@example.com", "", ""));
  EXPECT_TRUE(outcome.user_ids.empty());
  EXPECT_FALSE(outcome.response_url.empty());
}

TEST(SamlEngineTest, UnsignedOrForgedIdpLogoutRevokesNothing) {
  Fixture f;
  f.registry->Register(testing::MakeSignedIdpProvider());
  const auto login = f.Login();
  const auto issued_at = login.tokens.access.claims.issued_at;

  const auto unsigned_query =
      "SAMLRequest=" +
      auth::UrlEncode(EncodeRedirectPayload(
          IdpLogoutRequestXml("ada@example.com", "session-idx-1")));
  EXPECT_EQ(FailureKind([&] {
              f.engine.HandleRedirectLogoutRequest(unsigned_query);
            }),
            SamlError::Kind::InvalidLogoutMessage);

  // A genuine signature over another subject, with ada's request swapped in.
  const auto signed_query = SignedLogoutQuery("nobody@example.com", "", "");
  const auto forged = unsigned_query +
                      signed_query.substr(signed_query.find("&SigAlg="));
  EXPECT_EQ(FailureKind([&] { f.engine.HandleRedirectLogoutRequest(forged); }),
            SamlError::Kind::InvalidLogoutMessage);

  // The IdP certificate does not match the key that signed the request.
  f.registry->Register(testing::MakeProvider());
  EXPECT_EQ(FailureKind([&] {
              f.engine.HandleRedirectLogoutRequest(
                  SignedLogoutQuery("ada@example.com", "session-idx-1", ""));
            }),
            SamlError::Kind::InvalidLogoutMessage);

  EXPECT_FALSE(f.revocation->IsUserRevoked(login.user.user_id, issued_at));
  EXPECT_TRUE(f.sessions->FindByUser("okta", login.user.user_id).has_value());
}

TEST(SamlEngineTest, PostIdpLogoutNeedsEnvelopedSignature) {
  Fixture f;
  f.registry->Register(testing::MakeSignedIdpProvider());
  const auto login = f.Login();
  const auto issued_at = login.tokens.access.claims.issued_at;

  EXPECT_EQ(FailureKind([&] {
              f.engine.HandlePostLogoutRequest(
                  auth::Base64Encode(IdpLogoutRequestXml("ada@example.com",
                                                         "session-idx-1")),
                  "");
            }),
            SamlError::Kind::InvalidLogoutMessage);
  EXPECT_FALSE(f.revocation->IsUserRevoked(login.user.user_id, issued_at));

  const auto outcome = f.engine.HandlePostLogoutRequest(
      auth::Base64Encode(
          IdpLogoutRequestXml("ada@example.com", "session-idx-1", true)),
      "relay-2");
  EXPECT_EQ(f.verifier->last_signed_element(), "LogoutRequest");
  EXPECT_EQ(f.verifier->last_certificate(),
            testing::TestSigningKey()->certificate_base64());
  EXPECT_EQ(outcome.user_ids, (std::vector<std::string>{login.user.user_id}));
  EXPECT_TRUE(f.revocation->IsUserRevoked(login.user.user_id, issued_at));
}

TEST(SamlEngineTest, SpLogoutRoundTrip) {
  Fixture f;
  f.registry->Register(testing::MakeSigningProvider());
  const auto login = f.Login();

  const auto start = f.engine.BeginLogout("okta", login.user.user_id,
                                          "https://app.example.com/bye");
  EXPECT_EQ(start.url.rfind("https://idp.example.com/slo?SAMLRequest=", 0), 0u);
  EXPECT_NE(start.url.find("Signature="), std::string::npos);
  EXPECT_TRUE(f.revocation->IsUserRevoked(
      login.user.user_id, login.tokens.access.claims.issued_at));

  const auto outcome = f.engine.HandleLogoutResponse(
      IdpLogoutResponse(start.request_id), true);
  EXPECT_TRUE(outcome.success);
  EXPECT_EQ(outcome.redirect_to, "https://app.example.com/bye");

  EXPECT_EQ(FailureKind([&] {
              f.engine.HandleLogoutResponse(IdpLogoutResponse(start.request_id),
                                            true);
            }),
            SamlError::Kind::InvalidLogoutMessage);
}

TEST(SamlEngineTest, SpLogoutNeedsSession) {
  Fixture f;
  f.registry->Register(testing::MakeSigningProvider());
  EXPECT_EQ(FailureKind([&] { f.engine.BeginLogout("okta", "ghost", ""); }),
            SamlError::Kind::StateInvalid);
}

TEST(SamlEngineTest, ServiceProviderMetadataNamesEndpoints) {
  Fixture f;
  f.registry->Register(testing::MakeSigningProvider());
  const auto xml = f.engine.ServiceProviderMetadata("okta");
  EXPECT_NE(xml.find(testing::kSpEntityId), std::string::npos);
  EXPECT_NE(xml.find(testing::kAcsUrl), std::string::npos);
}

}  // namespace warden::federation
