#include "oauth_state.h"

#include <chrono>
#include <memory>

#include <gtest/gtest.h>

#include "saml_error.h"

namespace warden::federation {
namespace {

std::shared_ptr<shared::StateStore> MakeStore(const Clock& clock) {
  shared::StateStoreOptions options;
  options.background_cleanup = false;
  options.default_ttl = std::chrono::minutes(10);
  options.clock = clock;
  return shared::CreateStateStore(shared::SharedStoreConfig{}, options);
}

SamlError::Kind CompleteFailure(shared::StateStore& store,
                                const std::string& state,
                                const std::string& provider) {
  try {
    CompleteOAuthFlow(store, state, provider);
  } catch (const SamlError& ex) {
    return ex.kind();
  }
  ADD_FAILURE() << "state should have been rejected";
  return SamlError::Kind::Configuration;
}

}  // namespace

TEST(OAuthStateTest, PkceChallengeMatchesRfc7636Vector) {
  EXPECT_EQ(PkceChallengeS256("dBjftJeZ4CVP-mB92K27uhbUJU1p1r_wW1gFWFOEjXk"),
            "E9Melhoa2OwvFrEMTJguCHaoeK1t8URWbuGJSstw-cM");
}

TEST(OAuthStateTest, FlowRoundTripsOnce) {
  TimePoint now = FromUnixSeconds(1700000000);
  auto store = MakeStore([&now] { return now; });

  const auto flow =
      BeginOAuthFlow(*store, "github", "https://app.example.com/cb", true, true);
  EXPECT_FALSE(flow.state.empty());
  EXPECT_EQ(flow.code_challenge_method, "S256");
  EXPECT_EQ(flow.code_challenge, PkceChallengeS256(flow.code_verifier));
  EXPECT_FALSE(flow.nonce.empty());
  EXPECT_EQ(flow.expires_in, std::chrono::minutes(10));

  const auto entry = CompleteOAuthFlow(*store, flow.state, "github");
  EXPECT_EQ(entry.redirect_uri, "https://app.example.com/cb");
  EXPECT_EQ(entry.code_verifier, flow.code_verifier);
  EXPECT_EQ(entry.nonce, flow.nonce);

  EXPECT_EQ(CompleteFailure(*store, flow.state, "github"),
            SamlError::Kind::StateInvalid);
}

TEST(OAuthStateTest, PlainFlowCarriesNoVerifierOrNonce) {
  TimePoint now = FromUnixSeconds(1700000000);
  auto store = MakeStore([&now] { return now; });

  const auto flow = BeginOAuthFlow(*store, "google", "", false, false);
  EXPECT_TRUE(flow.code_verifier.empty());
  EXPECT_TRUE(flow.code_challenge.empty());
  EXPECT_TRUE(flow.nonce.empty());
}

TEST(OAuthStateTest, RejectsForeignExpiredAndMissingStates) {
  TimePoint now = FromUnixSeconds(1700000000);
  auto store = MakeStore([&now] { return now; });

  const auto foreign = BeginOAuthFlow(*store, "github", "", false, false);
  EXPECT_EQ(CompleteFailure(*store, foreign.state, "google"),
            SamlError::Kind::StateInvalid);
  // A mismatched attempt still burns the state.
  EXPECT_EQ(CompleteFailure(*store, foreign.state, "github"),
            SamlError::Kind::StateInvalid);

  const auto stale = BeginOAuthFlow(*store, "github", "", false, false);
  now += std::chrono::minutes(11);
  EXPECT_EQ(CompleteFailure(*store, stale.state, "github"),
            SamlError::Kind::StateInvalid);

  EXPECT_EQ(CompleteFailure(*store, "", "github"),
            SamlError::Kind::StateInvalid);
  EXPECT_THROW(BeginOAuthFlow(*store, "", "", false, false), SamlError);
}

}  // namespace warden::federation
