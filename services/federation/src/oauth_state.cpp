#include "oauth_state.h"

#include "saml_error.h"
#include "warden/auth/encoding.h"
#include "warden/auth/entropy.h"

namespace warden::federation {

std::string PkceChallengeS256(const std::string& code_verifier) {
  return auth::Base64UrlEncode(auth::Sha256(code_verifier));
}

OAuthFlow BeginOAuthFlow(shared::StateStore& store, const std::string& provider,
                         const std::string& redirect_uri, bool use_pkce,
                         bool use_nonce) {
  if (provider.empty()) {
    throw SamlError(SamlError::Kind::StateInvalid, "provider is required");
  }
  OAuthFlow flow;
  flow.state = auth::GenerateStateToken();
  if (use_pkce) {
    flow.code_verifier = auth::GenerateUrlSafeToken(32);
    flow.code_challenge = PkceChallengeS256(flow.code_verifier);
    flow.code_challenge_method = "S256";
  }
  if (use_nonce) {
    flow.nonce = auth::GenerateStateToken();
  }
  flow.expires_in = store.default_ttl();

  shared::CsrfStateEntry entry;
  entry.key = flow.state;
  entry.provider = provider;
  entry.redirect_uri = redirect_uri;
  entry.code_verifier = flow.code_verifier;
  entry.nonce = flow.nonce;
  store.Set(entry);
  return flow;
}

shared::CsrfStateEntry CompleteOAuthFlow(shared::StateStore& store,
                                         const std::string& state,
                                         const std::string& provider) {
  if (state.empty()) {
    throw SamlError(SamlError::Kind::StateInvalid, "state is required");
  }
  auto entry = store.ValidateAndConsume(state);
  if (!entry) {
    throw SamlError(SamlError::Kind::StateInvalid,
                    "state is unknown or expired");
  }
  if (entry->provider != provider) {
    throw SamlError(SamlError::Kind::StateInvalid,
                    "state was issued for a different provider");
  }
  return *entry;
}

}  // namespace warden::federation
