#pragma once

#include <chrono>
#include <string>

#include "warden/shared/state_store.h"

namespace warden::federation {

struct OAuthFlow {
  std::string state;
  // Empty unless PKCE was requested.
  std::string code_verifier;
  std::string code_challenge;
  std::string code_challenge_method;
  // Empty unless an OIDC nonce was requested.
  std::string nonce;
  std::chrono::seconds expires_in{0};
};

// base64url(SHA-256(verifier)) without padding.
std::string PkceChallengeS256(const std::string& code_verifier);

OAuthFlow BeginOAuthFlow(shared::StateStore& store, const std::string& provider,
                         const std::string& redirect_uri, bool use_pkce,
                         bool use_nonce);

// Consumes the state. Unknown, expired, or other-provider states throw
// SamlError::Kind::StateInvalid.
shared::CsrfStateEntry CompleteOAuthFlow(shared::StateStore& store,
                                         const std::string& state,
                                         const std::string& provider);

}  // namespace warden::federation
