#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "warden/token/claims.h"
#include "warden/token/token_codec.h"

namespace warden::token {

struct TokenIssuerConfig {
  std::string issuer = "warden";
  std::chrono::seconds access_ttl = std::chrono::minutes(15);
  std::chrono::seconds refresh_ttl = std::chrono::hours(24 * 7);
  std::chrono::seconds anonymous_ttl = std::chrono::hours(24);
  std::chrono::seconds service_role_ttl = std::chrono::hours(24);
};

struct TokenSubject {
  std::string user_id;
  std::string email;
  std::string name;
  std::string role = kRoleAuthenticated;
  std::string user_metadata;
  std::string app_metadata;
};

struct IssuedToken {
  std::string token;
  TokenClaims claims;
};

struct TokenPair {
  IssuedToken access;
  IssuedToken refresh;
};

class TokenIssuer {
 public:
  TokenIssuer(std::shared_ptr<const TokenCodec> codec,
              TokenIssuerConfig config = TokenIssuerConfig{});

  // Every access token starts a new session id.
  IssuedToken IssueAccessToken(const TokenSubject& subject) const;
  IssuedToken IssueRefreshToken(const TokenSubject& subject,
                                const std::string& session_id) const;
  TokenPair IssueTokenPair(const TokenSubject& subject) const;

  // Mints a fresh access token for the identity carried by a validated
  // refresh token. The new token is bound to a new session id.
  IssuedToken Refresh(const TokenClaims& refresh_claims) const;

  // Synthetic identities with fixed well-known subjects and no session.
  IssuedToken IssueAnonymousToken() const;
  IssuedToken IssueServiceRoleToken() const;

  // Per-visitor anonymous sign-in: random subject, is_anonymous set,
  // access/refresh pair without a session id.
  TokenPair IssueAnonymousSession(const std::string& user_metadata = "") const;

  const TokenIssuerConfig& config() const { return config_; }

 private:
  IssuedToken Mint(TokenClaims claims, std::chrono::seconds ttl) const;

  std::shared_ptr<const TokenCodec> codec_;
  TokenIssuerConfig config_;
};

}  // namespace warden::token
