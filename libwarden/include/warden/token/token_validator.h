#pragma once

#include <memory>
#include <string>
#include <vector>

#include "warden/token/claims.h"
#include "warden/token/token_codec.h"

namespace warden::token {

struct TokenValidatorConfig {
  std::string issuer = "warden";
  // Extra issuers honoured for client keys minted by compatible deployments.
  std::vector<std::string> accepted_client_key_issuers = {"supabase-demo",
                                                          "supabase"};
};

class TokenValidator {
 public:
  TokenValidator(std::shared_ptr<const TokenCodec> codec,
                 TokenValidatorConfig config = TokenValidatorConfig{});

  TokenClaims Validate(const std::string& token) const;
  TokenClaims ValidateAccess(const std::string& token) const;
  TokenClaims ValidateRefresh(const std::string& token) const;

  // Client keys (anon, service_role, authenticated) may come from an
  // accepted foreign issuer or carry no issuer at all.
  TokenClaims ValidateClientKey(const std::string& token) const;

  // Authenticity checks only. Expired tokens still resolve.
  TokenClaims Resolve(const std::string& token) const;

 private:
  void CheckIssuer(const TokenClaims& claims) const;

  std::shared_ptr<const TokenCodec> codec_;
  TokenValidatorConfig config_;
};

}  // namespace warden::token
