#include "warden/token/token_validator.h"

#include <algorithm>
#include <stdexcept>
#include <utility>

#include "warden/token/token_error.h"

namespace warden::token {
namespace {

TokenClaims RequireKind(TokenClaims claims, TokenKind expected) {
  if (claims.kind != expected) {
    throw TokenError(TokenError::Kind::Invalid,
                     "expected " + std::string(TokenKindName(expected)) +
                         " token");
  }
  return claims;
}

bool IsClientKeyRole(const std::string& role) {
  return role == kRoleAnon || role == kRoleServiceRole ||
         role == kRoleAuthenticated;
}

}  // namespace

TokenValidator::TokenValidator(std::shared_ptr<const TokenCodec> codec,
                               TokenValidatorConfig config)
    : codec_(std::move(codec)), config_(std::move(config)) {
  if (!codec_) {
    throw std::runtime_error("token codec is required");
  }
}

void TokenValidator::CheckIssuer(const TokenClaims& claims) const {
  if (claims.issuer != config_.issuer) {
    throw TokenError(TokenError::Kind::Invalid, "unexpected token issuer");
  }
}

TokenClaims TokenValidator::Validate(const std::string& token) const {
  auto claims = codec_->Verify(token);
  CheckIssuer(claims);
  return claims;
}

TokenClaims TokenValidator::ValidateAccess(const std::string& token) const {
  return RequireKind(Validate(token), TokenKind::Access);
}

TokenClaims TokenValidator::ValidateRefresh(const std::string& token) const {
  return RequireKind(Validate(token), TokenKind::Refresh);
}

TokenClaims TokenValidator::ValidateClientKey(const std::string& token) const {
  auto claims = codec_->Verify(token);
  const auto& accepted = config_.accepted_client_key_issuers;
  const bool issuer_ok =
      claims.issuer.empty() || claims.issuer == config_.issuer ||
      std::find(accepted.begin(), accepted.end(), claims.issuer) !=
          accepted.end();
  if (!issuer_ok) {
    throw TokenError(TokenError::Kind::Invalid, "unrecognized client key issuer");
  }
  if (!IsClientKeyRole(claims.role)) {
    throw TokenError(TokenError::Kind::Invalid,
                     "client key role must be anon, service_role or "
                     "authenticated");
  }
  return claims;
}

TokenClaims TokenValidator::Resolve(const std::string& token) const {
  auto claims = codec_->VerifyIgnoringExpiry(token);
  CheckIssuer(claims);
  return claims;
}

}  // namespace warden::token
