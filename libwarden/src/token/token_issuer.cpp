#include "warden/token/token_issuer.h"

#include <stdexcept>
#include <utility>

#include "warden/auth/entropy.h"
#include "warden/token/token_error.h"

namespace warden::token {
namespace {

void ValidateSubject(const TokenSubject& subject) {
  if (subject.user_id.empty()) {
    throw TokenError(TokenError::Kind::InvalidRequest, "user id is required");
  }
  if (subject.role.empty()) {
    throw TokenError(TokenError::Kind::InvalidRequest, "role is required");
  }
  if (subject.role == kRoleServiceRole || subject.role == kRoleAnon) {
    throw TokenError(TokenError::Kind::InvalidRequest,
                     "role " + subject.role + " is reserved");
  }
}

TokenClaims ClaimsFor(const TokenSubject& subject, TokenKind kind) {
  TokenClaims claims;
  claims.subject = subject.user_id;
  claims.email = subject.email;
  claims.name = subject.name;
  claims.role = subject.role;
  claims.kind = kind;
  claims.principal = PrincipalKind::User;
  claims.user_metadata = subject.user_metadata;
  claims.app_metadata = subject.app_metadata;
  return claims;
}

}  // namespace

TokenIssuer::TokenIssuer(std::shared_ptr<const TokenCodec> codec,
                         TokenIssuerConfig config)
    : codec_(std::move(codec)), config_(std::move(config)) {
  if (!codec_) {
    throw std::runtime_error("token codec is required");
  }
  if (config_.access_ttl.count() <= 0 || config_.refresh_ttl.count() <= 0 ||
      config_.anonymous_ttl.count() <= 0 ||
      config_.service_role_ttl.count() <= 0) {
    throw std::runtime_error("token TTLs must be positive");
  }
}

IssuedToken TokenIssuer::Mint(TokenClaims claims,
                              std::chrono::seconds ttl) const {
  const auto issued_at =
      std::chrono::time_point_cast<std::chrono::milliseconds>(codec_->Now());
  const auto now = std::chrono::time_point_cast<std::chrono::seconds>(issued_at);
  claims.issuer = config_.issuer;
  claims.token_id = auth::GenerateUuidV4();
  claims.issued_at = issued_at;
  claims.not_before = now;
  claims.expires_at = now + ttl;
  IssuedToken issued;
  issued.token = codec_->Sign(claims);
  issued.claims = std::move(claims);
  return issued;
}

IssuedToken TokenIssuer::IssueAccessToken(const TokenSubject& subject) const {
  ValidateSubject(subject);
  auto claims = ClaimsFor(subject, TokenKind::Access);
  claims.session_id = auth::GenerateUuidV4();
  return Mint(std::move(claims), config_.access_ttl);
}

IssuedToken TokenIssuer::IssueRefreshToken(
    const TokenSubject& subject, const std::string& session_id) const {
  ValidateSubject(subject);
  if (session_id.empty()) {
    throw TokenError(TokenError::Kind::InvalidRequest,
                     "session id is required");
  }
  auto claims = ClaimsFor(subject, TokenKind::Refresh);
  claims.session_id = session_id;
  return Mint(std::move(claims), config_.refresh_ttl);
}

TokenPair TokenIssuer::IssueTokenPair(const TokenSubject& subject) const {
  TokenPair pair;
  pair.access = IssueAccessToken(subject);
  pair.refresh = IssueRefreshToken(subject, pair.access.claims.session_id);
  return pair;
}

IssuedToken TokenIssuer::Refresh(const TokenClaims& refresh_claims) const {
  if (refresh_claims.kind != TokenKind::Refresh) {
    throw TokenError(TokenError::Kind::Invalid, "token is not a refresh token");
  }

  auto claims = refresh_claims;
  claims.kind = TokenKind::Access;
  if (claims.principal == PrincipalKind::Anonymous) {
    // Anonymous visitors never carry a session.
    claims.session_id.clear();
  } else if (claims.principal == PrincipalKind::User) {
    claims.session_id = auth::GenerateUuidV4();
  } else {
    throw TokenError(TokenError::Kind::Invalid,
                     "service tokens cannot be refreshed");
  }
  return Mint(std::move(claims), config_.access_ttl);
}

IssuedToken TokenIssuer::IssueAnonymousToken() const {
  TokenClaims claims;
  claims.subject = kAnonymousSubject;
  claims.role = kRoleAnon;
  claims.kind = TokenKind::Access;
  claims.principal = PrincipalKind::Anonymous;
  return Mint(std::move(claims), config_.anonymous_ttl);
}

IssuedToken TokenIssuer::IssueServiceRoleToken() const {
  TokenClaims claims;
  claims.subject = kServiceRoleSubject;
  claims.role = kRoleServiceRole;
  claims.kind = TokenKind::Access;
  claims.principal = PrincipalKind::Service;
  return Mint(std::move(claims), config_.service_role_ttl);
}

TokenPair TokenIssuer::IssueAnonymousSession(
    const std::string& user_metadata) const {
  TokenClaims claims;
  claims.subject = auth::GenerateUuidV4();
  claims.role = kRoleAnon;
  claims.is_anonymous = true;
  claims.principal = PrincipalKind::Anonymous;
  claims.user_metadata = user_metadata;

  TokenPair pair;
  claims.kind = TokenKind::Access;
  pair.access = Mint(claims, config_.access_ttl);
  claims.kind = TokenKind::Refresh;
  pair.refresh = Mint(claims, config_.refresh_ttl);
  return pair;
}

}  // namespace warden::token
