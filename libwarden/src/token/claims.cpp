#include "warden/token/claims.h"

#include "warden/token/token_error.h"

namespace warden::token {

TokenError::TokenError(Kind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

std::string_view TokenKindName(TokenKind kind) {
  return kind == TokenKind::Refresh ? "refresh" : "access";
}

std::optional<TokenKind> ParseTokenKind(std::string_view value) {
  if (value == "access") {
    return TokenKind::Access;
  }
  if (value == "refresh") {
    return TokenKind::Refresh;
  }
  return std::nullopt;
}

PrincipalKind ClassifyPrincipal(std::string_view role, bool is_anonymous) {
  if (role == kRoleServiceRole) {
    return PrincipalKind::Service;
  }
  if (is_anonymous || role == kRoleAnon) {
    return PrincipalKind::Anonymous;
  }
  return PrincipalKind::User;
}

}  // namespace warden::token
