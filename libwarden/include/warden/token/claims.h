#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "warden/clock.h"

namespace warden::token {

inline constexpr char kAnonymousSubject[] =
    "00000000-0000-0000-0000-000000000000";
inline constexpr char kServiceRoleSubject[] =
    "00000000-0000-0000-0000-000000000001";

inline constexpr char kRoleAnon[] = "anon";
inline constexpr char kRoleAuthenticated[] = "authenticated";
inline constexpr char kRoleServiceRole[] = "service_role";

enum class TokenKind {
  Access,
  Refresh,
};

// Who a token speaks for. Anonymous and Service principals have no user
// record behind them and must never reach per-user repositories.
enum class PrincipalKind {
  User,
  Anonymous,
  Service,
};

struct TokenClaims {
  std::string subject;
  std::string email;
  std::string name;
  std::string role;
  std::string session_id;
  TokenKind kind = TokenKind::Access;
  PrincipalKind principal = PrincipalKind::User;
  bool is_anonymous = false;
  // Raw JSON text, empty when the claim is absent.
  std::string user_metadata;
  std::string app_metadata;

  std::string issuer;
  std::string token_id;
  // Millisecond precision when the token carries iat_ms, whole seconds
  // otherwise.
  TimePoint issued_at{};
  TimePoint not_before{};
  TimePoint expires_at{};

  std::optional<std::string> user_record_id() const {
    if (principal != PrincipalKind::User || subject.empty()) {
      return std::nullopt;
    }
    return subject;
  }
};

std::string_view TokenKindName(TokenKind kind);
std::optional<TokenKind> ParseTokenKind(std::string_view value);

PrincipalKind ClassifyPrincipal(std::string_view role, bool is_anonymous);

}  // namespace warden::token
