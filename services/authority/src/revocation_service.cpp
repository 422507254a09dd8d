#include "revocation_service.h"

#include <stdexcept>
#include <utility>

#include "warden/token/token_error.h"

namespace warden::authority {

RevocationService::RevocationService(
    std::shared_ptr<const token::TokenValidator> validator,
    std::shared_ptr<shared::RevocationLedger> ledger, Clock clock)
    : validator_(std::move(validator)),
      ledger_(std::move(ledger)),
      clock_(std::move(clock)) {
  if (!validator_) {
    throw std::runtime_error("token validator is required");
  }
  if (!ledger_) {
    throw std::runtime_error("revocation ledger is required");
  }
  if (!clock_) {
    clock_ = SystemClock();
  }
}

shared::RevocationEntry RevocationService::Revoke(const std::string& token,
                                                  const std::string& reason) {
  const auto claims = validator_->Resolve(token);
  if (claims.role == token::kRoleServiceRole ||
      claims.principal == token::PrincipalKind::Service) {
    throw token::TokenError(token::TokenError::Kind::CannotRevokeServiceRole,
                            "service_role tokens cannot be revoked");
  }

  shared::RevocationEntry entry;
  entry.token_id = claims.token_id;
  entry.user_id = claims.user_record_id();
  entry.reason = reason;
  entry.expires_at = claims.expires_at;
  entry.revoked_at = clock_();
  ledger_->Add(entry);
  return entry;
}

bool RevocationService::IsRevoked(const std::string& token_id) {
  return ledger_->IsRevoked(token_id);
}

std::optional<shared::RevocationEntry> RevocationService::Status(
    const std::string& token_id) {
  return ledger_->Find(token_id);
}

void RevocationService::RevokeAllForUser(const std::string& user_id,
                                         const std::string& reason) {
  ledger_->RevokeAllForUser(user_id, reason);
}

bool RevocationService::IsClaimsRevoked(const token::TokenClaims& claims) {
  if (ledger_->IsRevoked(claims.token_id)) {
    return true;
  }
  const auto user_id = claims.user_record_id();
  return user_id && ledger_->IsUserRevoked(*user_id, claims.issued_at);
}

std::size_t RevocationService::SweepExpired() {
  return ledger_->DeleteExpired();
}

}  // namespace warden::authority
