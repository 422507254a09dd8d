#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>

#include "warden/clock.h"
#include "warden/shared/revocation_ledger.h"
#include "warden/token/claims.h"
#include "warden/token/token_validator.h"

namespace warden::authority {

class RevocationService {
 public:
  RevocationService(std::shared_ptr<const token::TokenValidator> validator,
                    std::shared_ptr<shared::RevocationLedger> ledger,
                    Clock clock = SystemClock());

  // Blacklists the token's jti until the token's own expiry. Expired but
  // authentic tokens are accepted. Service-role tokens throw
  // TokenError::Kind::CannotRevokeServiceRole and never reach the ledger.
  shared::RevocationEntry Revoke(const std::string& token,
                                 const std::string& reason);

  bool IsRevoked(const std::string& token_id);
  std::optional<shared::RevocationEntry> Status(const std::string& token_id);
  void RevokeAllForUser(const std::string& user_id, const std::string& reason);

  // Checks the jti blacklist and, for user principals, the per-user cut-off.
  bool IsClaimsRevoked(const token::TokenClaims& claims);

  std::size_t SweepExpired();

 private:
  std::shared_ptr<const token::TokenValidator> validator_;
  std::shared_ptr<shared::RevocationLedger> ledger_;
  Clock clock_;
};

}  // namespace warden::authority
