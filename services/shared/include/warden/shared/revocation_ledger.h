#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>

#include "warden/clock.h"
#include "warden/shared/shared_store.h"

namespace warden::shared {

struct RevocationEntry {
  std::string token_id;
  // Empty for anonymous tokens, which have no user record.
  std::optional<std::string> user_id;
  std::string reason;
  TimePoint expires_at{};
  TimePoint revoked_at{};
};

// Durable blacklist of token ids. An entry whose expires_at has passed is
// treated as absent whether or not DeleteExpired has removed it yet.
class RevocationLedger {
 public:
  virtual ~RevocationLedger() = default;

  virtual void Add(const RevocationEntry& entry) = 0;
  virtual bool IsRevoked(const std::string& token_id) = 0;
  virtual std::optional<RevocationEntry> Find(const std::string& token_id) = 0;

  // Revokes every token of the user issued at or before now.
  virtual void RevokeAllForUser(const std::string& user_id,
                                const std::string& reason) = 0;
  virtual bool IsUserRevoked(const std::string& user_id,
                             TimePoint issued_at) = 0;

  virtual std::size_t DeleteExpired() = 0;
};

struct RevocationLedgerOptions {
  // How long a per-user cut-off is kept. Should cover the refresh TTL.
  std::chrono::seconds user_revocation_ttl = std::chrono::hours(24 * 7);
  Clock clock = SystemClock();
};

std::shared_ptr<RevocationLedger> CreateRevocationLedger(
    const SharedStoreConfig& config,
    RevocationLedgerOptions options = RevocationLedgerOptions{});

}  // namespace warden::shared
