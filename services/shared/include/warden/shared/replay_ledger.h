#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>

#include "warden/clock.h"
#include "warden/shared/shared_store.h"

namespace warden::shared {

// Insert-if-absent record of consumed one-time identifiers (SAML assertion
// ids). The first writer wins; later inserts leave first_seen untouched.
class ReplayLedger {
 public:
  virtual ~ReplayLedger() = default;

  // Returns true when this call created the record.
  virtual bool InsertIfAbsent(const std::string& id, TimePoint first_seen,
                              TimePoint expires_at) = 0;
  virtual std::optional<TimePoint> FirstSeen(const std::string& id) = 0;

  // Redis expires records natively and reports zero here.
  virtual std::size_t DeleteExpired() = 0;
};

std::shared_ptr<ReplayLedger> CreateReplayLedger(
    const SharedStoreConfig& config, Clock clock = SystemClock());

}  // namespace warden::shared
