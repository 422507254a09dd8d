#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "warden/clock.h"
#include "warden/shared/replay_ledger.h"

namespace warden::federation {

// Rejects assertion ids presented again after the grace window. Two
// presentations inside the window are both accepted.
class ReplayGuard {
 public:
  ReplayGuard(std::shared_ptr<shared::ReplayLedger> ledger,
              std::chrono::milliseconds grace = std::chrono::seconds(1),
              Clock clock = SystemClock());

  // Throws SamlError::Kind::AssertionReplayed.
  void CheckAndRecord(const std::string& assertion_id, TimePoint expires_at);

 private:
  std::shared_ptr<shared::ReplayLedger> ledger_;
  std::chrono::milliseconds grace_;
  Clock clock_;
};

}  // namespace warden::federation
