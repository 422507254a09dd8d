#include "replay_guard.h"

#include <stdexcept>
#include <utility>

#include "saml_error.h"

namespace warden::federation {

ReplayGuard::ReplayGuard(std::shared_ptr<shared::ReplayLedger> ledger,
                         std::chrono::milliseconds grace, Clock clock)
    : ledger_(std::move(ledger)), grace_(grace), clock_(std::move(clock)) {
  if (!ledger_) {
    throw std::runtime_error("replay ledger is required");
  }
}

void ReplayGuard::CheckAndRecord(const std::string& assertion_id,
                                 TimePoint expires_at) {
  const auto now = clock_();
  ledger_->InsertIfAbsent(assertion_id, now, expires_at);
  const auto first_seen = ledger_->FirstSeen(assertion_id);
  if (first_seen && now - *first_seen > grace_) {
    throw SamlError(SamlError::Kind::AssertionReplayed,
                    "assertion " + assertion_id + " was already used");
  }
}

}  // namespace warden::federation
