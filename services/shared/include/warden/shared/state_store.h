#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "warden/clock.h"
#include "warden/shared/shared_store.h"

namespace warden::shared {

// Single-use CSRF / OAuth state record.
struct CsrfStateEntry {
  std::string key;
  std::string provider;
  std::string redirect_uri;
  std::string code_verifier;
  // OIDC nonce, or the AuthnRequest id for SAML flows.
  std::string nonce;
  // Left unset to use the TTL passed to Set.
  TimePoint expires_at{};
};

class StateStore {
 public:
  virtual ~StateStore() = default;

  virtual void Set(const CsrfStateEntry& entry, std::chrono::seconds ttl) = 0;
  void Set(const CsrfStateEntry& entry) { Set(entry, default_ttl()); }

  // Atomically fetches and deletes. Absent and expired keys yield nullopt.
  virtual std::optional<CsrfStateEntry> ValidateAndConsume(
      const std::string& key) = 0;

  virtual std::size_t Cleanup() = 0;

  // Stops background cleanup. Safe to call more than once.
  virtual void Stop() = 0;

  virtual std::chrono::seconds default_ttl() const = 0;
};

struct StateStoreOptions {
  std::chrono::seconds default_ttl = std::chrono::minutes(10);
  std::chrono::milliseconds cleanup_interval = std::chrono::minutes(5);
  bool background_cleanup = true;
  Clock clock = SystemClock();
  // Reports each background sweep: removed count, or an error message.
  std::function<void(std::size_t removed, const std::string& error)>
      on_cleanup;
};

std::shared_ptr<StateStore> CreateStateStore(
    const SharedStoreConfig& config,
    StateStoreOptions options = StateStoreOptions{});

}  // namespace warden::shared
