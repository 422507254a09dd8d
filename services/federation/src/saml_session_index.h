#pragma once

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "warden/clock.h"

namespace warden::federation {

// Links a local user to the IdP session that signed them in, so logout can
// be propagated in both directions.
struct SamlSession {
  std::string id;
  std::string user_id;
  std::string provider;
  std::string name_id;
  std::string name_id_format;
  std::string session_index;
  TimePoint created_at{};
  TimePoint expires_at{};
};

class SamlSessionIndex {
 public:
  explicit SamlSessionIndex(Clock clock = SystemClock());

  void Record(SamlSession session);

  // Most recent live session of the user for the provider.
  std::optional<SamlSession> FindByUser(const std::string& provider,
                                        const std::string& user_id) const;

  // Matches on session index when given, else on NameID alone.
  std::vector<SamlSession> FindForLogout(const std::string& provider,
                                         const std::string& name_id,
                                         const std::string& session_index) const;

  size_t Remove(const std::string& session_id);
  size_t RemoveForUser(const std::string& provider, const std::string& user_id);
  size_t DeleteExpired();

 private:
  bool Live(const SamlSession& session, TimePoint now) const;

  Clock clock_;
  mutable std::mutex mutex_;
  std::vector<SamlSession> sessions_;
};

}  // namespace warden::federation
