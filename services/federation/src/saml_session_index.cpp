#include "saml_session_index.h"

#include <algorithm>
#include <utility>

#include "warden/auth/entropy.h"

namespace warden::federation {

SamlSessionIndex::SamlSessionIndex(Clock clock) : clock_(std::move(clock)) {}

bool SamlSessionIndex::Live(const SamlSession& session, TimePoint now) const {
  return session.expires_at == TimePoint{} || now < session.expires_at;
}

void SamlSessionIndex::Record(SamlSession session) {
  if (session.id.empty()) {
    session.id = auth::GenerateUuidV4();
  }
  if (session.created_at == TimePoint{}) {
    session.created_at = clock_();
  }
  std::lock_guard<std::mutex> lock(mutex_);
  sessions_.push_back(std::move(session));
}

std::optional<SamlSession> SamlSessionIndex::FindByUser(
    const std::string& provider, const std::string& user_id) const {
  const auto now = clock_();
  std::lock_guard<std::mutex> lock(mutex_);
  const SamlSession* latest = nullptr;
  for (const auto& session : sessions_) {
    if (session.provider != provider || session.user_id != user_id ||
        !Live(session, now)) {
      continue;
    }
    if (!latest || session.created_at >= latest->created_at) {
      latest = &session;
    }
  }
  if (!latest) {
    return std::nullopt;
  }
  return *latest;
}

std::vector<SamlSession> SamlSessionIndex::FindForLogout(
    const std::string& provider, const std::string& name_id,
    const std::string& session_index) const {
  const auto now = clock_();
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<SamlSession> out;
  for (const auto& session : sessions_) {
    if (session.provider != provider || session.name_id != name_id ||
        !Live(session, now)) {
      continue;
    }
    if (!session_index.empty() && session.session_index != session_index) {
      continue;
    }
    out.push_back(session);
  }
  return out;
}

size_t SamlSessionIndex::Remove(const std::string& session_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto before = sessions_.size();
  sessions_.erase(std::remove_if(sessions_.begin(), sessions_.end(),
                                 [&session_id](const SamlSession& session) {
                                   return session.id == session_id;
                                 }),
                  sessions_.end());
  return before - sessions_.size();
}

size_t SamlSessionIndex::RemoveForUser(const std::string& provider,
                                       const std::string& user_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto before = sessions_.size();
  sessions_.erase(
      std::remove_if(sessions_.begin(), sessions_.end(),
                     [&](const SamlSession& session) {
                       return session.provider == provider &&
                              session.user_id == user_id;
                     }),
      sessions_.end());
  return before - sessions_.size();
}

size_t SamlSessionIndex::DeleteExpired() {
  const auto now = clock_();
  std::lock_guard<std::mutex> lock(mutex_);
  const auto before = sessions_.size();
  sessions_.erase(std::remove_if(sessions_.begin(), sessions_.end(),
                                 [&](const SamlSession& session) {
                                   return !Live(session, now);
                                 }),
                  sessions_.end());
  return before - sessions_.size();
}

}  // namespace warden::federation
