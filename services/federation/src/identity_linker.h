#pragma once

#include <map>
#include <mutex>
#include <string>
#include <utility>

#include "saml_types.h"

namespace warden::federation {

struct LinkedUser {
  std::string user_id;
  std::string email;
  std::string name;
  std::string role;
  bool created = false;
};

// Resolves a federated identity to a local user record.
class IdentityLinker {
 public:
  virtual ~IdentityLinker() = default;

  // Throws SamlError::Kind::UserNotProvisioned when no user exists and the
  // provider does not auto-create.
  virtual LinkedUser Resolve(const SamlProvider& provider,
                             const SamlAssertion& assertion,
                             const SamlUserInfo& info) = 0;
};

// Links by (provider, NameID) first, then by email against known users.
class InMemoryIdentityLinker final : public IdentityLinker {
 public:
  void AddUser(const LinkedUser& user);

  LinkedUser Resolve(const SamlProvider& provider,
                     const SamlAssertion& assertion,
                     const SamlUserInfo& info) override;

 private:
  std::mutex mutex_;
  std::map<std::string, LinkedUser> users_by_id_;
  std::map<std::string, std::string> user_id_by_email_;
  std::map<std::pair<std::string, std::string>, std::string> links_;
};

}  // namespace warden::federation
