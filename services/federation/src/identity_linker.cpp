#include "identity_linker.h"

#include <algorithm>
#include <cctype>

#include "saml_error.h"
#include "warden/auth/entropy.h"

namespace warden::federation {
namespace {

std::string NormalizeEmail(std::string email) {
  std::transform(email.begin(), email.end(), email.begin(),
                 [](unsigned char ch) {
                   return static_cast<char>(std::tolower(ch));
                 });
  return email;
}

}  // namespace

void InMemoryIdentityLinker::AddUser(const LinkedUser& user) {
  std::lock_guard<std::mutex> lock(mutex_);
  users_by_id_[user.user_id] = user;
  if (!user.email.empty()) {
    user_id_by_email_[NormalizeEmail(user.email)] = user.user_id;
  }
}

LinkedUser InMemoryIdentityLinker::Resolve(const SamlProvider& provider,
                                           const SamlAssertion& assertion,
                                           const SamlUserInfo& info) {
  const auto link_key = std::make_pair(provider.config.name, assertion.name_id);
  const auto email = NormalizeEmail(info.email);

  std::lock_guard<std::mutex> lock(mutex_);
  if (const auto it = links_.find(link_key); it != links_.end()) {
    LinkedUser user = users_by_id_.at(it->second);
    user.created = false;
    return user;
  }
  if (const auto it = user_id_by_email_.find(email);
      it != user_id_by_email_.end()) {
    links_[link_key] = it->second;
    LinkedUser user = users_by_id_.at(it->second);
    user.created = false;
    return user;
  }
  if (!provider.config.auto_create_users) {
    throw SamlError(SamlError::Kind::UserNotProvisioned,
                    "no local user for " + info.email + " and provider " +
                        provider.config.name + " does not create users");
  }

  LinkedUser user;
  user.user_id = auth::GenerateUuidV4();
  user.email = info.email;
  user.name = info.name;
  user.role = provider.config.default_role;
  users_by_id_[user.user_id] = user;
  user_id_by_email_[email] = user.user_id;
  links_[link_key] = user.user_id;
  user.created = true;
  return user;
}

}  // namespace warden::federation
