#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "saml_types.h"

namespace warden::federation {

inline constexpr size_t kMaxAttributeCodePoints = 1024;

// Drops NUL, C0 controls other than tab/newline/CR, and DEL; trims
// surrounding whitespace; truncates to kMaxAttributeCodePoints without
// splitting a UTF-8 sequence.
std::string SanitizeAttribute(std::string_view value);

// Throws SamlError::Kind::MissingEmail.
SamlUserInfo ExtractUserInfo(const SamlProvider& provider,
                             const SamlAssertion& assertion);

std::vector<std::string> ExtractGroups(const SamlProvider& provider,
                                       const SamlAssertion& assertion);

// Throws SamlError::Kind::GroupAccessDenied.
void AuthorizeGroups(const std::vector<std::string>& groups,
                     const GroupRules& rules);

}  // namespace warden::federation
