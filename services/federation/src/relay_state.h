#pragma once

#include <string>
#include <vector>

namespace warden::federation {

// Returns the redirect target, or an empty string when none was requested.
// Relative paths are accepted. Absolute URLs must name an allowed host or a
// subdomain of one. Throws SamlError::Kind::InvalidRedirect.
std::string ValidateRelayState(const std::string& relay_state,
                               const std::vector<std::string>& allowed_hosts);

}  // namespace warden::federation
