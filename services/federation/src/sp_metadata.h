#pragma once

#include <string>

#include "saml_types.h"

namespace warden::federation {

// SPSSODescriptor document published to the IdP for this provider.
std::string BuildSpMetadata(const SamlProvider& provider);

}  // namespace warden::federation
