#pragma once

#include <string>

#include "saml_types.h"

namespace warden::federation {

// Rejects non-https metadata URLs unless allow_insecure is set, in which
// case a warning is logged. Throws SamlError::Kind::MetadataInsecureURL.
void ValidateMetadataUrl(const std::string& url, bool allow_insecure);

// Accepts an EntityDescriptor, or an EntitiesDescriptor whose first entity
// carries an IdP role. Throws SamlError::Kind::MetadataParseFailed.
IdpDescriptor ParseIdpMetadata(const std::string& xml);

}  // namespace warden::federation
