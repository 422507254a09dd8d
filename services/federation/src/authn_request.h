#pragma once

#include <string>

#include "saml_types.h"
#include "warden/clock.h"

namespace warden::federation {

struct AuthnRequest {
  std::string id;
  std::string xml;
  SamlBinding binding = SamlBinding::HttpRedirect;
  // Redirect binding: full SSO URL carrying SAMLRequest and RelayState.
  // POST binding: the bare SSO URL.
  std::string url;
  // POST binding only: base64 of the undeflated request.
  std::string encoded_request;
};

// "_" followed by 40 lowercase hex characters.
std::string GenerateSamlId();

std::string BuildAuthnRequestXml(const SamlProvider& provider,
                                 const std::string& id, TimePoint now);

AuthnRequest BuildAuthnRequest(const SamlProvider& provider,
                               const std::string& relay_state, TimePoint now);

}  // namespace warden::federation
