#pragma once

#include <string>
#include <string_view>

#include "saml_types.h"
#include "signature_verifier.h"
#include "warden/clock.h"

namespace warden::federation {

inline constexpr char kSigAlgRsaSha256[] =
    "http://www.w3.org/2001/04/xmldsig-more#rsa-sha256";

struct LogoutRedirect {
  // LogoutRequest id, empty for responses.
  std::string id;
  std::string url;
};

struct ParsedLogoutRequest {
  std::string id;
  std::string name_id;
  std::string name_id_format;
  std::string session_index;
  std::string issuer;
  std::string destination;
  std::string relay_state;
};

// SAML parameters of an HTTP-Redirect query string. `signed_octets` is
// rebuilt from the raw, still URL-encoded values in the order the binding
// signs them.
struct RedirectQuery {
  std::string payload;
  std::string relay_state;
  std::string sig_alg;
  std::string signature;
  std::string signed_octets;
};

struct ParsedLogoutResponse {
  std::string in_response_to;
  std::string status;
  std::string status_message;
  std::string issuer;

  bool success() const { return status == kStatusSuccess; }
};

// SP-initiated logout over the HTTP-Redirect binding, signed with the SP
// key. Throws SloNotSupported or SigningKeyMissing.
LogoutRedirect BuildLogoutRequest(const SamlProvider& provider,
                                  const std::string& name_id,
                                  const std::string& name_id_format,
                                  const std::string& session_index,
                                  const std::string& relay_state,
                                  TimePoint now);

// Answer to an IdP-initiated LogoutRequest. Signed when the provider has an
// SP key.
LogoutRedirect BuildLogoutResponse(const SamlProvider& provider,
                                   const std::string& in_response_to,
                                   const std::string& relay_state,
                                   TimePoint now);

// `deflated` selects the HTTP-Redirect encoding. Throws
// SamlError::Kind::InvalidLogoutMessage.
ParsedLogoutRequest ParseLogoutRequest(const std::string& encoded,
                                       const std::string& relay_state,
                                       bool deflated);
ParsedLogoutResponse ParseLogoutResponse(const std::string& encoded,
                                         bool deflated);

// Splits a query string as received on the SLO endpoint. `parameter` is
// SAMLRequest or SAMLResponse. Throws InvalidLogoutMessage.
RedirectQuery ParseRedirectQuery(std::string_view query,
                                 const char* parameter);

// Throws InvalidLogoutMessage unless the query carries an RSA-SHA256
// signature made by the IdP certificate.
void VerifyRedirectSignature(const RedirectQuery& query,
                             const std::string& certificate_base64);

// HTTP-POST messages must carry a ds:Signature enveloped in their root
// element. Throws InvalidLogoutMessage.
void VerifyPostSignature(const std::string& encoded, const char* root_name,
                         const SignatureVerifier& verifier,
                         const std::string& certificate_base64);

}  // namespace warden::federation
