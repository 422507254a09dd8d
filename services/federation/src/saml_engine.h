#pragma once

#include <memory>
#include <string>
#include <vector>

#include "assertion_validator.h"
#include "identity_linker.h"
#include "provider_registry.h"
#include "saml_session_index.h"
#include "single_logout.h"
#include "warden/clock.h"
#include "warden/shared/revocation_ledger.h"
#include "warden/shared/state_store.h"
#include "warden/token/token_issuer.h"

namespace warden::federation {

struct SamlLoginStart {
  std::string url;
  SamlBinding binding = SamlBinding::HttpRedirect;
  // POST binding only.
  std::string encoded_request;
  std::string request_id;
  std::string relay_state;
};

struct SamlLoginResult {
  std::string provider;
  LinkedUser user;
  SamlUserInfo info;
  std::vector<std::string> groups;
  token::TokenPair tokens;
  // Validated post-login redirect, empty when none was requested.
  std::string redirect_to;
  std::string saml_session_id;
};

struct SamlLogoutStart {
  std::string url;
  std::string request_id;
};

struct SamlLogoutRequestOutcome {
  std::string provider;
  std::vector<std::string> user_ids;
  std::string response_url;
};

struct SamlLogoutResponseOutcome {
  std::string provider;
  bool success = false;
  std::string status;
  std::string redirect_to;
};

struct SamlEngineDeps {
  std::shared_ptr<ProviderRegistry> registry;
  std::shared_ptr<shared::StateStore> state_store;
  std::shared_ptr<const AssertionValidator> validator;
  std::shared_ptr<IdentityLinker> linker;
  std::shared_ptr<const token::TokenIssuer> issuer;
  std::shared_ptr<shared::RevocationLedger> revocation;
  std::shared_ptr<SamlSessionIndex> sessions;
  Clock clock = SystemClock();
};

// Drives SP-initiated and IdP-initiated SSO plus single logout on top of the
// registry, the state store and the token issuer.
class SamlEngine {
 public:
  explicit SamlEngine(SamlEngineDeps deps);

  SamlLoginStart BeginLogin(const std::string& provider_name,
                            const std::string& redirect_to);

  SamlLoginResult CompleteLogin(const std::string& provider_name,
                                const std::string& saml_response,
                                const std::string& relay_state);

  std::string ServiceProviderMetadata(const std::string& provider_name) const;

  // Ends the local session right away, then hands the browser to the IdP.
  SamlLogoutStart BeginLogout(const std::string& provider_name,
                              const std::string& user_id,
                              const std::string& redirect_to);

  // IdP-initiated logout over HTTP-Redirect. `query` is the query string
  // exactly as received; its Signature must verify against the IdP
  // certificate before any session is touched.
  SamlLogoutRequestOutcome HandleRedirectLogoutRequest(
      const std::string& query);

  // Same over HTTP-POST, where the LogoutRequest carries an enveloped
  // XML signature.
  SamlLogoutRequestOutcome HandlePostLogoutRequest(
      const std::string& saml_request, const std::string& relay_state);

  SamlLogoutResponseOutcome HandleLogoutResponse(
      const std::string& saml_response, bool deflated);

 private:
  ProviderPtr ProviderForIssuer(const std::string& issuer) const;
  SamlLogoutRequestOutcome EndIdpSessions(const SamlProvider& provider,
                                          const ParsedLogoutRequest& request);

  SamlEngineDeps deps_;
};

}  // namespace warden::federation
