#include "saml_engine.h"

#include <optional>
#include <set>
#include <stdexcept>
#include <utility>

#include "authn_request.h"
#include "identity_mapping.h"
#include "relay_state.h"
#include "saml_error.h"
#include "sp_metadata.h"
#include "warden/auth/entropy.h"
#include "warden/shared/json_log.h"

namespace warden::federation {
namespace {

constexpr char kLogoutStatePrefix[] = "slo:";

std::string AppMetadataFor(const std::string& provider) {
  const auto id = shared::JsonEscape("saml:" + provider);
  return "{\"provider\":\"" + id + "\",\"providers\":[\"" + id + "\"]}";
}

}  // namespace

SamlEngine::SamlEngine(SamlEngineDeps deps) : deps_(std::move(deps)) {
  if (!deps_.registry || !deps_.state_store || !deps_.validator ||
      !deps_.linker || !deps_.issuer || !deps_.revocation || !deps_.sessions) {
    throw std::runtime_error("SAML engine dependencies are incomplete");
  }
}

SamlLoginStart SamlEngine::BeginLogin(const std::string& provider_name,
                                      const std::string& redirect_to) {
  const auto provider = deps_.registry->Get(provider_name);
  const auto target =
      ValidateRelayState(redirect_to, provider->config.allowed_redirect_hosts);

  SamlLoginStart start;
  start.relay_state = auth::GenerateStateToken();
  auto request = BuildAuthnRequest(*provider, start.relay_state, deps_.clock());

  shared::CsrfStateEntry entry;
  entry.key = start.relay_state;
  entry.provider = provider_name;
  entry.redirect_uri = target;
  entry.nonce = request.id;
  deps_.state_store->Set(entry);

  start.url = std::move(request.url);
  start.binding = request.binding;
  start.encoded_request = std::move(request.encoded_request);
  start.request_id = std::move(request.id);
  return start;
}

SamlLoginResult SamlEngine::CompleteLogin(const std::string& provider_name,
                                          const std::string& saml_response,
                                          const std::string& relay_state) {
  const auto provider = deps_.registry->Get(provider_name);

  std::optional<std::string> expected_request_id;
  SamlLoginResult result;
  result.provider = provider_name;

  std::optional<shared::CsrfStateEntry> entry;
  if (!relay_state.empty()) {
    entry = deps_.state_store->ValidateAndConsume(relay_state);
  }
  if (entry) {
    if (entry->provider != provider_name) {
      throw SamlError(SamlError::Kind::StateInvalid,
                      "relay state was issued for a different provider");
    }
    expected_request_id = entry->nonce;
    result.redirect_to = entry->redirect_uri;
  } else if (provider->config.allow_idp_initiated) {
    result.redirect_to = ValidateRelayState(
        relay_state, provider->config.allowed_redirect_hosts);
  } else {
    throw SamlError(SamlError::Kind::StateInvalid,
                    "relay state is unknown or expired");
  }

  const auto assertion =
      deps_.validator->Validate(*provider, saml_response, expected_request_id);
  result.info = ExtractUserInfo(*provider, assertion);
  result.groups = ExtractGroups(*provider, assertion);
  AuthorizeGroups(result.groups, provider->config.group_rules);
  result.user = deps_.linker->Resolve(*provider, assertion, result.info);

  token::TokenSubject subject;
  subject.user_id = result.user.user_id;
  subject.email = result.info.email;
  subject.name = result.info.name.empty() ? result.user.name : result.info.name;
  subject.role = result.user.role.empty() ? provider->config.default_role
                                          : result.user.role;
  subject.app_metadata = AppMetadataFor(provider_name);
  auto tokens = deps_.issuer->IssueTokenPair(subject);

  // Tokens only leave this function once the session is recorded.
  SamlSession session;
  session.user_id = result.user.user_id;
  session.provider = provider_name;
  session.name_id = assertion.name_id;
  session.name_id_format = assertion.name_id_format;
  session.session_index = assertion.session_index;
  session.expires_at = tokens.refresh.claims.expires_at;
  session.id = auth::GenerateUuidV4();
  result.saml_session_id = session.id;
  deps_.sessions->Record(std::move(session));

  result.tokens = std::move(tokens);
  return result;
}

std::string SamlEngine::ServiceProviderMetadata(
    const std::string& provider_name) const {
  return BuildSpMetadata(*deps_.registry->Get(provider_name));
}

SamlLogoutStart SamlEngine::BeginLogout(const std::string& provider_name,
                                        const std::string& user_id,
                                        const std::string& redirect_to) {
  const auto provider = deps_.registry->Get(provider_name);
  const auto target =
      ValidateRelayState(redirect_to, provider->config.allowed_redirect_hosts);
  const auto session = deps_.sessions->FindByUser(provider_name, user_id);
  if (!session) {
    throw SamlError(SamlError::Kind::StateInvalid,
                    "no active SAML session for user");
  }

  const auto relay_state = auth::GenerateStateToken();
  auto redirect =
      BuildLogoutRequest(*provider, session->name_id, session->name_id_format,
                         session->session_index, relay_state, deps_.clock());

  shared::CsrfStateEntry entry;
  entry.key = kLogoutStatePrefix + redirect.id;
  entry.provider = provider_name;
  entry.redirect_uri = target;
  entry.nonce = relay_state;
  deps_.state_store->Set(entry);

  deps_.revocation->RevokeAllForUser(user_id, "saml_logout");
  deps_.sessions->RemoveForUser(provider_name, user_id);

  SamlLogoutStart start;
  start.url = std::move(redirect.url);
  start.request_id = std::move(redirect.id);
  return start;
}

SamlLogoutRequestOutcome SamlEngine::HandleRedirectLogoutRequest(
    const std::string& query) {
  const auto message = ParseRedirectQuery(query, "SAMLRequest");
  const auto parsed =
      ParseLogoutRequest(message.payload, message.relay_state, true);
  const auto provider = ProviderForIssuer(parsed.issuer);
  VerifyRedirectSignature(message, provider->idp.signing_certificate);
  return EndIdpSessions(*provider, parsed);
}

SamlLogoutRequestOutcome SamlEngine::HandlePostLogoutRequest(
    const std::string& saml_request, const std::string& relay_state) {
  const auto parsed = ParseLogoutRequest(saml_request, relay_state, false);
  const auto provider = ProviderForIssuer(parsed.issuer);
  VerifyPostSignature(saml_request, "LogoutRequest",
                      deps_.validator->signature_verifier(),
                      provider->idp.signing_certificate);
  return EndIdpSessions(*provider, parsed);
}

SamlLogoutRequestOutcome SamlEngine::EndIdpSessions(
    const SamlProvider& provider, const ParsedLogoutRequest& request) {
  SamlLogoutRequestOutcome outcome;
  outcome.provider = provider.config.name;
  std::set<std::string> users;
  for (const auto& session : deps_.sessions->FindForLogout(
           provider.config.name, request.name_id, request.session_index)) {
    users.insert(session.user_id);
    deps_.sessions->Remove(session.id);
  }
  for (const auto& user_id : users) {
    deps_.revocation->RevokeAllForUser(user_id, "saml_idp_logout");
    outcome.user_ids.push_back(user_id);
  }

  outcome.response_url = BuildLogoutResponse(provider, request.id,
                                             request.relay_state,
                                             deps_.clock())
                             .url;
  return outcome;
}

SamlLogoutResponseOutcome SamlEngine::HandleLogoutResponse(
    const std::string& saml_response, bool deflated) {
  const auto parsed = ParseLogoutResponse(saml_response, deflated);
  const auto provider = ProviderForIssuer(parsed.issuer);

  const auto entry = deps_.state_store->ValidateAndConsume(
      kLogoutStatePrefix + parsed.in_response_to);
  if (parsed.in_response_to.empty() || !entry ||
      entry->provider != provider->config.name) {
    throw SamlError(SamlError::Kind::InvalidLogoutMessage,
                    "LogoutResponse does not answer a pending LogoutRequest");
  }

  SamlLogoutResponseOutcome outcome;
  outcome.provider = provider->config.name;
  outcome.success = parsed.success();
  outcome.status = parsed.status;
  outcome.redirect_to = entry->redirect_uri;
  return outcome;
}

ProviderPtr SamlEngine::ProviderForIssuer(const std::string& issuer) const {
  auto provider = deps_.registry->FindByIdpEntityId(issuer);
  if (!provider) {
    throw SamlError(SamlError::Kind::InvalidLogoutMessage,
                    "unknown logout issuer " + issuer);
  }
  return provider;
}

}  // namespace warden::federation
