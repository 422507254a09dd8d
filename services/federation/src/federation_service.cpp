#include "federation_service.h"

#include <chrono>
#include <cstdint>
#include <exception>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <grpcpp/support/status_code_enum.h>

#include "log_utils.h"
#include "oauth_state.h"
#include "saml_error.h"
#include "warden/shared/shared_store.h"
#include "warden/token/token_error.h"

namespace warden::federation {
namespace {

namespace v1 = warden::federation::v1;
namespace authority_v1 = warden::authority::v1;

constexpr size_t kMaxNameBytes = 128;
constexpr size_t kMaxUrlBytes = 2048;
constexpr size_t kMaxRelayStateBytes = 2048;
constexpr size_t kMaxUserIdBytes = 128;
constexpr size_t kMaxPemBytes = 64 * 1024;
// Base64 of a kMaxSamlMessageBytes document.
constexpr size_t kMaxEncodedMessageBytes = (kMaxSamlMessageBytes / 3 + 1) * 4;
// Percent-encoding at most triples the message, relay state and signature.
constexpr size_t kMaxRedirectQueryBytes =
    3 * (kMaxEncodedMessageBytes + kMaxRelayStateBytes + 1024);

class RequestError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

void Require(bool condition, const char* message) {
  if (!condition) {
    throw RequestError(message);
  }
}

grpc::StatusCode TransportStatusForFederationCode(v1::FederationErrorCode code) {
  switch (code) {
    case v1::FEDERATION_ERROR_CODE_INVALID_REQUEST:
    case v1::FEDERATION_ERROR_CODE_INVALID_REDIRECT:
    case v1::FEDERATION_ERROR_CODE_STATE_INVALID:
    case v1::FEDERATION_ERROR_CODE_INVALID_LOGOUT_MESSAGE:
    case v1::FEDERATION_ERROR_CODE_METADATA_INSECURE_URL:
    case v1::FEDERATION_ERROR_CODE_METADATA_PARSE_FAILED:
      return grpc::StatusCode::INVALID_ARGUMENT;
    case v1::FEDERATION_ERROR_CODE_ASSERTION_INVALID:
    case v1::FEDERATION_ERROR_CODE_ASSERTION_EXPIRED:
    case v1::FEDERATION_ERROR_CODE_AUDIENCE_MISMATCH:
    case v1::FEDERATION_ERROR_CODE_MISSING_EMAIL:
      return grpc::StatusCode::UNAUTHENTICATED;
    case v1::FEDERATION_ERROR_CODE_ASSERTION_REPLAYED:
    case v1::FEDERATION_ERROR_CODE_GROUP_ACCESS_DENIED:
    case v1::FEDERATION_ERROR_CODE_USER_NOT_PROVISIONED:
      return grpc::StatusCode::PERMISSION_DENIED;
    case v1::FEDERATION_ERROR_CODE_PROVIDER_NOT_FOUND:
      return grpc::StatusCode::NOT_FOUND;
    case v1::FEDERATION_ERROR_CODE_PROVIDER_DISABLED:
    case v1::FEDERATION_ERROR_CODE_SLO_NOT_SUPPORTED:
    case v1::FEDERATION_ERROR_CODE_SIGNING_KEY_MISSING:
      return grpc::StatusCode::FAILED_PRECONDITION;
    case v1::FEDERATION_ERROR_CODE_METADATA_FETCH_FAILED:
    case v1::FEDERATION_ERROR_CODE_TEMPORARILY_UNAVAILABLE:
      return grpc::StatusCode::UNAVAILABLE;
    case v1::FEDERATION_ERROR_CODE_INTERNAL:
    case v1::FEDERATION_ERROR_CODE_UNSPECIFIED:
    default:
      return grpc::StatusCode::INTERNAL;
  }
}

v1::FederationErrorCode CodeForSamlError(SamlError::Kind kind) {
  switch (kind) {
    case SamlError::Kind::AssertionInvalid:
      return v1::FEDERATION_ERROR_CODE_ASSERTION_INVALID;
    case SamlError::Kind::AssertionExpired:
      return v1::FEDERATION_ERROR_CODE_ASSERTION_EXPIRED;
    case SamlError::Kind::AssertionReplayed:
      return v1::FEDERATION_ERROR_CODE_ASSERTION_REPLAYED;
    case SamlError::Kind::AudienceMismatch:
      return v1::FEDERATION_ERROR_CODE_AUDIENCE_MISMATCH;
    case SamlError::Kind::MissingEmail:
      return v1::FEDERATION_ERROR_CODE_MISSING_EMAIL;
    case SamlError::Kind::ProviderNotFound:
      return v1::FEDERATION_ERROR_CODE_PROVIDER_NOT_FOUND;
    case SamlError::Kind::ProviderDisabled:
      return v1::FEDERATION_ERROR_CODE_PROVIDER_DISABLED;
    case SamlError::Kind::InvalidRedirect:
      return v1::FEDERATION_ERROR_CODE_INVALID_REDIRECT;
    case SamlError::Kind::MetadataFetchFailed:
      return v1::FEDERATION_ERROR_CODE_METADATA_FETCH_FAILED;
    case SamlError::Kind::MetadataInsecureURL:
      return v1::FEDERATION_ERROR_CODE_METADATA_INSECURE_URL;
    case SamlError::Kind::MetadataParseFailed:
      return v1::FEDERATION_ERROR_CODE_METADATA_PARSE_FAILED;
    case SamlError::Kind::GroupAccessDenied:
      return v1::FEDERATION_ERROR_CODE_GROUP_ACCESS_DENIED;
    case SamlError::Kind::StateInvalid:
      return v1::FEDERATION_ERROR_CODE_STATE_INVALID;
    case SamlError::Kind::UserNotProvisioned:
      return v1::FEDERATION_ERROR_CODE_USER_NOT_PROVISIONED;
    case SamlError::Kind::SloNotSupported:
      return v1::FEDERATION_ERROR_CODE_SLO_NOT_SUPPORTED;
    case SamlError::Kind::SigningKeyMissing:
      return v1::FEDERATION_ERROR_CODE_SIGNING_KEY_MISSING;
    case SamlError::Kind::InvalidLogoutMessage:
      return v1::FEDERATION_ERROR_CODE_INVALID_LOGOUT_MESSAGE;
    case SamlError::Kind::Configuration:
      return v1::FEDERATION_ERROR_CODE_INVALID_REQUEST;
  }
  return v1::FEDERATION_ERROR_CODE_INTERNAL;
}

v1::FederationErrorCode CodeForStoreError(shared::SharedStoreError::Kind kind) {
  switch (kind) {
    case shared::SharedStoreError::Kind::InvalidArgument:
      return v1::FEDERATION_ERROR_CODE_INVALID_REQUEST;
    case shared::SharedStoreError::Kind::Unavailable:
      return v1::FEDERATION_ERROR_CODE_TEMPORARILY_UNAVAILABLE;
    case shared::SharedStoreError::Kind::Conflict:
    case shared::SharedStoreError::Kind::NotFound:
    default:
      return v1::FEDERATION_ERROR_CODE_INTERNAL;
  }
}

template <typename Response>
grpc::Status StatusWithFederationError(Response* response,
                                       v1::FederationErrorCode code,
                                       std::string_view detail) {
  auto* error = response->mutable_error();
  error->set_code(code);
  error->set_detail(std::string(detail));
  return grpc::Status(TransportStatusForFederationCode(code),
                      std::string(detail));
}

// Runs a handler and converts domain exceptions into the response error
// detail plus transport status. Every outcome is logged.
template <typename Response, typename Handler>
grpc::Status HandleRequest(std::string_view action, Response* response,
                           Handler&& handler) {
  std::string detail;
  grpc::Status status;
  try {
    status = handler(&detail);
  } catch (const RequestError& ex) {
    status = StatusWithFederationError(
        response, v1::FEDERATION_ERROR_CODE_INVALID_REQUEST, ex.what());
  } catch (const SamlError& ex) {
    status = StatusWithFederationError(response, CodeForSamlError(ex.kind()),
                                       ex.what());
    detail = std::string(SamlErrorKindName(ex.kind()));
  } catch (const token::TokenError& ex) {
    const auto code = ex.kind() == token::TokenError::Kind::InvalidRequest
                          ? v1::FEDERATION_ERROR_CODE_INVALID_REQUEST
                          : v1::FEDERATION_ERROR_CODE_INTERNAL;
    status = StatusWithFederationError(response, code, ex.what());
  } catch (const shared::SharedStoreError& ex) {
    status = StatusWithFederationError(response, CodeForStoreError(ex.kind()),
                                       ex.what());
  } catch (const std::exception& ex) {
    status = StatusWithFederationError(
        response, v1::FEDERATION_ERROR_CODE_INTERNAL, "internal error");
    detail = ex.what();
  }
  LogFederationEvent(action, status, detail);
  return status;
}

void FillTimestamp(TimePoint tp, google::protobuf::Timestamp* timestamp) {
  const auto since_epoch = tp.time_since_epoch();
  const auto seconds =
      std::chrono::duration_cast<std::chrono::seconds>(since_epoch);
  const auto nanos =
      std::chrono::duration_cast<std::chrono::nanoseconds>(since_epoch - seconds);
  timestamp->set_seconds(seconds.count());
  timestamp->set_nanos(static_cast<int32_t>(nanos.count()));
}

void FillIssued(const token::IssuedToken& issued,
                authority_v1::IssuedToken* out) {
  const auto& claims = issued.claims;
  out->set_token(issued.token);
  auto* c = out->mutable_claims();
  c->set_subject(claims.subject);
  c->set_email(claims.email);
  c->set_name(claims.name);
  c->set_role(claims.role);
  c->set_session_id(claims.session_id);
  c->set_kind(claims.kind == token::TokenKind::Refresh
                  ? authority_v1::TOKEN_KIND_REFRESH
                  : authority_v1::TOKEN_KIND_ACCESS);
  c->set_principal(authority_v1::PRINCIPAL_KIND_USER);
  c->set_app_metadata_json(claims.app_metadata);
  c->set_issuer(claims.issuer);
  c->set_token_id(claims.token_id);
  FillTimestamp(claims.issued_at, c->mutable_issued_at());
  FillTimestamp(claims.expires_at, c->mutable_expires_at());
}

void FillSummary(const SamlProvider& provider, v1::ProviderSummary* out) {
  out->set_name(provider.config.name);
  out->set_idp_entity_id(provider.idp.entity_id);
  out->set_sso_url(provider.idp.sso_url);
  out->set_slo_supported(!provider.idp.slo_url.empty());
  out->set_allow_idp_initiated(provider.config.allow_idp_initiated);
  out->set_allow_dashboard_login(provider.config.allow_dashboard_login);
  out->set_allow_app_login(provider.config.allow_app_login);
  out->set_sp_entity_id(provider.sp.entity_id);
  out->set_acs_url(provider.sp.acs_url);
}

std::vector<std::string> ToVector(
    const google::protobuf::RepeatedPtrField<std::string>& values) {
  return std::vector<std::string>(values.begin(), values.end());
}

SamlProviderConfig ToProviderConfig(const v1::ProviderConfig& in) {
  Require(!in.name().empty(), "config.name is required");
  Require(in.name().size() <= kMaxNameBytes, "config.name is too long");
  Require(in.metadata_url().size() <= kMaxUrlBytes,
          "config.metadata_url is too long");
  Require(in.metadata_xml().size() <= kMaxSamlMessageBytes,
          "config.metadata_xml is too large");
  Require(in.sp_certificate_pem().size() <= kMaxPemBytes &&
              in.sp_private_key_pem().size() <= kMaxPemBytes,
          "SP key material is too large");

  SamlProviderConfig config;
  config.name = in.name();
  config.enabled = in.enabled();
  config.entity_id = in.entity_id();
  config.acs_url = in.acs_url();
  config.metadata_url = in.metadata_url();
  config.metadata_xml = in.metadata_xml();
  config.allow_insecure_metadata_url = in.allow_insecure_metadata_url();
  if (!in.email_attribute().empty()) {
    config.attribute_mapping["email"] = in.email_attribute();
  }
  if (!in.name_attribute().empty()) {
    config.attribute_mapping["name"] = in.name_attribute();
  }
  config.auto_create_users = in.auto_create_users();
  if (!in.default_role().empty()) {
    config.default_role = in.default_role();
  }
  config.allow_idp_initiated = in.allow_idp_initiated();
  config.allowed_redirect_hosts = ToVector(in.allowed_redirect_hosts());
  config.group_rules.required_any = ToVector(in.required_groups());
  config.group_rules.required_all = ToVector(in.required_groups_all());
  config.group_rules.denied = ToVector(in.denied_groups());
  if (!in.group_attribute().empty()) {
    config.group_rules.group_attribute = in.group_attribute();
  }
  config.allow_dashboard_login = in.allow_dashboard_login();
  config.allow_app_login = in.allow_app_login();
  config.sp_certificate = in.sp_certificate_pem();
  config.sp_private_key = in.sp_private_key_pem();
  return config;
}

void CheckProviderName(const std::string& name) {
  Require(!name.empty(), "provider is required");
  Require(name.size() <= kMaxNameBytes, "provider is too long");
}

void CheckRedirect(const std::string& value) {
  Require(value.size() <= kMaxRelayStateBytes, "redirect is too long");
}

void CheckMessage(const std::string& value, const char* empty_message) {
  Require(!value.empty(), empty_message);
  Require(value.size() <= kMaxEncodedMessageBytes, "SAML message is too large");
}

}  // namespace

FederationServiceImpl::FederationServiceImpl(
    std::shared_ptr<ProviderRegistry> registry,
    std::shared_ptr<const ProviderLoader> loader,
    std::shared_ptr<SamlEngine> engine,
    std::shared_ptr<shared::StateStore> state_store)
    : registry_(std::move(registry)),
      loader_(std::move(loader)),
      engine_(std::move(engine)),
      state_store_(std::move(state_store)) {
  if (!registry_ || !loader_ || !engine_ || !state_store_) {
    throw std::runtime_error(
        "federation service requires registry, loader, engine and state store");
  }
}

grpc::Status FederationServiceImpl::ListProviders(
    grpc::ServerContext* /*context*/, const v1::ListProvidersRequest* request,
    v1::ListProvidersResponse* response) {
  return HandleRequest("ListProviders", response, [&](std::string* detail) {
    std::vector<ProviderPtr> providers;
    switch (request->surface()) {
      case v1::LOGIN_SURFACE_APP:
        providers = registry_->ListForApp();
        break;
      case v1::LOGIN_SURFACE_DASHBOARD:
        providers = registry_->ListForDashboard();
        break;
      default:
        providers = registry_->List();
        break;
    }
    for (const auto& provider : providers) {
      FillSummary(*provider, response->add_providers());
    }
    *detail = "count=" + std::to_string(providers.size());
    return grpc::Status::OK;
  });
}

grpc::Status FederationServiceImpl::RegisterProvider(
    grpc::ServerContext* /*context*/,
    const v1::RegisterProviderRequest* request,
    v1::RegisterProviderResponse* response) {
  return HandleRequest("RegisterProvider", response, [&](std::string* detail) {
    Require(request->has_config(), "config is required");
    auto provider = loader_->Compile(ToProviderConfig(request->config()));
    FillSummary(*provider, response->mutable_provider());
    *detail = "provider=" + provider->config.name;
    registry_->Register(std::move(provider));
    return grpc::Status::OK;
  });
}

grpc::Status FederationServiceImpl::GetServiceProviderMetadata(
    grpc::ServerContext* /*context*/,
    const v1::GetServiceProviderMetadataRequest* request,
    v1::GetServiceProviderMetadataResponse* response) {
  return HandleRequest(
      "GetServiceProviderMetadata", response, [&](std::string* detail) {
        CheckProviderName(request->provider());
        response->set_metadata_xml(
            engine_->ServiceProviderMetadata(request->provider()));
        *detail = "provider=" + request->provider();
        return grpc::Status::OK;
      });
}

grpc::Status FederationServiceImpl::BeginSamlLogin(
    grpc::ServerContext* /*context*/, const v1::BeginSamlLoginRequest* request,
    v1::BeginSamlLoginResponse* response) {
  return HandleRequest("BeginSamlLogin", response, [&](std::string* detail) {
    CheckProviderName(request->provider());
    CheckRedirect(request->redirect_to());
    const auto start =
        engine_->BeginLogin(request->provider(), request->redirect_to());
    response->set_url(start.url);
    response->set_binding(start.binding == SamlBinding::HttpPost
                              ? v1::SAML_BINDING_HTTP_POST
                              : v1::SAML_BINDING_HTTP_REDIRECT);
    response->set_saml_request(start.encoded_request);
    response->set_relay_state(start.relay_state);
    response->set_request_id(start.request_id);
    *detail = "provider=" + request->provider() +
              " request_id=" + start.request_id;
    return grpc::Status::OK;
  });
}

grpc::Status FederationServiceImpl::CompleteSamlLogin(
    grpc::ServerContext* /*context*/,
    const v1::CompleteSamlLoginRequest* request,
    v1::CompleteSamlLoginResponse* response) {
  return HandleRequest("CompleteSamlLogin", response, [&](std::string* detail) {
    CheckProviderName(request->provider());
    CheckMessage(request->saml_response(), "saml_response is required");
    CheckRedirect(request->relay_state());
    const auto result = engine_->CompleteLogin(
        request->provider(), request->saml_response(), request->relay_state());
    FillIssued(result.tokens.access, response->mutable_access());
    FillIssued(result.tokens.refresh, response->mutable_refresh());
    response->set_user_id(result.user.user_id);
    response->set_email(result.info.email);
    response->set_name(result.tokens.access.claims.name);
    response->set_user_created(result.user.created);
    for (const auto& group : result.groups) {
      response->add_groups(group);
    }
    response->set_redirect_to(result.redirect_to);
    *detail = "provider=" + request->provider() +
              " user_id=" + result.user.user_id;
    return grpc::Status::OK;
  });
}

grpc::Status FederationServiceImpl::BeginSamlLogout(
    grpc::ServerContext* /*context*/, const v1::BeginSamlLogoutRequest* request,
    v1::BeginSamlLogoutResponse* response) {
  return HandleRequest("BeginSamlLogout", response, [&](std::string* detail) {
    CheckProviderName(request->provider());
    Require(!request->user_id().empty(), "user_id is required");
    Require(request->user_id().size() <= kMaxUserIdBytes,
            "user_id is too long");
    CheckRedirect(request->redirect_to());
    const auto start = engine_->BeginLogout(
        request->provider(), request->user_id(), request->redirect_to());
    response->set_url(start.url);
    response->set_request_id(start.request_id);
    *detail = "provider=" + request->provider() +
              " user_id=" + request->user_id();
    return grpc::Status::OK;
  });
}

grpc::Status FederationServiceImpl::HandleSamlLogoutRequest(
    grpc::ServerContext* /*context*/,
    const v1::HandleSamlLogoutRequestRequest* request,
    v1::HandleSamlLogoutRequestResponse* response) {
  return HandleRequest(
      "HandleSamlLogoutRequest", response, [&](std::string* detail) {
        SamlLogoutRequestOutcome outcome;
        if (request->deflated()) {
          Require(!request->raw_query().empty(),
                  "raw_query is required for the redirect binding");
          Require(request->raw_query().size() <= kMaxRedirectQueryBytes,
                  "raw_query is too large");
          outcome = engine_->HandleRedirectLogoutRequest(request->raw_query());
        } else {
          CheckMessage(request->saml_request(), "saml_request is required");
          CheckRedirect(request->relay_state());
          outcome = engine_->HandlePostLogoutRequest(request->saml_request(),
                                                     request->relay_state());
        }
        response->set_provider(outcome.provider);
        response->set_response_url(outcome.response_url);
        for (const auto& user_id : outcome.user_ids) {
          response->add_revoked_user_ids(user_id);
        }
        *detail = "provider=" + outcome.provider + " users=" +
                  std::to_string(outcome.user_ids.size());
        return grpc::Status::OK;
      });
}

grpc::Status FederationServiceImpl::HandleSamlLogoutResponse(
    grpc::ServerContext* /*context*/,
    const v1::HandleSamlLogoutResponseRequest* request,
    v1::HandleSamlLogoutResponseResponse* response) {
  return HandleRequest(
      "HandleSamlLogoutResponse", response, [&](std::string* detail) {
        CheckMessage(request->saml_response(), "saml_response is required");
        const auto outcome = engine_->HandleLogoutResponse(
            request->saml_response(), request->deflated());
        response->set_provider(outcome.provider);
        response->set_success(outcome.success);
        response->set_status(outcome.status);
        response->set_redirect_to(outcome.redirect_to);
        *detail = "provider=" + outcome.provider + " status=" + outcome.status;
        return grpc::Status::OK;
      });
}

grpc::Status FederationServiceImpl::BeginOAuthFlow(
    grpc::ServerContext* /*context*/, const v1::BeginOAuthFlowRequest* request,
    v1::BeginOAuthFlowResponse* response) {
  return HandleRequest("BeginOAuthFlow", response, [&](std::string* detail) {
    CheckProviderName(request->provider());
    Require(request->redirect_uri().size() <= kMaxUrlBytes,
            "redirect_uri is too long");
    const auto flow =
        federation::BeginOAuthFlow(*state_store_, request->provider(),
                                   request->redirect_uri(), request->use_pkce(),
                                   request->use_nonce());
    response->set_state(flow.state);
    response->set_code_challenge(flow.code_challenge);
    response->set_code_challenge_method(flow.code_challenge_method);
    response->set_nonce(flow.nonce);
    response->set_expires_in_seconds(flow.expires_in.count());
    *detail = "provider=" + request->provider();
    return grpc::Status::OK;
  });
}

grpc::Status FederationServiceImpl::CompleteOAuthFlow(
    grpc::ServerContext* /*context*/,
    const v1::CompleteOAuthFlowRequest* request,
    v1::CompleteOAuthFlowResponse* response) {
  return HandleRequest("CompleteOAuthFlow", response, [&](std::string* detail) {
    CheckProviderName(request->provider());
    Require(!request->state().empty(), "state is required");
    Require(request->state().size() <= kMaxRelayStateBytes,
            "state is too long");
    const auto entry = federation::CompleteOAuthFlow(
        *state_store_, request->state(), request->provider());
    response->set_redirect_uri(entry.redirect_uri);
    response->set_code_verifier(entry.code_verifier);
    response->set_nonce(entry.nonce);
    *detail = "provider=" + request->provider();
    return grpc::Status::OK;
  });
}

}  // namespace warden::federation
