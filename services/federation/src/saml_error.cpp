#include "saml_error.h"

namespace warden::federation {

SamlError::SamlError(Kind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

std::string_view SamlErrorKindName(SamlError::Kind kind) {
  switch (kind) {
    case SamlError::Kind::AssertionInvalid:
      return "assertion_invalid";
    case SamlError::Kind::AssertionExpired:
      return "assertion_expired";
    case SamlError::Kind::AssertionReplayed:
      return "assertion_replayed";
    case SamlError::Kind::AudienceMismatch:
      return "audience_mismatch";
    case SamlError::Kind::MissingEmail:
      return "missing_email";
    case SamlError::Kind::ProviderNotFound:
      return "provider_not_found";
    case SamlError::Kind::ProviderDisabled:
      return "provider_disabled";
    case SamlError::Kind::InvalidRedirect:
      return "invalid_redirect";
    case SamlError::Kind::MetadataFetchFailed:
      return "metadata_fetch_failed";
    case SamlError::Kind::MetadataInsecureURL:
      return "metadata_insecure_url";
    case SamlError::Kind::MetadataParseFailed:
      return "metadata_parse_failed";
    case SamlError::Kind::GroupAccessDenied:
      return "group_access_denied";
    case SamlError::Kind::StateInvalid:
      return "state_invalid";
    case SamlError::Kind::UserNotProvisioned:
      return "user_not_provisioned";
    case SamlError::Kind::SloNotSupported:
      return "slo_not_supported";
    case SamlError::Kind::SigningKeyMissing:
      return "signing_key_missing";
    case SamlError::Kind::InvalidLogoutMessage:
      return "invalid_logout_message";
    case SamlError::Kind::Configuration:
      return "configuration";
  }
  return "unknown";
}

}  // namespace warden::federation
