#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace warden::federation {

class SamlError : public std::runtime_error {
 public:
  enum class Kind {
    AssertionInvalid,
    AssertionExpired,
    AssertionReplayed,
    AudienceMismatch,
    MissingEmail,
    ProviderNotFound,
    ProviderDisabled,
    InvalidRedirect,
    MetadataFetchFailed,
    MetadataInsecureURL,
    MetadataParseFailed,
    GroupAccessDenied,
    StateInvalid,
    UserNotProvisioned,
    SloNotSupported,
    SigningKeyMissing,
    InvalidLogoutMessage,
    Configuration,
  };

  SamlError(Kind kind, const std::string& message);

  Kind kind() const noexcept { return kind_; }

 private:
  Kind kind_;
};

std::string_view SamlErrorKindName(SamlError::Kind kind);

}  // namespace warden::federation
