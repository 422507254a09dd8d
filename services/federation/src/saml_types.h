#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "warden/clock.h"

namespace warden::federation {

inline constexpr char kBindingHttpPost[] =
    "urn:oasis:names:tc:SAML:2.0:bindings:HTTP-POST";
inline constexpr char kBindingHttpRedirect[] =
    "urn:oasis:names:tc:SAML:2.0:bindings:HTTP-Redirect";

inline constexpr char kNameIdFormatUnspecified[] =
    "urn:oasis:names:tc:SAML:1.1:nameid-format:unspecified";
inline constexpr char kNameIdFormatEmail[] =
    "urn:oasis:names:tc:SAML:1.1:nameid-format:emailAddress";

inline constexpr char kStatusSuccess[] =
    "urn:oasis:names:tc:SAML:2.0:status:Success";

inline constexpr char kDefaultEmailAttribute[] =
    "http://schemas.xmlsoap.org/ws/2005/05/identity/claims/emailaddress";
inline constexpr char kDefaultNameAttribute[] =
    "http://schemas.xmlsoap.org/ws/2005/05/identity/claims/name";

// Upper bound for any decoded or inflated SAML protocol message.
inline constexpr size_t kMaxSamlMessageBytes = 256 * 1024;

enum class SamlBinding {
  HttpPost,
  HttpRedirect,
};

const char* BindingUri(SamlBinding binding);

struct GroupRules {
  std::vector<std::string> required_any;
  std::vector<std::string> required_all;
  std::vector<std::string> denied;
  std::string group_attribute = "groups";
};

struct SamlProviderConfig {
  std::string name;
  bool enabled = true;

  // Derived from the service base URL when left empty.
  std::string entity_id;
  std::string acs_url;

  // Exactly one of these is used; inline XML wins.
  std::string metadata_url;
  std::string metadata_xml;
  bool allow_insecure_metadata_url = false;

  // "email" and "name" keys pick the attribute names to read.
  std::map<std::string, std::string> attribute_mapping;
  bool auto_create_users = false;
  std::string default_role = "authenticated";

  bool allow_idp_initiated = false;
  std::vector<std::string> allowed_redirect_hosts;
  GroupRules group_rules;

  bool allow_dashboard_login = false;
  bool allow_app_login = true;

  // PEM, or bare base64 DER.
  std::string sp_certificate;
  std::string sp_private_key;
};

struct IdpDescriptor {
  std::string entity_id;
  std::string sso_url;
  SamlBinding sso_binding = SamlBinding::HttpRedirect;
  std::string slo_url;
  SamlBinding slo_binding = SamlBinding::HttpRedirect;
  // Base64 DER of the IdP signing certificate.
  std::string signing_certificate;
};

struct SpDescriptor {
  std::string entity_id;
  std::string acs_url;
  std::string slo_url;
  std::string metadata_url;
};

class SpSigningKey;

// Immutable once registered. Replaced wholesale on re-registration.
struct SamlProvider {
  SamlProviderConfig config;
  IdpDescriptor idp;
  SpDescriptor sp;
  std::shared_ptr<const SpSigningKey> signing_key;
};

struct SamlAssertion {
  std::string id;
  std::string issuer;
  std::string name_id;
  std::string name_id_format;
  std::string session_index;
  std::string in_response_to;
  // Keyed by Name and, when present, FriendlyName.
  std::map<std::string, std::vector<std::string>> attributes;
  TimePoint issue_instant{};
  TimePoint not_before{};
  TimePoint not_on_or_after{};
};

struct SamlUserInfo {
  std::string email;
  std::string name;
};

}  // namespace warden::federation
