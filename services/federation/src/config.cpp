#include "config.h"

#include <cctype>
#include <stdexcept>

#include "log_utils.h"
#include "warden/shared/env_config.h"

namespace warden::federation {
namespace {

std::string Var(const std::string& prefix, const char* suffix) {
  return prefix + suffix;
}

}  // namespace

std::string ProviderEnvPrefix(const std::string& name) {
  std::string prefix = "FEDERATION_SAML_";
  for (char ch : name) {
    const auto uch = static_cast<unsigned char>(ch);
    prefix += std::isalnum(uch) ? static_cast<char>(std::toupper(uch)) : '_';
  }
  prefix += '_';
  return prefix;
}

SamlProviderConfig LoadProviderConfig(const std::string& name) {
  using shared::GetEnvOrDefaultBool;
  using shared::GetEnvOrEmpty;
  using shared::GetEnvList;

  const auto prefix = ProviderEnvPrefix(name);
  auto env = [&prefix](const char* suffix) {
    return GetEnvOrEmpty(Var(prefix, suffix).c_str());
  };
  auto flag = [&prefix](const char* suffix, bool fallback) {
    return GetEnvOrDefaultBool(Var(prefix, suffix).c_str(), fallback);
  };
  auto list = [&prefix](const char* suffix) {
    return GetEnvList(Var(prefix, suffix).c_str());
  };

  SamlProviderConfig config;
  config.name = name;
  config.enabled = flag("ENABLED", true);
  config.entity_id = env("ENTITY_ID");
  config.acs_url = env("ACS_URL");
  config.metadata_url = env("METADATA_URL");
  const auto metadata_file = env("METADATA_FILE");
  if (!metadata_file.empty()) {
    config.metadata_xml = shared::ReadFile(metadata_file);
  }
  if (config.enabled && config.metadata_url.empty() &&
      config.metadata_xml.empty()) {
    throw std::runtime_error(prefix + "METADATA_URL or " + prefix +
                             "METADATA_FILE is required");
  }
  config.allow_insecure_metadata_url =
      flag("ALLOW_INSECURE_METADATA_URL", false);

  const auto email_attr = env("EMAIL_ATTRIBUTE");
  if (!email_attr.empty()) {
    config.attribute_mapping["email"] = email_attr;
  }
  const auto name_attr = env("NAME_ATTRIBUTE");
  if (!name_attr.empty()) {
    config.attribute_mapping["name"] = name_attr;
  }

  config.auto_create_users = flag("AUTO_CREATE_USERS", false);
  const auto role = env("DEFAULT_ROLE");
  if (!role.empty()) {
    config.default_role = role;
  }
  config.allow_idp_initiated = flag("ALLOW_IDP_INITIATED", false);
  config.allowed_redirect_hosts = list("ALLOWED_REDIRECT_HOSTS");
  config.group_rules.required_any = list("REQUIRED_GROUPS");
  config.group_rules.required_all = list("REQUIRED_GROUPS_ALL");
  config.group_rules.denied = list("DENIED_GROUPS");
  const auto group_attr = env("GROUP_ATTRIBUTE");
  if (!group_attr.empty()) {
    config.group_rules.group_attribute = group_attr;
  }
  config.allow_dashboard_login = flag("ALLOW_DASHBOARD_LOGIN", false);
  config.allow_app_login = flag("ALLOW_APP_LOGIN", true);

  const auto cert_file = env("SP_CERT_FILE");
  const auto key_file = env("SP_KEY_FILE");
  if (cert_file.empty() != key_file.empty()) {
    throw std::runtime_error(prefix + "SP_CERT_FILE and " + prefix +
                             "SP_KEY_FILE must be set together");
  }
  if (!cert_file.empty()) {
    config.sp_certificate = shared::ReadFile(cert_file);
    config.sp_private_key = shared::ReadFile(key_file);
  }
  return config;
}

FederationConfig LoadConfig() {
  using shared::GetEnvOrDefaultBool;
  using shared::GetEnvOrDefaultSize;
  using shared::GetEnvOrEmpty;

  FederationConfig config;
  config.bind_addr = GetEnvOrEmpty("FEDERATION_BIND_ADDR");
  config.tls_cert_path = GetEnvOrEmpty("FEDERATION_TLS_CERT");
  config.tls_key_path = GetEnvOrEmpty("FEDERATION_TLS_KEY");
  config.tls_ca_path = GetEnvOrEmpty("FEDERATION_TLS_CA_BUNDLE");
  config.tls_require_client_cert =
      GetEnvOrDefaultBool("FEDERATION_TLS_REQUIRE_CLIENT_CERT", false);
  config.base_url = GetEnvOrEmpty("FEDERATION_BASE_URL");
  config.jwt_secret_file = GetEnvOrEmpty("FEDERATION_JWT_SECRET_FILE");
  config.jwt_issuer =
      shared::GetEnvOrDefault("FEDERATION_JWT_ISSUER", config.jwt_issuer);
  config.access_ttl_seconds = GetEnvOrDefaultSize(
      "FEDERATION_ACCESS_TTL_SECONDS", config.access_ttl_seconds);
  config.refresh_ttl_seconds = GetEnvOrDefaultSize(
      "FEDERATION_REFRESH_TTL_SECONDS", config.refresh_ttl_seconds);
  config.store_backend = shared::ParseStoreBackend(
      GetEnvOrEmpty("FEDERATION_STORE_BACKEND"), "FEDERATION_STORE_BACKEND");
  config.store_uri = GetEnvOrEmpty("FEDERATION_STORE_URI");
  config.state_ttl_seconds = GetEnvOrDefaultSize("FEDERATION_STATE_TTL_SECONDS",
                                                 config.state_ttl_seconds);
  config.state_cleanup_interval_seconds =
      GetEnvOrDefaultSize("FEDERATION_STATE_CLEANUP_INTERVAL_SECONDS",
                          config.state_cleanup_interval_seconds);
  config.replay_grace_milliseconds =
      GetEnvOrDefaultSize("FEDERATION_REPLAY_GRACE_MILLISECONDS",
                          config.replay_grace_milliseconds);
  config.metadata_fetch_timeout_seconds =
      GetEnvOrDefaultSize("FEDERATION_METADATA_FETCH_TIMEOUT_SECONDS",
                          config.metadata_fetch_timeout_seconds);

  if (config.bind_addr.empty()) {
    throw std::runtime_error("FEDERATION_BIND_ADDR is required");
  }
  if (config.tls_cert_path.empty()) {
    throw std::runtime_error("FEDERATION_TLS_CERT is required");
  }
  if (config.tls_key_path.empty()) {
    throw std::runtime_error("FEDERATION_TLS_KEY is required");
  }
  if (config.tls_require_client_cert && config.tls_ca_path.empty()) {
    throw std::runtime_error(
        "FEDERATION_TLS_CA_BUNDLE is required when mTLS is enabled");
  }
  if (config.base_url.empty()) {
    throw std::runtime_error("FEDERATION_BASE_URL is required");
  }
  if (config.jwt_secret_file.empty()) {
    throw std::runtime_error("FEDERATION_JWT_SECRET_FILE is required");
  }
  if (config.jwt_issuer.empty()) {
    throw std::runtime_error("FEDERATION_JWT_ISSUER must not be empty");
  }
  if (config.refresh_ttl_seconds < config.access_ttl_seconds) {
    throw std::runtime_error(
        "FEDERATION_REFRESH_TTL_SECONDS must not be shorter than the access "
        "TTL");
  }
  if (config.store_backend == shared::SharedStoreBackend::Redis &&
      config.store_uri.empty()) {
    throw std::runtime_error(
        "FEDERATION_STORE_URI is required when FEDERATION_STORE_BACKEND=redis");
  }

  // A misconfigured provider is skipped so the others still come up.
  for (const auto& name : shared::GetEnvList("FEDERATION_SAML_PROVIDERS")) {
    try {
      config.providers.push_back(LoadProviderConfig(name));
    } catch (const std::runtime_error& ex) {
      LogFederationWarning("LoadProviderConfig",
                           "provider=" + name + " skipped: " + ex.what());
    }
  }
  return config;
}

}  // namespace warden::federation
