#include "config.h"

#include <stdexcept>

#include "warden/shared/env_config.h"

namespace warden::authority {

AuthorityConfig LoadConfig() {
  using shared::GetEnvOrDefaultBool;
  using shared::GetEnvOrDefaultSize;
  using shared::GetEnvOrEmpty;

  AuthorityConfig config;
  config.bind_addr = GetEnvOrEmpty("AUTHORITY_BIND_ADDR");
  config.tls_cert_path = GetEnvOrEmpty("AUTHORITY_TLS_CERT");
  config.tls_key_path = GetEnvOrEmpty("AUTHORITY_TLS_KEY");
  config.tls_ca_path = GetEnvOrEmpty("AUTHORITY_TLS_CA_BUNDLE");
  config.tls_require_client_cert =
      GetEnvOrDefaultBool("AUTHORITY_TLS_REQUIRE_CLIENT_CERT", false);
  config.jwt_secret_file = GetEnvOrEmpty("AUTHORITY_JWT_SECRET_FILE");
  config.jwt_issuer =
      shared::GetEnvOrDefault("AUTHORITY_JWT_ISSUER", config.jwt_issuer);
  config.access_ttl_seconds = GetEnvOrDefaultSize(
      "AUTHORITY_ACCESS_TTL_SECONDS", config.access_ttl_seconds);
  config.refresh_ttl_seconds = GetEnvOrDefaultSize(
      "AUTHORITY_REFRESH_TTL_SECONDS", config.refresh_ttl_seconds);
  config.anonymous_ttl_seconds = GetEnvOrDefaultSize(
      "AUTHORITY_ANON_TTL_SECONDS", config.anonymous_ttl_seconds);
  config.service_role_ttl_seconds = GetEnvOrDefaultSize(
      "AUTHORITY_SERVICE_ROLE_TTL_SECONDS", config.service_role_ttl_seconds);
  if (!GetEnvOrEmpty("AUTHORITY_ACCEPTED_ISSUERS").empty()) {
    config.accepted_issuers = shared::GetEnvList("AUTHORITY_ACCEPTED_ISSUERS");
  }
  config.store_backend = shared::ParseStoreBackend(
      GetEnvOrEmpty("AUTHORITY_STORE_BACKEND"), "AUTHORITY_STORE_BACKEND");
  config.store_uri = GetEnvOrEmpty("AUTHORITY_STORE_URI");
  config.sweep_interval_seconds = GetEnvOrDefaultSize(
      "AUTHORITY_SWEEP_INTERVAL_SECONDS", config.sweep_interval_seconds);

  if (config.bind_addr.empty()) {
    throw std::runtime_error("AUTHORITY_BIND_ADDR is required");
  }
  if (config.tls_cert_path.empty()) {
    throw std::runtime_error("AUTHORITY_TLS_CERT is required");
  }
  if (config.tls_key_path.empty()) {
    throw std::runtime_error("AUTHORITY_TLS_KEY is required");
  }
  if (config.jwt_secret_file.empty()) {
    throw std::runtime_error("AUTHORITY_JWT_SECRET_FILE is required");
  }
  if (config.jwt_issuer.empty()) {
    throw std::runtime_error("AUTHORITY_JWT_ISSUER must not be empty");
  }
  if (config.refresh_ttl_seconds < config.access_ttl_seconds) {
    throw std::runtime_error(
        "AUTHORITY_REFRESH_TTL_SECONDS must not be shorter than the access TTL");
  }
  if (config.tls_require_client_cert && config.tls_ca_path.empty()) {
    throw std::runtime_error(
        "AUTHORITY_TLS_CA_BUNDLE is required when mTLS is enabled");
  }
  if (config.store_backend == shared::SharedStoreBackend::Redis &&
      config.store_uri.empty()) {
    throw std::runtime_error(
        "AUTHORITY_STORE_URI is required when AUTHORITY_STORE_BACKEND=redis");
  }
  return config;
}

}  // namespace warden::authority
