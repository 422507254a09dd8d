#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "saml_types.h"
#include "warden/shared/shared_store.h"

namespace warden::federation {

inline constexpr std::size_t kMinSigningSecretBytes = 32;

struct FederationConfig {
  std::string bind_addr;
  std::string tls_cert_path;
  std::string tls_key_path;
  std::string tls_ca_path;
  bool tls_require_client_cert = false;

  // Public origin the SP endpoints are derived from.
  std::string base_url;

  std::string jwt_secret_file;
  std::string jwt_issuer = "warden";
  size_t access_ttl_seconds = 15 * 60;
  size_t refresh_ttl_seconds = 7 * 24 * 60 * 60;

  shared::SharedStoreBackend store_backend = shared::SharedStoreBackend::InMemory;
  std::string store_uri;
  size_t state_ttl_seconds = 600;
  size_t state_cleanup_interval_seconds = 300;
  size_t replay_grace_milliseconds = 1000;
  size_t metadata_fetch_timeout_seconds = 30;

  std::vector<SamlProviderConfig> providers;
};

FederationConfig LoadConfig();

// FEDERATION_SAML_<NAME>_* settings for one provider. <NAME> is the
// provider name uppercased with non-alphanumerics mapped to '_'.
SamlProviderConfig LoadProviderConfig(const std::string& name);

std::string ProviderEnvPrefix(const std::string& name);

}  // namespace warden::federation
