#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "warden/shared/shared_store.h"

namespace warden::authority {

inline constexpr std::size_t kMinSigningSecretBytes = 32;

struct AuthorityConfig {
  std::string bind_addr;
  std::string tls_cert_path;
  std::string tls_key_path;
  std::string tls_ca_path;
  bool tls_require_client_cert = false;

  std::string jwt_secret_file;
  std::string jwt_issuer = "warden";
  size_t access_ttl_seconds = 15 * 60;
  size_t refresh_ttl_seconds = 7 * 24 * 60 * 60;
  size_t anonymous_ttl_seconds = 24 * 60 * 60;
  size_t service_role_ttl_seconds = 24 * 60 * 60;
  std::vector<std::string> accepted_issuers = {"supabase-demo", "supabase"};

  shared::SharedStoreBackend store_backend = shared::SharedStoreBackend::InMemory;
  std::string store_uri;
  size_t sweep_interval_seconds = 60 * 60;
};

AuthorityConfig LoadConfig();

}  // namespace warden::authority
