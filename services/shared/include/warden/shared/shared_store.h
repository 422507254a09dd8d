#pragma once

#include <stdexcept>
#include <string>

namespace warden::shared {

enum class SharedStoreBackend {
  InMemory,
  Redis,
};

struct SharedStoreConfig {
  SharedStoreBackend backend = SharedStoreBackend::InMemory;
  std::string redis_uri;
};

class SharedStoreError : public std::runtime_error {
 public:
  enum class Kind {
    InvalidArgument,
    Conflict,
    NotFound,
    Unavailable,
  };

  SharedStoreError(Kind kind, const std::string& message);

  Kind kind() const noexcept;

 private:
  Kind kind_;
};

struct RedisConnectionConfig {
  std::string host;
  int port = 6379;
  int db = 0;
  std::string username;
  std::string password;
  bool use_tls = false;
  bool tls_verify_peer = true;
  std::string tls_ca_cert_path;
  std::string tls_ca_cert_dir;
  std::string tls_cert_path;
  std::string tls_key_path;
  std::string tls_sni;
};

// Accepts redis:// and rediss:// URIs with optional credentials, database
// index and TLS query parameters (cacert, cacertdir, cert, key, sni,
// verify_peer).
RedisConnectionConfig ParseRedisConnectionConfig(const std::string& uri);

}  // namespace warden::shared
