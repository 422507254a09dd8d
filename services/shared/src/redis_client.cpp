#include "redis_client.h"

#include <chrono>

namespace warden::shared {

sw::redis::ConnectionOptions BuildRedisOptions(
    const RedisConnectionConfig& parsed) {
  sw::redis::ConnectionOptions options;
  options.host = parsed.host;
  options.port = parsed.port;
  options.db = parsed.db;
  if (!parsed.username.empty()) {
    options.user = parsed.username;
  }
  if (!parsed.password.empty()) {
    options.password = parsed.password;
  }
  options.connect_timeout = std::chrono::milliseconds(200);
  options.socket_timeout = std::chrono::milliseconds(200);
  if (parsed.use_tls) {
#if defined(SEWENEW_REDISPLUSPLUS_NO_TLS_H)
    throw SharedStoreError(SharedStoreError::Kind::Unavailable,
                           "Redis client library was built without TLS support");
#else
    options.tls.enabled = true;
    options.tls.cacert = parsed.tls_ca_cert_path;
    options.tls.cacertdir = parsed.tls_ca_cert_dir;
    options.tls.cert = parsed.tls_cert_path;
    options.tls.key = parsed.tls_key_path;
    options.tls.sni = parsed.tls_sni.empty() ? parsed.host : parsed.tls_sni;
#if defined(REDIS_PLUS_PLUS_TLS_VERIFY_MODE)
    options.tls.verify_mode =
        parsed.tls_verify_peer ? REDIS_SSL_VERIFY_PEER : REDIS_SSL_VERIFY_NONE;
#else
    if (!parsed.tls_verify_peer) {
      throw SharedStoreError(
          SharedStoreError::Kind::Unavailable,
          "Redis TLS verify mode override is unsupported in this build");
    }
#endif
#endif
  }
  return options;
}

std::unique_ptr<sw::redis::Redis> ConnectRedis(const std::string& uri) {
  const auto options = BuildRedisOptions(ParseRedisConnectionConfig(uri));
  try {
    return std::make_unique<sw::redis::Redis>(options);
  } catch (const sw::redis::Error& ex) {
    ThrowUnavailable(ex);
  }
}

void ThrowUnavailable(const sw::redis::Error& error) {
  throw SharedStoreError(SharedStoreError::Kind::Unavailable, error.what());
}

}  // namespace warden::shared
