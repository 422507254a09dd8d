#include "warden/shared/secret_file.h"

#include <stdexcept>

#include <openssl/crypto.h>

#include "warden/shared/env_config.h"

namespace warden::shared {

void SecureErase(std::string* data) {
  if (!data || data->empty()) {
    return;
  }
  OPENSSL_cleanse(data->data(), data->size());
  data->clear();
}

std::string LoadSecretFile(const std::string& path, std::size_t min_bytes,
                           const char* name) {
  auto secret = ReadFile(path);
  if (!secret.empty() && secret.back() == '\n') {
    secret.pop_back();
    if (!secret.empty() && secret.back() == '\r') {
      secret.pop_back();
    }
  }
  if (secret.size() < min_bytes) {
    SecureErase(&secret);
    throw std::runtime_error(std::string(name) + " must contain at least " +
                             std::to_string(min_bytes) + " bytes");
  }
  return secret;
}

}  // namespace warden::shared
