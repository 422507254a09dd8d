#pragma once

#include <cstddef>
#include <string>
#include <sys/types.h>

namespace warden::auth {

enum class EntropyStatus {
  Ready,
  Retryable,
  Failed,
};

struct EntropyCheckResult {
  EntropyStatus status = EntropyStatus::Failed;
  int error_code = 0;
  std::string message;
};

using GetRandomFn = ssize_t (*)(void*, size_t, unsigned int);

// Services refuse to mint credentials until the kernel CSPRNG is seeded.
EntropyCheckResult CheckEntropyReady();
EntropyCheckResult CheckEntropyReadyWith(GetRandomFn fn);

std::string RandomBytes(std::size_t num_bytes);

// 32 random bytes, base64url without padding. Used for OAuth state and SAML
// RelayState nonces.
std::string GenerateStateToken();

std::string GenerateUrlSafeToken(std::size_t num_bytes);

// RFC 4122 version 4, lowercase.
std::string GenerateUuidV4();

}  // namespace warden::auth
