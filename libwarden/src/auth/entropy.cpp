#include "warden/auth/entropy.h"

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <sys/random.h>

#include <openssl/rand.h>

#include "warden/auth/encoding.h"

namespace warden::auth {

namespace {

constexpr std::size_t kStateTokenBytes = 32;

EntropyCheckResult MakeResult(EntropyStatus status, int error_code,
                              const std::string& message) {
  EntropyCheckResult result;
  result.status = status;
  result.error_code = error_code;
  result.message = message;
  return result;
}

}  // namespace

EntropyCheckResult CheckEntropyReady() {
  return CheckEntropyReadyWith(&::getrandom);
}

EntropyCheckResult CheckEntropyReadyWith(GetRandomFn fn) {
  if (!fn) {
    return MakeResult(EntropyStatus::Failed, EINVAL,
                      "entropy source function is required");
  }

  unsigned char sample = 0;
  for (int attempt = 0; attempt < 3; ++attempt) {
    errno = 0;
    const ssize_t read = fn(&sample, sizeof(sample), GRND_NONBLOCK);
    if (read == static_cast<ssize_t>(sizeof(sample))) {
      return MakeResult(EntropyStatus::Ready, 0, "");
    }
    if (read < 0) {
      const int error_code = errno;
      if (error_code == EINTR) {
        continue;
      }
      if (error_code == EAGAIN) {
        return MakeResult(EntropyStatus::Retryable, error_code,
                          "system entropy is not ready; retry startup later");
      }
      return MakeResult(EntropyStatus::Failed, error_code,
                        std::string("entropy preflight failed: ") +
                            std::strerror(error_code));
    }
    return MakeResult(EntropyStatus::Failed, EIO,
                      "entropy preflight returned a short read");
  }

  return MakeResult(EntropyStatus::Retryable, EINTR,
                    "entropy preflight interrupted repeatedly");
}

std::string RandomBytes(std::size_t num_bytes) {
  if (num_bytes == 0) {
    throw std::runtime_error("random byte count must be non-zero");
  }
  std::string buffer(num_bytes, '\0');
  if (RAND_bytes(reinterpret_cast<unsigned char*>(buffer.data()),
                 static_cast<int>(buffer.size())) != 1) {
    throw std::runtime_error("RAND_bytes failed");
  }
  return buffer;
}

std::string GenerateUrlSafeToken(std::size_t num_bytes) {
  return Base64UrlEncode(RandomBytes(num_bytes));
}

std::string GenerateStateToken() {
  return GenerateUrlSafeToken(kStateTokenBytes);
}

std::string GenerateUuidV4() {
  auto bytes = RandomBytes(16);
  bytes[6] = static_cast<char>((static_cast<unsigned char>(bytes[6]) & 0x0f) |
                               0x40);
  bytes[8] = static_cast<char>((static_cast<unsigned char>(bytes[8]) & 0x3f) |
                               0x80);
  const std::string hex = HexEncode(bytes);
  return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) +
         "-" + hex.substr(16, 4) + "-" + hex.substr(20, 12);
}

}  // namespace warden::auth
