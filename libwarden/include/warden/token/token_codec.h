#pragma once

#include <memory>
#include <string>
#include <string_view>

#include "warden/clock.h"
#include "warden/token/claims.h"

namespace warden::auth {
class SigningSecret;
}

namespace warden::token {

inline constexpr char kSigningAlgorithm[] = "HS256";

// Compact HS256 JWT encoding. Holds only the immutable key, so one instance
// can be shared across threads.
class TokenCodec {
 public:
  explicit TokenCodec(std::string_view secret, Clock clock = SystemClock());
  ~TokenCodec();

  TokenCodec(const TokenCodec&) = delete;
  TokenCodec& operator=(const TokenCodec&) = delete;

  std::string Sign(const TokenClaims& claims) const;

  // Throws TokenError: Invalid for structure, algorithm, signature and
  // not-before failures, Expired once exp has passed.
  TokenClaims Verify(const std::string& token) const;

  // Same checks except expiry. Revocation resolves expired tokens too.
  TokenClaims VerifyIgnoringExpiry(const std::string& token) const;

  TimePoint Now() const { return clock_(); }

 private:
  TokenClaims Decode(const std::string& token, bool enforce_expiry) const;

  std::unique_ptr<auth::SigningSecret> secret_;
  Clock clock_;
};

}  // namespace warden::token
