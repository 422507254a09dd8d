#pragma once

#include <stdexcept>
#include <string>

namespace warden::token {

class TokenError : public std::runtime_error {
 public:
  enum class Kind {
    Invalid,
    Expired,
    CannotRevokeServiceRole,
    InvalidRequest,
  };

  TokenError(Kind kind, const std::string& message);

  Kind kind() const noexcept { return kind_; }

 private:
  Kind kind_;
};

}  // namespace warden::token
