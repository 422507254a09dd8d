#pragma once

#include <memory>
#include <optional>
#include <string>

#include "replay_guard.h"
#include "saml_types.h"
#include "signature_verifier.h"
#include "warden/clock.h"

namespace warden::federation {

class AssertionValidator {
 public:
  AssertionValidator(std::shared_ptr<const SignatureVerifier> verifier,
                     std::shared_ptr<ReplayGuard> replay_guard,
                     Clock clock = SystemClock());

  // Validates a base64 samlp:Response for `provider`. When
  // `expected_request_id` is set the response must answer that
  // AuthnRequest; otherwise it must be unsolicited. Throws SamlError.
  SamlAssertion Validate(const SamlProvider& provider,
                         const std::string& encoded_response,
                         const std::optional<std::string>& expected_request_id)
      const;

  // Also checks the IdP's signed logout messages.
  const SignatureVerifier& signature_verifier() const { return *verifier_; }

 private:
  std::shared_ptr<const SignatureVerifier> verifier_;
  std::shared_ptr<ReplayGuard> replay_guard_;
  Clock clock_;
};

}  // namespace warden::federation
