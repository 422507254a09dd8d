#pragma once

#include <string>

#include <xercesc/dom/DOM.hpp>

namespace warden::federation {

class SignatureVerifier {
 public:
  virtual ~SignatureVerifier() = default;

  // True when `signature` is an enveloped XML signature whose reference
  // points at `signed_element` and which verifies with the base64 DER
  // certificate. `error` receives the reason on failure.
  virtual bool Verify(xercesc::DOMDocument* document,
                      xercesc::DOMElement* signed_element,
                      xercesc::DOMElement* signature,
                      const std::string& certificate_base64,
                      std::string* error) const = 0;
};

// XML-Security-C backed verifier.
class XsecSignatureVerifier final : public SignatureVerifier {
 public:
  bool Verify(xercesc::DOMDocument* document,
              xercesc::DOMElement* signed_element,
              xercesc::DOMElement* signature,
              const std::string& certificate_base64,
              std::string* error) const override;
};

}  // namespace warden::federation
