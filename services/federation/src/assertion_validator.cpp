#include "assertion_validator.h"

#include <stdexcept>
#include <utility>
#include <vector>

#include "log_utils.h"
#include "saml_error.h"
#include "warden/auth/encoding.h"
#include "xml_document.h"

namespace warden::federation {
namespace {

using xercesc::DOMElement;

[[noreturn]] void Invalid(const std::string& message) {
  throw SamlError(SamlError::Kind::AssertionInvalid, message);
}

TimePoint ParseInstant(const DOMElement* element, const char* name) {
  try {
    return ParseXmlDateTime(GetAttribute(element, name));
  } catch (const XmlError& ex) {
    Invalid(std::string("invalid ") + name + ": " + ex.what());
  }
}

void CheckStatus(const DOMElement* response) {
  auto* status = FindChild(response, kSamlProtocolNs, "Status");
  auto* code = FindChild(status, kSamlProtocolNs, "StatusCode");
  const auto value = GetAttribute(code, "Value");
  if (value != kStatusSuccess) {
    Invalid("SAML response status is " +
            (value.empty() ? std::string("missing") : value));
  }
}

DOMElement* SingleAssertion(const DOMElement* response) {
  if (FindChild(response, kSamlAssertionNs, "EncryptedAssertion")) {
    Invalid("encrypted assertions are not supported");
  }
  auto assertions = FindChildren(response, kSamlAssertionNs, "Assertion");
  if (assertions.size() != 1) {
    Invalid("SAML response must contain exactly one assertion");
  }
  return assertions.front();
}

void CheckInResponseTo(const DOMElement* response,
                       const DOMElement* confirmation_data,
                       const std::optional<std::string>& expected) {
  const bool response_has = HasAttribute(response, "InResponseTo");
  const bool subject_has = HasAttribute(confirmation_data, "InResponseTo");
  const auto response_value = GetAttribute(response, "InResponseTo");
  const auto subject_value = GetAttribute(confirmation_data, "InResponseTo");

  if (!expected) {
    if (response_has || subject_has) {
      Invalid("unsolicited response must not carry InResponseTo");
    }
    return;
  }
  if (!response_has && !subject_has) {
    Invalid("response does not answer a known AuthnRequest");
  }
  if ((response_has && response_value != *expected) ||
      (subject_has && subject_value != *expected)) {
    Invalid("InResponseTo does not match the AuthnRequest");
  }
}

void CheckAudience(const SamlProvider& provider, const DOMElement* conditions) {
  std::vector<std::string> audiences;
  for (auto* restriction :
       FindChildren(conditions, kSamlAssertionNs, "AudienceRestriction")) {
    for (auto* audience :
         FindChildren(restriction, kSamlAssertionNs, "Audience")) {
      audiences.push_back(TextContent(audience));
    }
  }
  if (audiences.empty()) {
    return;
  }
  for (const auto& audience : audiences) {
    if (audience == provider.sp.entity_id ||
        audience == provider.sp.metadata_url) {
      return;
    }
  }
  LogFederationWarning("ValidateAssertion",
                       "audience mismatch for provider " +
                           provider.config.name + ": got " + audiences.front());
  throw SamlError(SamlError::Kind::AudienceMismatch,
                  "assertion audience does not include this service provider");
}

void CollectAttributes(const DOMElement* assertion, SamlAssertion* out) {
  for (auto* statement :
       FindChildren(assertion, kSamlAssertionNs, "AttributeStatement")) {
    for (auto* attribute :
         FindChildren(statement, kSamlAssertionNs, "Attribute")) {
      std::vector<std::string> values;
      for (auto* value :
           FindChildren(attribute, kSamlAssertionNs, "AttributeValue")) {
        values.push_back(TextContent(value));
      }
      const auto name = GetAttribute(attribute, "Name");
      const auto friendly = GetAttribute(attribute, "FriendlyName");
      if (!name.empty()) {
        auto& slot = out->attributes[name];
        slot.insert(slot.end(), values.begin(), values.end());
      }
      if (!friendly.empty() && friendly != name) {
        auto& slot = out->attributes[friendly];
        slot.insert(slot.end(), values.begin(), values.end());
      }
    }
  }
  for (auto* statement :
       FindChildren(assertion, kSamlAssertionNs, "AuthnStatement")) {
    const auto index = GetAttribute(statement, "SessionIndex");
    if (!index.empty()) {
      out->session_index = index;
      break;
    }
  }
}

}  // namespace

AssertionValidator::AssertionValidator(
    std::shared_ptr<const SignatureVerifier> verifier,
    std::shared_ptr<ReplayGuard> replay_guard, Clock clock)
    : verifier_(std::move(verifier)),
      replay_guard_(std::move(replay_guard)),
      clock_(std::move(clock)) {
  if (!verifier_ || !replay_guard_) {
    throw std::runtime_error("signature verifier and replay guard are required");
  }
}

SamlAssertion AssertionValidator::Validate(
    const SamlProvider& provider, const std::string& encoded_response,
    const std::optional<std::string>& expected_request_id) const {
  std::string xml;
  try {
    xml = auth::Base64Decode(encoded_response);
  } catch (const std::invalid_argument&) {
    Invalid("SAML response is not valid base64");
  }

  XmlDocument document = [&xml] {
    try {
      return XmlDocument::Parse(xml);
    } catch (const XmlError& ex) {
      Invalid(ex.what());
    }
  }();

  DOMElement* response = document.root();
  if (!IsElement(response, kSamlProtocolNs, "Response")) {
    Invalid("root element is not samlp:Response");
  }
  CheckStatus(response);
  DOMElement* assertion = SingleAssertion(response);

  SamlAssertion out;
  out.id = GetAttribute(assertion, "ID");
  if (out.id.empty()) {
    Invalid("assertion has no ID");
  }
  if (out.id == GetAttribute(response, "ID")) {
    Invalid("assertion and response share an ID");
  }

  DOMElement* signed_element = assertion;
  DOMElement* signature = FindChild(assertion, kXmlDsigNs, "Signature");
  if (!signature) {
    signed_element = response;
    signature = FindChild(response, kXmlDsigNs, "Signature");
  }
  if (!signature) {
    Invalid("neither the response nor the assertion is signed");
  }
  std::string signature_error;
  if (!verifier_->Verify(document.document(), signed_element, signature,
                         provider.idp.signing_certificate, &signature_error)) {
    Invalid(signature_error.empty() ? "signature verification failed"
                                    : signature_error);
  }

  auto* subject = FindChild(assertion, kSamlAssertionNs, "Subject");
  auto* name_id = FindChild(subject, kSamlAssertionNs, "NameID");
  auto* conditions = FindChild(assertion, kSamlAssertionNs, "Conditions");
  if (!subject || !name_id) {
    Invalid("assertion has no Subject/NameID");
  }
  if (!conditions) {
    Invalid("assertion has no Conditions");
  }
  auto* confirmation =
      FindChild(subject, kSamlAssertionNs, "SubjectConfirmation");
  auto* confirmation_data =
      FindChild(confirmation, kSamlAssertionNs, "SubjectConfirmationData");
  CheckInResponseTo(response, confirmation_data, expected_request_id);

  out.issuer = TextContent(FindChild(assertion, kSamlAssertionNs, "Issuer"));
  if (out.issuer != provider.idp.entity_id) {
    Invalid("assertion issuer does not match the IdP");
  }
  auto* response_issuer = FindChild(response, kSamlAssertionNs, "Issuer");
  if (response_issuer && TextContent(response_issuer) != provider.idp.entity_id) {
    Invalid("response issuer does not match the IdP");
  }
  if (HasAttribute(response, "Destination") &&
      GetAttribute(response, "Destination") != provider.sp.acs_url) {
    Invalid("response destination does not match the ACS URL");
  }

  out.name_id = TextContent(name_id);
  out.name_id_format = GetAttribute(name_id, "Format");
  if (out.name_id.empty()) {
    Invalid("assertion NameID is empty");
  }
  out.in_response_to = expected_request_id.value_or("");
  if (HasAttribute(assertion, "IssueInstant")) {
    out.issue_instant = ParseInstant(assertion, "IssueInstant");
  }

  const auto now = clock_();
  if (HasAttribute(conditions, "NotBefore")) {
    out.not_before = ParseInstant(conditions, "NotBefore");
    if (now < out.not_before) {
      Invalid("assertion is not yet valid");
    }
  }
  if (!HasAttribute(conditions, "NotOnOrAfter")) {
    Invalid("assertion Conditions lack NotOnOrAfter");
  }
  out.not_on_or_after = ParseInstant(conditions, "NotOnOrAfter");
  if (now >= out.not_on_or_after) {
    throw SamlError(SamlError::Kind::AssertionExpired, "assertion has expired");
  }
  if (HasAttribute(confirmation_data, "NotOnOrAfter") &&
      now >= ParseInstant(confirmation_data, "NotOnOrAfter")) {
    throw SamlError(SamlError::Kind::AssertionExpired,
                    "subject confirmation has expired");
  }

  CheckAudience(provider, conditions);
  CollectAttributes(assertion, &out);

  replay_guard_->CheckAndRecord(out.id, out.not_on_or_after);
  return out;
}

}  // namespace warden::federation
