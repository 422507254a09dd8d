#include "single_logout.h"

#include <optional>
#include <stdexcept>

#include "authn_request.h"
#include "redirect_binding.h"
#include "saml_error.h"
#include "sp_signing_key.h"
#include "warden/auth/encoding.h"
#include "xml_document.h"

namespace warden::federation {
namespace {

[[noreturn]] void InvalidMessage(const std::string& message) {
  throw SamlError(SamlError::Kind::InvalidLogoutMessage, message);
}

std::string LogoutRequestXml(const SamlProvider& provider,
                             const std::string& id,
                             const std::string& name_id,
                             const std::string& name_id_format,
                             const std::string& session_index, TimePoint now) {
  std::string xml = "<samlp:LogoutRequest xmlns:samlp=\"";
  xml += kSamlProtocolNs;
  xml += "\" xmlns:saml=\"";
  xml += kSamlAssertionNs;
  xml += "\" ID=\"" + XmlEscape(id) + "\" Version=\"2.0\"";
  xml += " IssueInstant=\"" + FormatXmlDateTime(now) + "\"";
  xml += " Destination=\"" + XmlEscape(provider.idp.slo_url) + "\">";
  xml += "<saml:Issuer>" + XmlEscape(provider.sp.entity_id) + "</saml:Issuer>";
  xml += "<saml:NameID";
  if (!name_id_format.empty()) {
    xml += " Format=\"" + XmlEscape(name_id_format) + "\"";
  }
  xml += ">" + XmlEscape(name_id) + "</saml:NameID>";
  if (!session_index.empty()) {
    xml += "<samlp:SessionIndex>" + XmlEscape(session_index) +
           "</samlp:SessionIndex>";
  }
  xml += "</samlp:LogoutRequest>";
  return xml;
}

std::string LogoutResponseXml(const SamlProvider& provider,
                              const std::string& id,
                              const std::string& in_response_to,
                              TimePoint now) {
  std::string xml = "<samlp:LogoutResponse xmlns:samlp=\"";
  xml += kSamlProtocolNs;
  xml += "\" xmlns:saml=\"";
  xml += kSamlAssertionNs;
  xml += "\" ID=\"" + XmlEscape(id) + "\" Version=\"2.0\"";
  xml += " IssueInstant=\"" + FormatXmlDateTime(now) + "\"";
  xml += " Destination=\"" + XmlEscape(provider.idp.slo_url) + "\"";
  xml += " InResponseTo=\"" + XmlEscape(in_response_to) + "\">";
  xml += "<saml:Issuer>" + XmlEscape(provider.sp.entity_id) + "</saml:Issuer>";
  xml += "<samlp:Status><samlp:StatusCode Value=\"";
  xml += kStatusSuccess;
  xml += "\"/></samlp:Status>";
  xml += "</samlp:LogoutResponse>";
  return xml;
}

// The signature covers the exact URL-encoded octets that go on the wire,
// in SAMLRequest/SAMLResponse, RelayState, SigAlg order.
std::string RedirectUrl(const SamlProvider& provider, const char* parameter,
                        const std::string& xml, const std::string& relay_state,
                        bool sign) {
  std::string query = std::string(parameter) + "=" +
                      auth::UrlEncode(EncodeRedirectPayload(xml));
  if (!relay_state.empty()) {
    query += "&RelayState=" + auth::UrlEncode(relay_state);
  }
  if (sign) {
    query += "&SigAlg=" + auth::UrlEncode(kSigAlgRsaSha256);
    const auto signature = provider.signing_key->SignRsaSha256(query);
    query += "&Signature=" + auth::UrlEncode(auth::Base64Encode(signature));
  }
  const auto& base = provider.idp.slo_url;
  const char separator = base.find('?') == std::string::npos ? '?' : '&';
  return base + separator + query;
}

XmlDocument ParseMessage(const std::string& encoded, bool deflated,
                         const char* root_name) {
  if (encoded.empty()) {
    InvalidMessage(std::string(root_name) + " is empty");
  }
  std::string xml;
  try {
    xml = DecodeBindingPayload(encoded, deflated, kMaxSamlMessageBytes);
  } catch (const std::runtime_error& ex) {
    InvalidMessage(std::string(root_name) + ": " + ex.what());
  }
  try {
    auto document = XmlDocument::Parse(xml);
    if (!IsElement(document.root(), kSamlProtocolNs, root_name)) {
      InvalidMessage(std::string("root element is not samlp:") + root_name);
    }
    return document;
  } catch (const XmlError& ex) {
    InvalidMessage(std::string(root_name) + ": " + ex.what());
  }
}

// Raw value of `key`, nullopt when the parameter is absent.
std::optional<std::string_view> RawQueryValue(std::string_view query,
                                              std::string_view key) {
  while (!query.empty()) {
    const auto end = query.find('&');
    const auto pair = query.substr(0, end);
    const auto equals = pair.find('=');
    if (pair.substr(0, equals) == key) {
      if (equals == std::string_view::npos) {
        return std::string_view();
      }
      return pair.substr(equals + 1);
    }
    if (end == std::string_view::npos) {
      break;
    }
    query.remove_prefix(end + 1);
  }
  return std::nullopt;
}

}  // namespace

LogoutRedirect BuildLogoutRequest(const SamlProvider& provider,
                                  const std::string& name_id,
                                  const std::string& name_id_format,
                                  const std::string& session_index,
                                  const std::string& relay_state,
                                  TimePoint now) {
  if (provider.idp.slo_url.empty()) {
    throw SamlError(SamlError::Kind::SloNotSupported,
                    "IdP for " + provider.config.name +
                        " does not publish a logout endpoint");
  }
  if (!provider.signing_key) {
    throw SamlError(SamlError::Kind::SigningKeyMissing,
                    "provider " + provider.config.name +
                        " has no SP signing key");
  }
  if (name_id.empty()) {
    throw SamlError(SamlError::Kind::InvalidLogoutMessage,
                    "NameID is required for logout");
  }
  LogoutRedirect redirect;
  redirect.id = GenerateSamlId();
  const auto xml = LogoutRequestXml(provider, redirect.id, name_id,
                                    name_id_format, session_index, now);
  redirect.url = RedirectUrl(provider, "SAMLRequest", xml, relay_state, true);
  return redirect;
}

LogoutRedirect BuildLogoutResponse(const SamlProvider& provider,
                                   const std::string& in_response_to,
                                   const std::string& relay_state,
                                   TimePoint now) {
  if (provider.idp.slo_url.empty()) {
    throw SamlError(SamlError::Kind::SloNotSupported,
                    "IdP for " + provider.config.name +
                        " does not publish a logout endpoint");
  }
  LogoutRedirect redirect;
  const auto xml =
      LogoutResponseXml(provider, GenerateSamlId(), in_response_to, now);
  redirect.url = RedirectUrl(provider, "SAMLResponse", xml, relay_state,
                             provider.signing_key != nullptr);
  return redirect;
}

ParsedLogoutRequest ParseLogoutRequest(const std::string& encoded,
                                       const std::string& relay_state,
                                       bool deflated) {
  const auto document = ParseMessage(encoded, deflated, "LogoutRequest");
  const auto* root = document.root();

  ParsedLogoutRequest parsed;
  parsed.id = GetAttribute(root, "ID");
  parsed.destination = GetAttribute(root, "Destination");
  parsed.issuer = TextContent(FindChild(root, kSamlAssertionNs, "Issuer"));
  const auto* name_id = FindChild(root, kSamlAssertionNs, "NameID");
  parsed.name_id = TextContent(name_id);
  parsed.name_id_format = GetAttribute(name_id, "Format");
  parsed.session_index =
      TextContent(FindChild(root, kSamlProtocolNs, "SessionIndex"));
  parsed.relay_state = relay_state;

  if (parsed.id.empty()) {
    InvalidMessage("LogoutRequest has no ID");
  }
  if (parsed.issuer.empty()) {
    InvalidMessage("LogoutRequest has no Issuer");
  }
  if (parsed.name_id.empty()) {
    InvalidMessage("LogoutRequest has no NameID");
  }
  return parsed;
}

ParsedLogoutResponse ParseLogoutResponse(const std::string& encoded,
                                         bool deflated) {
  const auto document = ParseMessage(encoded, deflated, "LogoutResponse");
  const auto* root = document.root();

  ParsedLogoutResponse parsed;
  parsed.in_response_to = GetAttribute(root, "InResponseTo");
  parsed.issuer = TextContent(FindChild(root, kSamlAssertionNs, "Issuer"));
  const auto* status = FindChild(root, kSamlProtocolNs, "Status");
  parsed.status =
      GetAttribute(FindChild(status, kSamlProtocolNs, "StatusCode"), "Value");
  parsed.status_message =
      TextContent(FindChild(status, kSamlProtocolNs, "StatusMessage"));

  if (parsed.issuer.empty()) {
    InvalidMessage("LogoutResponse has no Issuer");
  }
  if (parsed.status.empty()) {
    InvalidMessage("LogoutResponse has no status");
  }
  return parsed;
}

RedirectQuery ParseRedirectQuery(std::string_view query,
                                 const char* parameter) {
  if (!query.empty() && query.front() == '?') {
    query.remove_prefix(1);
  }
  const auto payload = RawQueryValue(query, parameter);
  if (!payload || payload->empty()) {
    InvalidMessage(std::string("query has no ") + parameter);
  }
  const auto relay_state = RawQueryValue(query, "RelayState");
  const auto sig_alg = RawQueryValue(query, "SigAlg");
  const auto signature = RawQueryValue(query, "Signature");

  RedirectQuery out;
  out.payload = auth::UrlDecode(*payload);
  out.signed_octets = std::string(parameter) + "=" + std::string(*payload);
  if (relay_state) {
    out.relay_state = auth::UrlDecode(*relay_state);
    out.signed_octets += "&RelayState=" + std::string(*relay_state);
  }
  if (sig_alg) {
    out.sig_alg = auth::UrlDecode(*sig_alg);
    out.signed_octets += "&SigAlg=" + std::string(*sig_alg);
  }
  if (signature) {
    try {
      out.signature = auth::Base64Decode(auth::UrlDecode(*signature));
    } catch (const std::invalid_argument&) {
      InvalidMessage("Signature is not base64");
    }
  }
  return out;
}

void VerifyRedirectSignature(const RedirectQuery& query,
                             const std::string& certificate_base64) {
  if (query.signature.empty()) {
    InvalidMessage("redirect message is not signed");
  }
  if (query.sig_alg != kSigAlgRsaSha256) {
    InvalidMessage("unsupported SigAlg " + query.sig_alg);
  }
  if (!VerifyRsaSha256(certificate_base64, query.signed_octets,
                       query.signature)) {
    InvalidMessage("redirect signature does not verify");
  }
}

void VerifyPostSignature(const std::string& encoded, const char* root_name,
                         const SignatureVerifier& verifier,
                         const std::string& certificate_base64) {
  const auto document = ParseMessage(encoded, false, root_name);
  auto* root = document.root();
  auto* signature = FindChild(root, kXmlDsigNs, "Signature");
  if (signature == nullptr) {
    InvalidMessage(std::string(root_name) + " is not signed");
  }
  std::string error;
  if (!verifier.Verify(document.document(), root, signature,
                       certificate_base64, &error)) {
    InvalidMessage(std::string(root_name) + " signature: " + error);
  }
}

}  // namespace warden::federation
