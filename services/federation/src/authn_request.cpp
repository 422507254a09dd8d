#include "authn_request.h"

#include "redirect_binding.h"
#include "warden/auth/encoding.h"
#include "warden/auth/entropy.h"
#include "xml_document.h"

namespace warden::federation {

std::string GenerateSamlId() {
  return "_" + auth::HexEncode(auth::RandomBytes(20));
}

std::string BuildAuthnRequestXml(const SamlProvider& provider,
                                 const std::string& id, TimePoint now) {
  std::string xml;
  xml += "<samlp:AuthnRequest xmlns:samlp=\"";
  xml += kSamlProtocolNs;
  xml += "\" xmlns:saml=\"";
  xml += kSamlAssertionNs;
  xml += "\" ID=\"" + XmlEscape(id) + "\"";
  xml += " Version=\"2.0\"";
  xml += " IssueInstant=\"" + FormatXmlDateTime(now) + "\"";
  xml += " Destination=\"" + XmlEscape(provider.idp.sso_url) + "\"";
  xml += " AssertionConsumerServiceURL=\"" + XmlEscape(provider.sp.acs_url) +
         "\"";
  xml += " ProtocolBinding=\"";
  xml += kBindingHttpPost;
  xml += "\">";
  xml += "<saml:Issuer>" + XmlEscape(provider.sp.entity_id) + "</saml:Issuer>";
  xml += "<samlp:NameIDPolicy AllowCreate=\"true\" Format=\"";
  xml += kNameIdFormatUnspecified;
  xml += "\"/>";
  xml += "</samlp:AuthnRequest>";
  return xml;
}

AuthnRequest BuildAuthnRequest(const SamlProvider& provider,
                               const std::string& relay_state, TimePoint now) {
  AuthnRequest request;
  request.id = GenerateSamlId();
  request.xml = BuildAuthnRequestXml(provider, request.id, now);
  request.binding = provider.idp.sso_binding;

  if (request.binding == SamlBinding::HttpPost) {
    request.url = provider.idp.sso_url;
    request.encoded_request = auth::Base64Encode(request.xml);
    return request;
  }

  QueryParams params = {{"SAMLRequest", EncodeRedirectPayload(request.xml)}};
  if (!relay_state.empty()) {
    params.emplace_back("RelayState", relay_state);
  }
  request.url = AppendQuery(provider.idp.sso_url, params);
  return request;
}

}  // namespace warden::federation
