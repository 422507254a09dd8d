#include "sp_metadata.h"

#include "sp_signing_key.h"
#include "xml_document.h"

namespace warden::federation {

std::string BuildSpMetadata(const SamlProvider& provider) {
  std::string xml = "<?xml version=\"1.0\" encoding=\"UTF-8\"?>";
  xml += "<md:EntityDescriptor xmlns:md=\"";
  xml += kSamlMetadataNs;
  xml += "\" entityID=\"" + XmlEscape(provider.sp.entity_id) + "\">";
  xml += "<md:SPSSODescriptor AuthnRequestsSigned=\"false\" "
         "WantAssertionsSigned=\"true\" "
         "protocolSupportEnumeration=\"";
  xml += kSamlProtocolNs;
  xml += "\">";

  if (provider.signing_key) {
    xml += "<md:KeyDescriptor use=\"signing\">";
    xml += "<ds:KeyInfo xmlns:ds=\"";
    xml += kXmlDsigNs;
    xml += "\"><ds:X509Data><ds:X509Certificate>";
    xml += provider.signing_key->certificate_base64();
    xml += "</ds:X509Certificate></ds:X509Data></ds:KeyInfo>";
    xml += "</md:KeyDescriptor>";
  }

  xml += "<md:SingleLogoutService Binding=\"";
  xml += kBindingHttpRedirect;
  xml += "\" Location=\"" + XmlEscape(provider.sp.slo_url) + "\"/>";
  xml += "<md:NameIDFormat>";
  xml += kNameIdFormatUnspecified;
  xml += "</md:NameIDFormat>";
  xml += "<md:NameIDFormat>";
  xml += kNameIdFormatEmail;
  xml += "</md:NameIDFormat>";
  xml += "<md:AssertionConsumerService Binding=\"";
  xml += kBindingHttpPost;
  xml += "\" Location=\"" + XmlEscape(provider.sp.acs_url) +
         "\" index=\"1\"/>";
  xml += "</md:SPSSODescriptor></md:EntityDescriptor>";
  return xml;
}

}  // namespace warden::federation
