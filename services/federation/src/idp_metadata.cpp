#include "idp_metadata.h"

#include <cctype>

#include "log_utils.h"
#include "saml_error.h"
#include "xml_document.h"

namespace warden::federation {
namespace {

[[noreturn]] void Fail(const std::string& message) {
  throw SamlError(SamlError::Kind::MetadataParseFailed, message);
}

std::string LowercaseScheme(const std::string& url) {
  const auto colon = url.find(':');
  if (colon == std::string::npos) {
    return {};
  }
  std::string scheme = url.substr(0, colon);
  for (auto& ch : scheme) {
    ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  }
  return scheme;
}

struct Endpoint {
  std::string location;
  SamlBinding binding = SamlBinding::HttpRedirect;
};

// Redirect is preferred when the IdP offers both bindings.
bool SelectEndpoint(const xercesc::DOMElement* descriptor,
                    const char* element_name, Endpoint* out) {
  bool found_post = false;
  Endpoint post;
  for (auto* service : FindChildren(descriptor, kSamlMetadataNs, element_name)) {
    const auto binding = GetAttribute(service, "Binding");
    const auto location = GetAttribute(service, "Location");
    if (location.empty()) {
      continue;
    }
    if (binding == kBindingHttpRedirect) {
      out->location = location;
      out->binding = SamlBinding::HttpRedirect;
      return true;
    }
    if (binding == kBindingHttpPost && !found_post) {
      post.location = location;
      post.binding = SamlBinding::HttpPost;
      found_post = true;
    }
  }
  if (found_post) {
    *out = post;
  }
  return found_post;
}

std::string StripWhitespace(const std::string& value) {
  std::string out;
  out.reserve(value.size());
  for (char ch : value) {
    if (!std::isspace(static_cast<unsigned char>(ch))) {
      out += ch;
    }
  }
  return out;
}

std::string FindSigningCertificate(const xercesc::DOMElement* descriptor) {
  for (auto* key : FindChildren(descriptor, kSamlMetadataNs, "KeyDescriptor")) {
    const auto use = GetAttribute(key, "use");
    if (!use.empty() && use != "signing") {
      continue;
    }
    auto* key_info = FindChild(key, kXmlDsigNs, "KeyInfo");
    auto* x509_data = FindChild(key_info, kXmlDsigNs, "X509Data");
    auto* cert = FindChild(x509_data, kXmlDsigNs, "X509Certificate");
    if (cert) {
      return StripWhitespace(TextContent(cert));
    }
  }
  return {};
}

bool SupportsBrowserSso(const xercesc::DOMElement* descriptor) {
  for (auto* service :
       FindChildren(descriptor, kSamlMetadataNs, "SingleSignOnService")) {
    const auto binding = GetAttribute(service, "Binding");
    if (binding == kBindingHttpPost || binding == kBindingHttpRedirect) {
      return true;
    }
  }
  return false;
}

const xercesc::DOMElement* FindEntity(const xercesc::DOMElement* root) {
  if (IsElement(root, kSamlMetadataNs, "EntityDescriptor")) {
    return root;
  }
  if (IsElement(root, kSamlMetadataNs, "EntitiesDescriptor")) {
    for (auto* entity :
         FindChildren(root, kSamlMetadataNs, "EntityDescriptor")) {
      if (FindChild(entity, kSamlMetadataNs, "IDPSSODescriptor")) {
        return entity;
      }
    }
    Fail("EntitiesDescriptor contains no IdP entity");
  }
  Fail("metadata root must be EntityDescriptor or EntitiesDescriptor");
}

}  // namespace

const char* BindingUri(SamlBinding binding) {
  return binding == SamlBinding::HttpPost ? kBindingHttpPost
                                          : kBindingHttpRedirect;
}

void ValidateMetadataUrl(const std::string& url, bool allow_insecure) {
  const auto scheme = LowercaseScheme(url);
  if (scheme.empty() || url.find("://") == std::string::npos) {
    throw SamlError(SamlError::Kind::MetadataInsecureURL,
                    "invalid metadata URL: " + url);
  }
  if (scheme == "https") {
    return;
  }
  if (!allow_insecure) {
    throw SamlError(SamlError::Kind::MetadataInsecureURL,
                    "metadata URL must use https, got " + scheme);
  }
  LogFederationWarning("ValidateMetadataUrl",
                       "using insecure metadata URL " + url);
}

IdpDescriptor ParseIdpMetadata(const std::string& xml) {
  try {
    auto document = XmlDocument::Parse(xml);
    const auto* entity = FindEntity(document.root());

    const xercesc::DOMElement* descriptor = nullptr;
    for (auto* candidate :
         FindChildren(entity, kSamlMetadataNs, "IDPSSODescriptor")) {
      if (SupportsBrowserSso(candidate)) {
        descriptor = candidate;
        break;
      }
    }
    if (!descriptor) {
      Fail("no IDPSSODescriptor with HTTP-POST or HTTP-Redirect SSO binding");
    }

    IdpDescriptor idp;
    idp.entity_id = GetAttribute(entity, "entityID");
    if (idp.entity_id.empty()) {
      Fail("EntityDescriptor is missing entityID");
    }

    Endpoint sso;
    SelectEndpoint(descriptor, "SingleSignOnService", &sso);
    idp.sso_url = sso.location;
    idp.sso_binding = sso.binding;

    Endpoint slo;
    if (SelectEndpoint(descriptor, "SingleLogoutService", &slo)) {
      idp.slo_url = slo.location;
      idp.slo_binding = slo.binding;
    }

    idp.signing_certificate = FindSigningCertificate(descriptor);
    if (idp.signing_certificate.empty()) {
      Fail("IdP metadata has no signing certificate");
    }
    return idp;
  } catch (const XmlError& ex) {
    Fail(ex.what());
  }
}

}  // namespace warden::federation
