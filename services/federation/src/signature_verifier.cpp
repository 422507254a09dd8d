#include "signature_verifier.h"

#include <memory>

#include <xsec/dsig/DSIGReference.hpp>
#include <xsec/dsig/DSIGReferenceList.hpp>
#include <xsec/dsig/DSIGSignature.hpp>
#include <xsec/enc/XSECCryptoException.hpp>
#include <xsec/enc/XSECCryptoProvider.hpp>
#include <xsec/enc/XSECCryptoX509.hpp>
#include <xsec/framework/XSECException.hpp>
#include <xsec/framework/XSECProvider.hpp>
#include <xsec/utils/XSECPlatformUtils.hpp>

#include "xml_document.h"

namespace warden::federation {
namespace {

class SignatureHandle {
 public:
  SignatureHandle(XSECProvider* provider, DSIGSignature* signature)
      : provider_(provider), signature_(signature) {}
  ~SignatureHandle() {
    if (signature_) {
      provider_->releaseSignature(signature_);
    }
  }

  SignatureHandle(const SignatureHandle&) = delete;
  SignatureHandle& operator=(const SignatureHandle&) = delete;

  DSIGSignature* get() const { return signature_; }
  DSIGSignature* operator->() const { return signature_; }

 private:
  XSECProvider* provider_;
  DSIGSignature* signature_;
};

// The signature must cover the element it vouches for, not some other node
// the attacker placed in the document.
bool ReferencesElement(DSIGSignature* signature, const std::string& id) {
  DSIGReferenceList* references = signature->getReferenceList();
  if (!references) {
    return false;
  }
  const std::string expected = "#" + id;
  for (DSIGReferenceList::size_type i = 0; i < references->getSize(); ++i) {
    DSIGReference* reference = references->item(i);
    if (reference && ToUtf8(reference->getURI()) == expected) {
      return true;
    }
  }
  return false;
}

void SetError(std::string* error, const std::string& message) {
  if (error) {
    *error = message;
  }
}

}  // namespace

bool XsecSignatureVerifier::Verify(xercesc::DOMDocument* document,
                                   xercesc::DOMElement* signed_element,
                                   xercesc::DOMElement* signature,
                                   const std::string& certificate_base64,
                                   std::string* error) const {
  EnsureXmlPlatform();
  if (!document || !signed_element || !signature) {
    SetError(error, "missing signature element");
    return false;
  }
  if (signature->getParentNode() != signed_element) {
    SetError(error, "signature is not enveloped by the signed element");
    return false;
  }
  const auto id = GetAttribute(signed_element, "ID");
  if (id.empty()) {
    SetError(error, "signed element has no ID");
    return false;
  }
  if (certificate_base64.empty()) {
    SetError(error, "IdP signing certificate is missing");
    return false;
  }

  XmlCh id_name("ID");
  signed_element->setIdAttribute(id_name.get(), true);

  try {
    XSECProvider provider;
    SignatureHandle sig(&provider,
                        provider.newSignatureFromDOM(document, signature));
    sig->setIdByAttributeName(false);
    sig->load();

    if (!ReferencesElement(sig.get(), id)) {
      SetError(error, "signature does not reference element " + id);
      return false;
    }

    std::unique_ptr<XSECCryptoX509> x509(
        XSECPlatformUtils::g_cryptoProvider->X509());
    x509->loadX509Base64Bin(certificate_base64.data(),
                            static_cast<unsigned int>(certificate_base64.size()));
    sig->setSigningKey(x509->clonePublicKey());

    if (!sig->verify()) {
      SetError(error, "signature verification failed: " +
                          ToUtf8(sig->getErrMsgs()));
      return false;
    }
    return true;
  } catch (const XSECException& ex) {
    SetError(error, "XML signature error: " + ToUtf8(ex.getMsg()));
  } catch (const XSECCryptoException& ex) {
    SetError(error, std::string("XML signature crypto error: ") + ex.getMsg());
  }
  return false;
}

}  // namespace warden::federation
