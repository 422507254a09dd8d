#pragma once

#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <xercesc/dom/DOM.hpp>
#include <xercesc/parsers/XercesDOMParser.hpp>

#include "warden/clock.h"

namespace warden::federation {

inline constexpr char kSamlProtocolNs[] = "urn:oasis:names:tc:SAML:2.0:protocol";
inline constexpr char kSamlAssertionNs[] =
    "urn:oasis:names:tc:SAML:2.0:assertion";
inline constexpr char kSamlMetadataNs[] = "urn:oasis:names:tc:SAML:2.0:metadata";
inline constexpr char kXmlDsigNs[] = "http://www.w3.org/2000/09/xmldsig#";

class XmlError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Initializes Xerces-C and XML-Security-C once per process.
void EnsureXmlPlatform();

// Owns a parsed DOM. Documents carrying a DOCTYPE are refused before the
// parser sees them, so no entity or DTD processing ever happens.
class XmlDocument {
 public:
  static XmlDocument Parse(std::string_view xml);

  XmlDocument(XmlDocument&&) noexcept;
  XmlDocument& operator=(XmlDocument&&) noexcept;
  ~XmlDocument();

  xercesc::DOMDocument* document() const { return document_; }
  xercesc::DOMElement* root() const;

 private:
  XmlDocument() = default;

  std::unique_ptr<xercesc::XercesDOMParser> parser_;
  xercesc::DOMDocument* document_ = nullptr;
};

// RAII wrapper for a UTF-16 Xerces string transcoded from UTF-8.
class XmlCh {
 public:
  explicit XmlCh(std::string_view utf8);
  ~XmlCh();

  XmlCh(const XmlCh&) = delete;
  XmlCh& operator=(const XmlCh&) = delete;

  const XMLCh* get() const { return value_; }

 private:
  XMLCh* value_ = nullptr;
};

std::string ToUtf8(const XMLCh* value);

bool IsElement(const xercesc::DOMElement* element, std::string_view ns,
               std::string_view local_name);
xercesc::DOMElement* FindChild(const xercesc::DOMElement* parent,
                               std::string_view ns,
                               std::string_view local_name);
std::vector<xercesc::DOMElement*> FindChildren(
    const xercesc::DOMElement* parent, std::string_view ns,
    std::string_view local_name);

// Empty when the attribute is absent.
std::string GetAttribute(const xercesc::DOMElement* element,
                         std::string_view name);
bool HasAttribute(const xercesc::DOMElement* element, std::string_view name);
std::string TextContent(const xercesc::DOMElement* element);

std::string XmlEscape(std::string_view value);

// xs:dateTime in UTC with optional fractional seconds and offset.
TimePoint ParseXmlDateTime(const std::string& value);
std::string FormatXmlDateTime(TimePoint tp);

}  // namespace warden::federation
