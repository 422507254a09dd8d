#include "xml_document.h"

#include <cctype>
#include <chrono>
#include <ctime>
#include <mutex>

#include <xercesc/framework/MemBufInputSource.hpp>
#include <xercesc/sax/ErrorHandler.hpp>
#include <xercesc/sax/SAXParseException.hpp>
#include <xercesc/util/PlatformUtils.hpp>
#include <xercesc/util/TransService.hpp>
#include <xercesc/util/XMLException.hpp>
#include <xercesc/util/XMLString.hpp>
#include <xsec/utils/XSECPlatformUtils.hpp>

namespace warden::federation {
namespace {

class CountingErrorHandler final : public xercesc::ErrorHandler {
 public:
  void warning(const xercesc::SAXParseException&) override {}
  void error(const xercesc::SAXParseException& ex) override { Record(ex); }
  void fatalError(const xercesc::SAXParseException& ex) override {
    Record(ex);
  }
  void resetErrors() override {
    count_ = 0;
    first_.clear();
  }

  int count() const { return count_; }
  const std::string& first() const { return first_; }

 private:
  void Record(const xercesc::SAXParseException& ex) {
    if (count_++ == 0) {
      first_ = ToUtf8(ex.getMessage()) + " at line " +
               std::to_string(ex.getLineNumber());
    }
  }

  int count_ = 0;
  std::string first_;
};

bool ContainsDoctype(std::string_view xml) {
  static constexpr std::string_view kMarker = "<!doctype";
  if (xml.size() < kMarker.size()) {
    return false;
  }
  for (size_t i = 0; i + kMarker.size() <= xml.size(); ++i) {
    bool match = true;
    for (size_t j = 0; j < kMarker.size(); ++j) {
      if (std::tolower(static_cast<unsigned char>(xml[i + j])) != kMarker[j]) {
        match = false;
        break;
      }
    }
    if (match) {
      return true;
    }
  }
  return false;
}

int ParseDigits(const std::string& value, size_t pos, size_t count) {
  if (pos + count > value.size()) {
    throw XmlError("truncated dateTime: " + value);
  }
  int out = 0;
  for (size_t i = pos; i < pos + count; ++i) {
    if (!std::isdigit(static_cast<unsigned char>(value[i]))) {
      throw XmlError("malformed dateTime: " + value);
    }
    out = out * 10 + (value[i] - '0');
  }
  return out;
}

void Expect(const std::string& value, size_t pos, char ch) {
  if (pos >= value.size() || value[pos] != ch) {
    throw XmlError("malformed dateTime: " + value);
  }
}

}  // namespace

void EnsureXmlPlatform() {
  static std::once_flag once;
  std::call_once(once, [] {
    try {
      xercesc::XMLPlatformUtils::Initialize();
      XSECPlatformUtils::Initialise();
    } catch (const xercesc::XMLException&) {
      throw XmlError("failed to initialize Xerces-C");
    }
  });
}

XmlDocument XmlDocument::Parse(std::string_view xml) {
  EnsureXmlPlatform();
  if (xml.empty()) {
    throw XmlError("empty XML document");
  }
  if (ContainsDoctype(xml)) {
    throw XmlError("XML documents with a DOCTYPE are not accepted");
  }

  XmlDocument out;
  out.parser_ = std::make_unique<xercesc::XercesDOMParser>();
  auto& parser = *out.parser_;
  parser.setValidationScheme(xercesc::XercesDOMParser::Val_Never);
  parser.setDoNamespaces(true);
  parser.setDoSchema(false);
  parser.setLoadExternalDTD(false);
  parser.setCreateEntityReferenceNodes(false);
  parser.setIncludeIgnorableWhitespace(false);

  CountingErrorHandler errors;
  parser.setErrorHandler(&errors);
  xercesc::MemBufInputSource input(
      reinterpret_cast<const XMLByte*>(xml.data()), xml.size(), "saml-message");
  try {
    parser.parse(input);
  } catch (const xercesc::XMLException& ex) {
    parser.setErrorHandler(nullptr);
    throw XmlError("XML parse failed: " + ToUtf8(ex.getMessage()));
  } catch (const xercesc::DOMException& ex) {
    parser.setErrorHandler(nullptr);
    throw XmlError("XML parse failed: " + ToUtf8(ex.getMessage()));
  }
  parser.setErrorHandler(nullptr);
  if (errors.count() > 0) {
    throw XmlError("XML parse failed: " + errors.first());
  }

  out.document_ = parser.getDocument();
  if (!out.document_ || !out.document_->getDocumentElement()) {
    throw XmlError("XML document has no root element");
  }
  if (out.document_->getDoctype() != nullptr) {
    throw XmlError("XML documents with a DOCTYPE are not accepted");
  }
  return out;
}

XmlDocument::XmlDocument(XmlDocument&&) noexcept = default;
XmlDocument& XmlDocument::operator=(XmlDocument&&) noexcept = default;
XmlDocument::~XmlDocument() = default;

xercesc::DOMElement* XmlDocument::root() const {
  return document_ ? document_->getDocumentElement() : nullptr;
}

XmlCh::XmlCh(std::string_view utf8) {
  EnsureXmlPlatform();
  xercesc::TranscodeFromStr transcoded(
      reinterpret_cast<const XMLByte*>(utf8.data()), utf8.size(), "UTF-8");
  value_ = xercesc::XMLString::replicate(transcoded.str());
}

XmlCh::~XmlCh() { xercesc::XMLString::release(&value_); }

std::string ToUtf8(const XMLCh* value) {
  if (!value) {
    return {};
  }
  xercesc::TranscodeToStr transcoded(value, "UTF-8");
  return std::string(reinterpret_cast<const char*>(transcoded.str()),
                     transcoded.length());
}

bool IsElement(const xercesc::DOMElement* element, std::string_view ns,
               std::string_view local_name) {
  if (!element) {
    return false;
  }
  return ToUtf8(element->getNamespaceURI()) == ns &&
         ToUtf8(element->getLocalName()) == local_name;
}

xercesc::DOMElement* FindChild(const xercesc::DOMElement* parent,
                               std::string_view ns,
                               std::string_view local_name) {
  if (!parent) {
    return nullptr;
  }
  for (auto* child = parent->getFirstElementChild(); child;
       child = child->getNextElementSibling()) {
    if (IsElement(child, ns, local_name)) {
      return child;
    }
  }
  return nullptr;
}

std::vector<xercesc::DOMElement*> FindChildren(
    const xercesc::DOMElement* parent, std::string_view ns,
    std::string_view local_name) {
  std::vector<xercesc::DOMElement*> out;
  if (!parent) {
    return out;
  }
  for (auto* child = parent->getFirstElementChild(); child;
       child = child->getNextElementSibling()) {
    if (IsElement(child, ns, local_name)) {
      out.push_back(child);
    }
  }
  return out;
}

std::string GetAttribute(const xercesc::DOMElement* element,
                         std::string_view name) {
  if (!element) {
    return {};
  }
  XmlCh attr(name);
  return ToUtf8(element->getAttribute(attr.get()));
}

bool HasAttribute(const xercesc::DOMElement* element, std::string_view name) {
  if (!element) {
    return false;
  }
  XmlCh attr(name);
  return element->hasAttribute(attr.get());
}

std::string TextContent(const xercesc::DOMElement* element) {
  if (!element) {
    return {};
  }
  auto text = ToUtf8(element->getTextContent());
  const auto first = text.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) {
    return {};
  }
  const auto last = text.find_last_not_of(" \t\r\n");
  return text.substr(first, last - first + 1);
}

std::string XmlEscape(std::string_view value) {
  std::string out;
  out.reserve(value.size());
  for (char ch : value) {
    switch (ch) {
      case '&':
        out += "&amp;";
        break;
      case '<':
        out += "&lt;";
        break;
      case '>':
        out += "&gt;";
        break;
      case '"':
        out += "&quot;";
        break;
      case '\'':
        out += "&apos;";
        break;
      default:
        out += ch;
        break;
    }
  }
  return out;
}

TimePoint ParseXmlDateTime(const std::string& value) {
  // YYYY-MM-DDThh:mm:ss[.fff][Z|(+|-)hh:mm]
  std::tm tm{};
  tm.tm_year = ParseDigits(value, 0, 4) - 1900;
  Expect(value, 4, '-');
  tm.tm_mon = ParseDigits(value, 5, 2) - 1;
  Expect(value, 7, '-');
  tm.tm_mday = ParseDigits(value, 8, 2);
  Expect(value, 10, 'T');
  tm.tm_hour = ParseDigits(value, 11, 2);
  Expect(value, 13, ':');
  tm.tm_min = ParseDigits(value, 14, 2);
  Expect(value, 16, ':');
  tm.tm_sec = ParseDigits(value, 17, 2);
  if (tm.tm_mon < 0 || tm.tm_mon > 11 || tm.tm_mday < 1 || tm.tm_mday > 31 ||
      tm.tm_hour > 23 || tm.tm_min > 59 || tm.tm_sec > 60) {
    throw XmlError("dateTime out of range: " + value);
  }

  size_t pos = 19;
  std::chrono::nanoseconds fraction{0};
  if (pos < value.size() && value[pos] == '.') {
    ++pos;
    const size_t start = pos;
    long long nanos = 0;
    int digits = 0;
    while (pos < value.size() &&
           std::isdigit(static_cast<unsigned char>(value[pos]))) {
      if (digits < 9) {
        nanos = nanos * 10 + (value[pos] - '0');
        ++digits;
      }
      ++pos;
    }
    if (pos == start) {
      throw XmlError("malformed dateTime fraction: " + value);
    }
    for (; digits < 9; ++digits) {
      nanos *= 10;
    }
    fraction = std::chrono::nanoseconds(nanos);
  }

  std::chrono::seconds offset{0};
  if (pos < value.size()) {
    if (value[pos] == 'Z') {
      ++pos;
    } else if (value[pos] == '+' || value[pos] == '-') {
      const int sign = value[pos] == '-' ? -1 : 1;
      const int hours = ParseDigits(value, pos + 1, 2);
      Expect(value, pos + 3, ':');
      const int minutes = ParseDigits(value, pos + 4, 2);
      offset = std::chrono::seconds(sign * (hours * 3600 + minutes * 60));
      pos += 6;
    }
  }
  if (pos != value.size()) {
    throw XmlError("malformed dateTime: " + value);
  }

  const std::time_t seconds = timegm(&tm);
  return TimePoint(std::chrono::seconds(seconds)) - offset +
         std::chrono::duration_cast<TimePoint::duration>(fraction);
}

std::string FormatXmlDateTime(TimePoint tp) {
  const auto tt = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
  gmtime_r(&tt, &tm);
  char buffer[32];
  std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &tm);
  return buffer;
}

}  // namespace warden::federation
