#include "identity_mapping.h"

#include <algorithm>
#include <initializer_list>
#include <set>
#include <utility>

#include "saml_error.h"

namespace warden::federation {
namespace {

// First non-empty value of the first attribute that has one.
std::string FirstValue(const SamlAssertion& assertion,
                       std::initializer_list<std::string_view> names) {
  for (const auto name : names) {
    if (name.empty()) {
      continue;
    }
    const auto it = assertion.attributes.find(std::string(name));
    if (it == assertion.attributes.end()) {
      continue;
    }
    for (const auto& value : it->second) {
      if (!value.empty()) {
        return value;
      }
    }
  }
  return {};
}

std::string MappedAttribute(const SamlProvider& provider, const char* key) {
  const auto it = provider.config.attribute_mapping.find(key);
  return it == provider.config.attribute_mapping.end() ? std::string()
                                                        : it->second;
}

bool IsContinuationByte(unsigned char ch) { return (ch & 0xC0) == 0x80; }

std::string Trim(std::string_view value) {
  const auto first = value.find_first_not_of(" \t\r\n");
  if (first == std::string_view::npos) {
    return {};
  }
  const auto last = value.find_last_not_of(" \t\r\n");
  return std::string(value.substr(first, last - first + 1));
}

}  // namespace

std::string SanitizeAttribute(std::string_view value) {
  std::string filtered;
  filtered.reserve(value.size());
  for (char raw : value) {
    const auto ch = static_cast<unsigned char>(raw);
    if ((ch < 0x20 && ch != '\t' && ch != '\n' && ch != '\r') || ch == 0x7F) {
      continue;
    }
    filtered += raw;
  }

  auto trimmed = Trim(filtered);
  size_t code_points = 0;
  for (size_t i = 0; i < trimmed.size(); ++i) {
    if (IsContinuationByte(static_cast<unsigned char>(trimmed[i]))) {
      continue;
    }
    if (code_points == kMaxAttributeCodePoints) {
      trimmed.resize(i);
      break;
    }
    ++code_points;
  }
  return trimmed;
}

SamlUserInfo ExtractUserInfo(const SamlProvider& provider,
                             const SamlAssertion& assertion) {
  const auto email_attr = MappedAttribute(provider, "email");
  const auto name_attr = MappedAttribute(provider, "name");

  SamlUserInfo info;
  auto email = FirstValue(assertion, {email_attr});
  if (email.empty()) {
    email = FirstValue(assertion, {"email", "Email", "emailAddress", "mail",
                                   "urn:oid:0.9.2342.19200300.100.1.3"});
  }
  if (email.empty() && assertion.name_id.find('@') != std::string::npos) {
    email = assertion.name_id;
  }
  info.email = SanitizeAttribute(email);
  if (info.email.empty()) {
    throw SamlError(SamlError::Kind::MissingEmail,
                    "assertion carries no email address");
  }

  auto name = FirstValue(assertion, {name_attr});
  if (name.empty()) {
    name = FirstValue(assertion, {"name", "displayName", "cn", "urn:oid:2.5.4.3"});
  }
  if (name.empty()) {
    const auto first =
        FirstValue(assertion, {"firstName", "givenName", "urn:oid:2.5.4.42"});
    const auto last = FirstValue(
        assertion, {"lastName", "surname", "sn", "urn:oid:2.5.4.4"});
    name = Trim(first + " " + last);
  }
  info.name = SanitizeAttribute(name);
  return info;
}

std::vector<std::string> ExtractGroups(const SamlProvider& provider,
                                       const SamlAssertion& assertion) {
  const auto it =
      assertion.attributes.find(provider.config.group_rules.group_attribute);
  if (it == assertion.attributes.end()) {
    return {};
  }
  std::vector<std::string> groups;
  for (const auto& value : it->second) {
    auto group = SanitizeAttribute(value);
    if (!group.empty()) {
      groups.push_back(std::move(group));
    }
  }
  return groups;
}

void AuthorizeGroups(const std::vector<std::string>& groups,
                     const GroupRules& rules) {
  const std::set<std::string> held(groups.begin(), groups.end());
  for (const auto& denied : rules.denied) {
    if (held.count(denied)) {
      throw SamlError(SamlError::Kind::GroupAccessDenied,
                      "member of denied group " + denied);
    }
  }
  if (!rules.required_any.empty() &&
      std::none_of(rules.required_any.begin(), rules.required_any.end(),
                   [&held](const std::string& g) { return held.count(g) > 0; })) {
    throw SamlError(SamlError::Kind::GroupAccessDenied,
                    "not a member of any required group");
  }
  for (const auto& required : rules.required_all) {
    if (!held.count(required)) {
      throw SamlError(SamlError::Kind::GroupAccessDenied,
                      "missing required group " + required);
    }
  }
}

}  // namespace warden::federation
