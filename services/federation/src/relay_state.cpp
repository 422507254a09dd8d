#include "relay_state.h"

#include <algorithm>
#include <cctype>

#include "log_utils.h"
#include "saml_error.h"

namespace warden::federation {
namespace {

[[noreturn]] void Reject(const std::string& message) {
  throw SamlError(SamlError::Kind::InvalidRedirect, message);
}

std::string Lowercase(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch) {
                   return static_cast<char>(std::tolower(ch));
                 });
  return value;
}

bool IsSchemeChar(char ch) {
  return std::isalnum(static_cast<unsigned char>(ch)) || ch == '+' ||
         ch == '-' || ch == '.';
}

// Scheme per RFC 3986, or empty when the value has none.
std::string ParseScheme(const std::string& value) {
  const auto colon = value.find(':');
  if (colon == std::string::npos || colon == 0) {
    return {};
  }
  const auto delimiter = value.find_first_of("/?#");
  if (delimiter != std::string::npos && delimiter < colon) {
    return {};
  }
  if (!std::isalpha(static_cast<unsigned char>(value[0])) ||
      !std::all_of(value.begin(), value.begin() + colon, IsSchemeChar)) {
    Reject("malformed redirect URL");
  }
  return Lowercase(value.substr(0, colon));
}

std::string ExtractHost(const std::string& authority) {
  std::string hostport = authority;
  const auto at = hostport.rfind('@');
  if (at != std::string::npos) {
    hostport = hostport.substr(at + 1);
  }
  if (!hostport.empty() && hostport.front() == '[') {
    const auto close = hostport.find(']');
    if (close == std::string::npos) {
      Reject("malformed redirect host");
    }
    return Lowercase(hostport.substr(1, close - 1));
  }
  return Lowercase(hostport.substr(0, hostport.find(':')));
}

bool HostAllowed(const std::string& host,
                 const std::vector<std::string>& allowed_hosts) {
  for (const auto& raw : allowed_hosts) {
    const auto allowed = Lowercase(raw);
    if (allowed.empty()) {
      continue;
    }
    if (host == allowed) {
      return true;
    }
    if (host.size() > allowed.size() + 1 &&
        host.compare(host.size() - allowed.size(), allowed.size(), allowed) ==
            0 &&
        host[host.size() - allowed.size() - 1] == '.') {
      return true;
    }
  }
  return false;
}

}  // namespace

std::string ValidateRelayState(const std::string& relay_state,
                               const std::vector<std::string>& allowed_hosts) {
  if (relay_state.empty()) {
    return {};
  }
  if (relay_state.rfind("//", 0) == 0 || relay_state.rfind("\\\\", 0) == 0) {
    Reject("protocol-relative redirects are not allowed");
  }
  for (char ch : relay_state) {
    if (static_cast<unsigned char>(ch) < 0x20 || ch == 0x7F) {
      Reject("redirect contains control characters");
    }
  }

  const auto scheme = ParseScheme(relay_state);
  if (scheme.empty()) {
    return relay_state;
  }

  const auto rest = relay_state.substr(scheme.size() + 1);
  if (rest.rfind("//", 0) != 0) {
    Reject("redirect URL has a scheme but no host");
  }
  const auto authority = rest.substr(2, rest.find_first_of("/?#", 2) - 2);
  const auto host = ExtractHost(authority);
  if (host.empty()) {
    Reject("redirect URL has a scheme but no host");
  }
  if (scheme != "http" && scheme != "https") {
    Reject("redirect scheme " + scheme + " is not allowed");
  }
  if (allowed_hosts.empty()) {
    Reject("redirect hosts are not configured");
  }
  if (!HostAllowed(host, allowed_hosts)) {
    LogFederationWarning("ValidateRelayState",
                         "blocked redirect to host " + host);
    Reject("redirect host " + host + " is not allowed");
  }
  return relay_state;
}

}  // namespace warden::federation
