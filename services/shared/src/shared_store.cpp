#include "warden/shared/shared_store.h"

#include <algorithm>
#include <cctype>
#include <string_view>
#include <utility>
#include <vector>

namespace warden::shared {
namespace {

[[noreturn]] void Reject(const std::string& message) {
  throw SharedStoreError(SharedStoreError::Kind::InvalidArgument, message);
}

std::string Lowercase(std::string_view value) {
  std::string out(value);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char ch) {
    return static_cast<char>(std::tolower(ch));
  });
  return out;
}

bool ParseFlag(std::string_view raw, bool* out) {
  const auto value = Lowercase(raw);
  if (value == "1" || value == "true" || value == "yes") {
    *out = true;
    return true;
  }
  if (value == "0" || value == "false" || value == "no") {
    *out = false;
    return true;
  }
  return false;
}

int ParseNumber(std::string_view value, const char* what) {
  if (value.empty() ||
      !std::all_of(value.begin(), value.end(),
                   [](unsigned char ch) { return std::isdigit(ch) != 0; })) {
    Reject(std::string(what) + " must be a non-negative integer");
  }
  if (value.size() > 9) {
    Reject(std::string(what) + " is out of range");
  }
  return std::stoi(std::string(value));
}

std::vector<std::pair<std::string, std::string>> SplitQuery(
    std::string_view query) {
  std::vector<std::pair<std::string, std::string>> params;
  while (!query.empty()) {
    const auto amp = query.find('&');
    const auto part = query.substr(0, amp);
    query = amp == std::string_view::npos ? std::string_view()
                                          : query.substr(amp + 1);
    if (part.empty()) {
      continue;
    }
    const auto eq = part.find('=');
    std::string key(part.substr(0, eq));
    if (key.empty()) {
      Reject("Redis URI query contains an empty key");
    }
    std::string value =
        eq == std::string_view::npos ? std::string() : std::string(part.substr(eq + 1));
    params.emplace_back(std::move(key), std::move(value));
  }
  return params;
}

void ApplyHostPort(std::string_view hostport, RedisConnectionConfig* config) {
  std::string_view port_text;
  if (!hostport.empty() && hostport.front() == '[') {
    const auto close = hostport.find(']');
    if (close == std::string_view::npos) {
      Reject("Redis IPv6 host is malformed");
    }
    config->host = std::string(hostport.substr(1, close - 1));
    const auto rest = hostport.substr(close + 1);
    if (!rest.empty()) {
      if (rest.front() != ':') {
        Reject("Redis port is malformed");
      }
      port_text = rest.substr(1);
      if (port_text.empty()) {
        Reject("Redis port is malformed");
      }
    }
  } else {
    const auto colon = hostport.rfind(':');
    config->host = std::string(hostport.substr(0, colon));
    if (colon != std::string_view::npos) {
      port_text = hostport.substr(colon + 1);
      if (port_text.empty()) {
        Reject("Redis port is malformed");
      }
    }
  }
  if (config->host.empty()) {
    Reject("Redis host is empty");
  }
  if (!port_text.empty()) {
    config->port = ParseNumber(port_text, "Redis port");
  }
  if (config->port < 1 || config->port > 65535) {
    Reject("Redis port must be in range 1-65535");
  }
}

void ApplyAuthority(std::string_view authority, RedisConnectionConfig* config) {
  if (authority.empty()) {
    Reject("Redis URI authority is empty");
  }
  const auto at = authority.rfind('@');
  if (at != std::string_view::npos) {
    const auto userinfo = authority.substr(0, at);
    const auto colon = userinfo.find(':');
    if (colon == std::string_view::npos) {
      config->password = std::string(userinfo);
    } else {
      config->username = std::string(userinfo.substr(0, colon));
      config->password = std::string(userinfo.substr(colon + 1));
    }
    authority = authority.substr(at + 1);
  }
  ApplyHostPort(authority, config);
}

void CheckTlsSettings(const RedisConnectionConfig& config) {
  const bool has_tls_options =
      !config.tls_ca_cert_path.empty() || !config.tls_ca_cert_dir.empty() ||
      !config.tls_cert_path.empty() || !config.tls_key_path.empty() ||
      !config.tls_sni.empty() || !config.tls_verify_peer;
  if (!config.use_tls) {
    if (has_tls_options) {
      Reject("TLS options require rediss://");
    }
    return;
  }
  if (config.tls_verify_peer && config.tls_ca_cert_path.empty() &&
      config.tls_ca_cert_dir.empty()) {
    Reject("rediss:// requires cacert or cacertdir when verify_peer is enabled");
  }
  if (config.tls_cert_path.empty() != config.tls_key_path.empty()) {
    Reject("Redis TLS client auth requires both cert and key");
  }
}

}  // namespace

SharedStoreError::SharedStoreError(Kind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

SharedStoreError::Kind SharedStoreError::kind() const noexcept { return kind_; }

RedisConnectionConfig ParseRedisConnectionConfig(const std::string& uri) {
  if (uri.empty()) {
    Reject("Redis URI is empty");
  }
  const auto scheme_end = uri.find("://");
  if (scheme_end == std::string::npos) {
    Reject("Redis URI must include a scheme");
  }

  RedisConnectionConfig config;
  const auto scheme = Lowercase(std::string_view(uri).substr(0, scheme_end));
  if (scheme == "rediss") {
    config.use_tls = true;
  } else if (scheme != "redis") {
    Reject("Redis URI scheme must be redis:// or rediss://");
  }

  std::string_view rest = std::string_view(uri).substr(scheme_end + 3);
  std::string_view query;
  if (const auto q = rest.find('?'); q != std::string_view::npos) {
    query = rest.substr(q + 1);
    rest = rest.substr(0, q);
  }
  std::string_view authority = rest;
  if (const auto slash = rest.find('/'); slash != std::string_view::npos) {
    authority = rest.substr(0, slash);
    const auto db = rest.substr(slash + 1);
    if (!db.empty()) {
      config.db = ParseNumber(db, "Redis db");
    }
  }
  ApplyAuthority(authority, &config);

  for (const auto& [key, value] : SplitQuery(query)) {
    if (key == "cacert") {
      config.tls_ca_cert_path = value;
    } else if (key == "cacertdir") {
      config.tls_ca_cert_dir = value;
    } else if (key == "cert") {
      config.tls_cert_path = value;
    } else if (key == "key") {
      config.tls_key_path = value;
    } else if (key == "sni") {
      config.tls_sni = value;
    } else if (key == "verify_peer") {
      if (!ParseFlag(value, &config.tls_verify_peer)) {
        Reject("Redis URI verify_peer must be boolean");
      }
    } else {
      Reject("Unsupported Redis URI query parameter: " + key);
    }
  }
  CheckTlsSettings(config);
  return config;
}

}  // namespace warden::shared
