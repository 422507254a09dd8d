#include "provider_registry.h"

#include <mutex>
#include <utility>

#include "idp_metadata.h"
#include "log_utils.h"
#include "saml_error.h"
#include "sp_signing_key.h"

namespace warden::federation {
namespace {

std::string TrimTrailingSlash(std::string value) {
  while (!value.empty() && value.back() == '/') {
    value.pop_back();
  }
  return value;
}

void ApplyAttributeDefaults(SamlProviderConfig* config) {
  auto& mapping = config->attribute_mapping;
  if (mapping["email"].empty()) {
    mapping["email"] = kDefaultEmailAttribute;
  }
  if (mapping["name"].empty()) {
    mapping["name"] = kDefaultNameAttribute;
  }
  if (config->group_rules.group_attribute.empty()) {
    config->group_rules.group_attribute = "groups";
  }
  if (config->default_role.empty()) {
    config->default_role = "authenticated";
  }
}

}  // namespace

void InMemoryProviderRegistry::Register(ProviderPtr provider) {
  if (!provider || provider->config.name.empty()) {
    throw SamlError(SamlError::Kind::Configuration, "provider name is required");
  }
  std::unique_lock<std::shared_mutex> lock(mutex_);
  providers_[provider->config.name] = std::move(provider);
}

ProviderPtr InMemoryProviderRegistry::Get(const std::string& name) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  const auto it = providers_.find(name);
  if (it == providers_.end()) {
    throw SamlError(SamlError::Kind::ProviderNotFound,
                    "unknown SAML provider " + name);
  }
  if (!it->second->config.enabled) {
    throw SamlError(SamlError::Kind::ProviderDisabled,
                    "SAML provider " + name + " is disabled");
  }
  return it->second;
}

template <typename Pred>
std::vector<ProviderPtr> InMemoryProviderRegistry::Filter(Pred pred) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  std::vector<ProviderPtr> out;
  for (const auto& [name, provider] : providers_) {
    if (provider->config.enabled && pred(*provider)) {
      out.push_back(provider);
    }
  }
  return out;
}

std::vector<ProviderPtr> InMemoryProviderRegistry::List() const {
  return Filter([](const SamlProvider&) { return true; });
}

std::vector<ProviderPtr> InMemoryProviderRegistry::ListForDashboard() const {
  return Filter([](const SamlProvider& provider) {
    return provider.config.allow_dashboard_login;
  });
}

std::vector<ProviderPtr> InMemoryProviderRegistry::ListForApp() const {
  return Filter([](const SamlProvider& provider) {
    return provider.config.allow_app_login;
  });
}

ProviderPtr InMemoryProviderRegistry::FindByIdpEntityId(
    const std::string& entity_id) const {
  auto matches = Filter([&entity_id](const SamlProvider& provider) {
    return provider.idp.entity_id == entity_id;
  });
  return matches.empty() ? nullptr : matches.front();
}

bool InMemoryProviderRegistry::Remove(const std::string& name) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  return providers_.erase(name) > 0;
}

ProviderLoader::ProviderLoader(std::string base_url,
                               std::shared_ptr<MetadataFetcher> fetcher)
    : base_url_(TrimTrailingSlash(std::move(base_url))),
      fetcher_(std::move(fetcher)) {}

SpDescriptor ProviderLoader::DeriveServiceProvider(
    const SamlProviderConfig& config) const {
  SpDescriptor sp;
  sp.entity_id =
      config.entity_id.empty() ? base_url_ + "/auth/saml" : config.entity_id;
  sp.acs_url =
      config.acs_url.empty() ? base_url_ + "/auth/saml/acs" : config.acs_url;
  sp.slo_url = base_url_ + "/auth/saml/slo";
  sp.metadata_url = base_url_ + "/auth/saml/metadata/" + config.name;
  return sp;
}

ProviderPtr ProviderLoader::Compile(SamlProviderConfig config) const {
  if (config.name.empty()) {
    throw SamlError(SamlError::Kind::Configuration, "provider name is required");
  }
  ApplyAttributeDefaults(&config);

  std::string metadata = config.metadata_xml;
  if (metadata.empty()) {
    if (config.metadata_url.empty()) {
      throw SamlError(SamlError::Kind::Configuration,
                      "provider " + config.name +
                          " needs metadata_url or metadata_xml");
    }
    ValidateMetadataUrl(config.metadata_url,
                        config.allow_insecure_metadata_url);
    if (!fetcher_) {
      throw SamlError(SamlError::Kind::Configuration,
                      "no metadata fetcher configured");
    }
    metadata = fetcher_->Fetch(config.metadata_url);
  }

  auto provider = std::make_shared<SamlProvider>();
  provider->idp = ParseIdpMetadata(metadata);
  provider->sp = DeriveServiceProvider(config);

  const bool has_cert = !config.sp_certificate.empty();
  const bool has_key = !config.sp_private_key.empty();
  if (has_cert != has_key) {
    throw SamlError(SamlError::Kind::Configuration,
                    "SP certificate and private key must be set together");
  }
  if (has_cert) {
    provider->signing_key =
        SpSigningKey::Load(config.sp_certificate, config.sp_private_key);
  }
  provider->config = std::move(config);
  return provider;
}

size_t LoadProviders(const ProviderLoader& loader, ProviderRegistry* registry,
                     const std::vector<SamlProviderConfig>& configs) {
  size_t loaded = 0;
  for (const auto& config : configs) {
    if (!config.enabled) {
      LogFederationWarning("LoadProviders",
                           "provider " + config.name + " is disabled");
      continue;
    }
    try {
      registry->Register(loader.Compile(config));
      ++loaded;
    } catch (const SamlError& ex) {
      LogFederationWarning("LoadProviders", "skipping provider " + config.name +
                                                ": " + ex.what());
    }
  }
  return loaded;
}

}  // namespace warden::federation
