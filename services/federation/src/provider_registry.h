#pragma once

#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

#include "metadata_fetcher.h"
#include "saml_types.h"

namespace warden::federation {

using ProviderPtr = std::shared_ptr<const SamlProvider>;

class ProviderRegistry {
 public:
  virtual ~ProviderRegistry() = default;

  // Replaces any provider registered under the same name.
  virtual void Register(ProviderPtr provider) = 0;

  // Throws SamlError ProviderNotFound or ProviderDisabled.
  virtual ProviderPtr Get(const std::string& name) const = 0;

  // Enabled providers, ordered by name.
  virtual std::vector<ProviderPtr> List() const = 0;
  virtual std::vector<ProviderPtr> ListForDashboard() const = 0;
  virtual std::vector<ProviderPtr> ListForApp() const = 0;

  // Enabled provider whose IdP entity id matches, or nullptr.
  virtual ProviderPtr FindByIdpEntityId(const std::string& entity_id) const = 0;

  virtual bool Remove(const std::string& name) = 0;
};

class InMemoryProviderRegistry final : public ProviderRegistry {
 public:
  void Register(ProviderPtr provider) override;
  ProviderPtr Get(const std::string& name) const override;
  std::vector<ProviderPtr> List() const override;
  std::vector<ProviderPtr> ListForDashboard() const override;
  std::vector<ProviderPtr> ListForApp() const override;
  ProviderPtr FindByIdpEntityId(const std::string& entity_id) const override;
  bool Remove(const std::string& name) override;

 private:
  template <typename Pred>
  std::vector<ProviderPtr> Filter(Pred pred) const;

  mutable std::shared_mutex mutex_;
  std::map<std::string, ProviderPtr> providers_;
};

// Turns configuration into a registered-ready provider: resolves IdP
// metadata, derives SP endpoints from the base URL and loads the SP key.
class ProviderLoader {
 public:
  ProviderLoader(std::string base_url,
                 std::shared_ptr<MetadataFetcher> fetcher);

  ProviderPtr Compile(SamlProviderConfig config) const;

  SpDescriptor DeriveServiceProvider(const SamlProviderConfig& config) const;

 private:
  std::string base_url_;
  std::shared_ptr<MetadataFetcher> fetcher_;
};

// Registers every enabled config. Failures are logged and the provider is
// skipped. Returns the number registered.
size_t LoadProviders(const ProviderLoader& loader, ProviderRegistry* registry,
                     const std::vector<SamlProviderConfig>& configs);

}  // namespace warden::federation
