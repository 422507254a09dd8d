#include <chrono>
#include <exception>
#include <iostream>
#include <memory>
#include <string>

#include <grpcpp/support/status.h>

#include "assertion_validator.h"
#include "config.h"
#include "federation_service.h"
#include "identity_linker.h"
#include "log_utils.h"
#include "metadata_fetcher.h"
#include "provider_registry.h"
#include "replay_guard.h"
#include "saml_engine.h"
#include "saml_session_index.h"
#include "server.h"
#include "signature_verifier.h"
#include "warden/auth/entropy.h"
#include "warden/shared/periodic_task.h"
#include "warden/shared/replay_ledger.h"
#include "warden/shared/revocation_ledger.h"
#include "warden/shared/secret_file.h"
#include "warden/shared/state_store.h"
#include "warden/token/token_codec.h"
#include "warden/token/token_issuer.h"
#include "xml_document.h"

int main() {
  namespace fed = warden::federation;
  namespace shared = warden::shared;
  try {
    const auto entropy = warden::auth::CheckEntropyReady();
    if (entropy.status != warden::auth::EntropyStatus::Ready) {
      std::cerr << "Federation startup failed: " << entropy.message << "\n";
      return 1;
    }

    const auto config = fed::LoadConfig();
    fed::EnsureXmlPlatform();

    auto secret = shared::LoadSecretFile(config.jwt_secret_file,
                                         fed::kMinSigningSecretBytes,
                                         "FEDERATION_JWT_SECRET_FILE");
    auto codec = std::make_shared<const warden::token::TokenCodec>(secret);
    shared::SecureErase(&secret);

    warden::token::TokenIssuerConfig issuer_config;
    issuer_config.issuer = config.jwt_issuer;
    issuer_config.access_ttl = std::chrono::seconds(config.access_ttl_seconds);
    issuer_config.refresh_ttl = std::chrono::seconds(config.refresh_ttl_seconds);
    auto issuer =
        std::make_shared<const warden::token::TokenIssuer>(codec, issuer_config);

    shared::SharedStoreConfig store_config;
    store_config.backend = config.store_backend;
    store_config.redis_uri = config.store_uri;

    shared::StateStoreOptions state_options;
    state_options.default_ttl = std::chrono::seconds(config.state_ttl_seconds);
    state_options.cleanup_interval =
        std::chrono::seconds(config.state_cleanup_interval_seconds);
    state_options.on_cleanup = [](std::size_t removed, const std::string& error) {
      if (error.empty()) {
        fed::LogFederationEvent("CleanupState", grpc::Status::OK,
                                "removed=" + std::to_string(removed));
      } else {
        fed::LogFederationEvent(
            "CleanupState", grpc::Status(grpc::StatusCode::UNAVAILABLE, error),
            "");
      }
    };
    auto state_store = shared::CreateStateStore(store_config, state_options);

    shared::RevocationLedgerOptions ledger_options;
    ledger_options.user_revocation_ttl = issuer_config.refresh_ttl;
    auto revocation =
        shared::CreateRevocationLedger(store_config, ledger_options);
    auto replay_ledger = shared::CreateReplayLedger(store_config);
    auto replay_guard = std::make_shared<fed::ReplayGuard>(
        replay_ledger,
        std::chrono::milliseconds(config.replay_grace_milliseconds));
    auto validator = std::make_shared<const fed::AssertionValidator>(
        std::make_shared<const fed::XsecSignatureVerifier>(), replay_guard);

    auto registry = std::make_shared<fed::InMemoryProviderRegistry>();
    auto loader = std::make_shared<const fed::ProviderLoader>(
        config.base_url,
        std::make_shared<fed::CurlMetadataFetcher>(
            std::chrono::seconds(config.metadata_fetch_timeout_seconds)));
    const auto loaded = fed::LoadProviders(*loader, registry.get(),
                                           config.providers);
    fed::LogFederationEvent("LoadProviders", grpc::Status::OK,
                            "loaded=" + std::to_string(loaded));

    auto sessions = std::make_shared<fed::SamlSessionIndex>();

    fed::SamlEngineDeps deps;
    deps.registry = registry;
    deps.state_store = state_store;
    deps.validator = validator;
    deps.linker = std::make_shared<fed::InMemoryIdentityLinker>();
    deps.issuer = issuer;
    deps.revocation = revocation;
    deps.sessions = sessions;
    auto engine = std::make_shared<fed::SamlEngine>(deps);

    shared::PeriodicTask sweeper(
        std::chrono::seconds(config.state_cleanup_interval_seconds),
        [replay_ledger, sessions] {
          try {
            const auto replays = replay_ledger->DeleteExpired();
            const auto ended = sessions->DeleteExpired();
            fed::LogFederationEvent("SweepExpired", grpc::Status::OK,
                                    "replay=" + std::to_string(replays) +
                                        " sessions=" + std::to_string(ended));
          } catch (const std::exception& ex) {
            fed::LogFederationEvent(
                "SweepExpired",
                grpc::Status(grpc::StatusCode::UNAVAILABLE, ex.what()), "");
          }
        });

    fed::FederationServiceImpl service(registry, loader, engine, state_store);
    auto runtime = fed::StartFederationServer(config, &service);
    sweeper.Start();
    fed::LogFederationEvent("Startup", grpc::Status::OK, runtime.bound_addr);
    runtime.server->Wait();
    sweeper.Stop();
    state_store->Stop();
  } catch (const std::exception& ex) {
    std::cerr << "Federation startup failed: " << ex.what() << "\n";
    return 1;
  }
  return 0;
}
