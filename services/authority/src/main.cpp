#include <chrono>
#include <exception>
#include <iostream>
#include <memory>
#include <string>

#include <grpcpp/support/status.h>

#include "authority_service.h"
#include "config.h"
#include "log_utils.h"
#include "revocation_service.h"
#include "server.h"
#include "warden/auth/entropy.h"
#include "warden/shared/periodic_task.h"
#include "warden/shared/revocation_ledger.h"
#include "warden/shared/secret_file.h"
#include "warden/token/token_codec.h"
#include "warden/token/token_issuer.h"
#include "warden/token/token_validator.h"

int main() {
  try {
    const auto entropy = warden::auth::CheckEntropyReady();
    if (entropy.status != warden::auth::EntropyStatus::Ready) {
      std::cerr << "Authority startup failed: " << entropy.message << "\n";
      return 1;
    }

    const auto config = warden::authority::LoadConfig();

    auto secret = warden::shared::LoadSecretFile(
        config.jwt_secret_file, warden::authority::kMinSigningSecretBytes,
        "AUTHORITY_JWT_SECRET_FILE");
    auto codec = std::make_shared<const warden::token::TokenCodec>(secret);
    warden::shared::SecureErase(&secret);

    warden::token::TokenIssuerConfig issuer_config;
    issuer_config.issuer = config.jwt_issuer;
    issuer_config.access_ttl = std::chrono::seconds(config.access_ttl_seconds);
    issuer_config.refresh_ttl = std::chrono::seconds(config.refresh_ttl_seconds);
    issuer_config.anonymous_ttl =
        std::chrono::seconds(config.anonymous_ttl_seconds);
    issuer_config.service_role_ttl =
        std::chrono::seconds(config.service_role_ttl_seconds);
    auto issuer =
        std::make_shared<const warden::token::TokenIssuer>(codec, issuer_config);

    warden::token::TokenValidatorConfig validator_config;
    validator_config.issuer = config.jwt_issuer;
    validator_config.accepted_client_key_issuers = config.accepted_issuers;
    auto validator = std::make_shared<const warden::token::TokenValidator>(
        codec, validator_config);

    warden::shared::SharedStoreConfig store_config;
    store_config.backend = config.store_backend;
    store_config.redis_uri = config.store_uri;
    warden::shared::RevocationLedgerOptions ledger_options;
    ledger_options.user_revocation_ttl = issuer_config.refresh_ttl;
    auto ledger =
        warden::shared::CreateRevocationLedger(store_config, ledger_options);
    auto revocation = std::make_shared<warden::authority::RevocationService>(
        validator, ledger);

    warden::shared::PeriodicTask sweeper(
        std::chrono::seconds(config.sweep_interval_seconds), [revocation] {
          try {
            const auto removed = revocation->SweepExpired();
            warden::authority::LogAuthorityEvent(
                "SweepRevocations", grpc::Status::OK,
                "removed=" + std::to_string(removed));
          } catch (const std::exception& ex) {
            warden::authority::LogAuthorityEvent(
                "SweepRevocations",
                grpc::Status(grpc::StatusCode::UNAVAILABLE, ex.what()), "");
          }
        });

    warden::authority::TokenAuthorityServiceImpl service(issuer, validator,
                                                         revocation);
    auto runtime = warden::authority::StartAuthorityServer(config, &service);
    sweeper.Start();
    warden::authority::LogAuthorityEvent("Startup", grpc::Status::OK,
                                         runtime.bound_addr);
    runtime.server->Wait();
    sweeper.Stop();
  } catch (const std::exception& ex) {
    std::cerr << "Authority startup failed: " << ex.what() << "\n";
    return 1;
  }
  return 0;
}
