#pragma once

#include <memory>

#include <grpcpp/server_context.h>
#include <grpcpp/support/status.h>

#include "federation.grpc.pb.h"
#include "provider_registry.h"
#include "saml_engine.h"
#include "warden/shared/state_store.h"

namespace warden::federation {

class FederationServiceImpl final
    : public warden::federation::v1::Federation::Service {
 public:
  FederationServiceImpl(std::shared_ptr<ProviderRegistry> registry,
                        std::shared_ptr<const ProviderLoader> loader,
                        std::shared_ptr<SamlEngine> engine,
                        std::shared_ptr<shared::StateStore> state_store);

  grpc::Status ListProviders(
      grpc::ServerContext* context,
      const warden::federation::v1::ListProvidersRequest* request,
      warden::federation::v1::ListProvidersResponse* response) override;
  grpc::Status RegisterProvider(
      grpc::ServerContext* context,
      const warden::federation::v1::RegisterProviderRequest* request,
      warden::federation::v1::RegisterProviderResponse* response) override;
  grpc::Status GetServiceProviderMetadata(
      grpc::ServerContext* context,
      const warden::federation::v1::GetServiceProviderMetadataRequest* request,
      warden::federation::v1::GetServiceProviderMetadataResponse* response)
      override;
  grpc::Status BeginSamlLogin(
      grpc::ServerContext* context,
      const warden::federation::v1::BeginSamlLoginRequest* request,
      warden::federation::v1::BeginSamlLoginResponse* response) override;
  grpc::Status CompleteSamlLogin(
      grpc::ServerContext* context,
      const warden::federation::v1::CompleteSamlLoginRequest* request,
      warden::federation::v1::CompleteSamlLoginResponse* response) override;
  grpc::Status BeginSamlLogout(
      grpc::ServerContext* context,
      const warden::federation::v1::BeginSamlLogoutRequest* request,
      warden::federation::v1::BeginSamlLogoutResponse* response) override;
  grpc::Status HandleSamlLogoutRequest(
      grpc::ServerContext* context,
      const warden::federation::v1::HandleSamlLogoutRequestRequest* request,
      warden::federation::v1::HandleSamlLogoutRequestResponse* response)
      override;
  grpc::Status HandleSamlLogoutResponse(
      grpc::ServerContext* context,
      const warden::federation::v1::HandleSamlLogoutResponseRequest* request,
      warden::federation::v1::HandleSamlLogoutResponseResponse* response)
      override;
  grpc::Status BeginOAuthFlow(
      grpc::ServerContext* context,
      const warden::federation::v1::BeginOAuthFlowRequest* request,
      warden::federation::v1::BeginOAuthFlowResponse* response) override;
  grpc::Status CompleteOAuthFlow(
      grpc::ServerContext* context,
      const warden::federation::v1::CompleteOAuthFlowRequest* request,
      warden::federation::v1::CompleteOAuthFlowResponse* response) override;

 private:
  std::shared_ptr<ProviderRegistry> registry_;
  std::shared_ptr<const ProviderLoader> loader_;
  std::shared_ptr<SamlEngine> engine_;
  std::shared_ptr<shared::StateStore> state_store_;
};

}  // namespace warden::federation
