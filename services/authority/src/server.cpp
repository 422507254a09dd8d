#include "server.h"

#include <stdexcept>
#include <utility>

#include <grpcpp/health_check_service_interface.h>
#include <grpcpp/server_builder.h>

#include "warden/shared/tls_utils.h"

namespace warden::authority {

AuthorityRuntime StartAuthorityServer(const AuthorityConfig& config,
                                      TokenAuthorityServiceImpl* service) {
  shared::ServerTlsFiles tls_files;
  tls_files.cert_path = config.tls_cert_path;
  tls_files.key_path = config.tls_key_path;
  tls_files.ca_path = config.tls_ca_path;
  tls_files.require_client_cert = config.tls_require_client_cert;
  auto credentials = shared::BuildServerCredentials(tls_files);

  grpc::EnableDefaultHealthCheckService(true);

  grpc::ServerBuilder builder;
  int selected_port = 0;
  builder.AddListeningPort(config.bind_addr, credentials, &selected_port);
  builder.RegisterService(service);
  auto server = builder.BuildAndStart();
  if (!server) {
    throw std::runtime_error("failed to build authority gRPC server");
  }

  auto* health = server->GetHealthCheckService();
  if (health) {
    health->SetServingStatus("", true);
    health->SetServingStatus("warden.authority.v1.TokenAuthority", true);
  }

  AuthorityRuntime runtime;
  runtime.bound_addr =
      shared::BuildBoundAddress(config.bind_addr, selected_port);
  runtime.server = std::move(server);
  return runtime;
}

}  // namespace warden::authority
