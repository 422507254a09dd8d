#pragma once

#include <memory>
#include <string>

#include <grpcpp/security/server_credentials.h>

namespace warden::shared {

struct ServerTlsFiles {
  std::string cert_path;
  std::string key_path;
  std::string ca_path;
  bool require_client_cert = false;
};

// Checks that the PEM key matches the certificate, the certificate is inside
// its validity window and the optional CA bundle holds at least one cert.
void ValidateServerTlsCredentials(const std::string& cert_pem,
                                  const std::string& key_pem,
                                  const std::string& ca_bundle_pem);

// TLS 1.3 only. Client certificates are requested and verified when
// require_client_cert is set.
std::shared_ptr<grpc::ServerCredentials> BuildServerCredentials(
    const ServerTlsFiles& files);

std::string BuildBoundAddress(const std::string& original_bind_addr,
                              int selected_port);

}  // namespace warden::shared
