#pragma once

#include <memory>
#include <string>

#include <grpcpp/server.h>

#include "config.h"
#include "federation_service.h"

namespace warden::federation {

struct FederationRuntime {
  std::unique_ptr<grpc::Server> server;
  std::string bound_addr;
};

FederationRuntime StartFederationServer(const FederationConfig& config,
                                        FederationServiceImpl* service);

}  // namespace warden::federation
