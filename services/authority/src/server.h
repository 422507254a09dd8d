#pragma once

#include <memory>
#include <string>

#include <grpcpp/server.h>

#include "authority_service.h"
#include "config.h"

namespace warden::authority {

struct AuthorityRuntime {
  std::unique_ptr<grpc::Server> server;
  std::string bound_addr;
};

AuthorityRuntime StartAuthorityServer(const AuthorityConfig& config,
                                      TokenAuthorityServiceImpl* service);

}  // namespace warden::authority
