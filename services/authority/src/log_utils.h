#pragma once

#include <grpcpp/support/status.h>

#include <string_view>

namespace warden::authority {

void LogAuthorityEvent(std::string_view action,
                       const grpc::Status& status,
                       std::string_view detail);

}  // namespace warden::authority
