#pragma once

#include <grpcpp/support/status.h>

#include <string_view>

namespace warden::federation {

void LogFederationEvent(std::string_view action,
                        const grpc::Status& status,
                        std::string_view detail);

// Policy warnings that do not fail the request on their own.
void LogFederationWarning(std::string_view action, std::string_view detail);

}  // namespace warden::federation
