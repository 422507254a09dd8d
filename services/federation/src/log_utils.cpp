#include "log_utils.h"

#include "warden/shared/json_log.h"

namespace warden::federation {

void LogFederationEvent(std::string_view action,
                        const grpc::Status& status,
                        std::string_view detail) {
  shared::WriteEventLine("federation", action, status, detail);
}

void LogFederationWarning(std::string_view action, std::string_view detail) {
  shared::WriteWarningLine("federation", action, detail);
}

}  // namespace warden::federation
