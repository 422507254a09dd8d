#include "log_utils.h"

#include "warden/shared/json_log.h"

namespace warden::authority {

void LogAuthorityEvent(std::string_view action,
                       const grpc::Status& status,
                       std::string_view detail) {
  shared::WriteEventLine("authority", action, status, detail);
}

}  // namespace warden::authority
