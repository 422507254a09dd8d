#pragma once

#include <string>
#include <string_view>

#include <grpcpp/support/status.h>

namespace warden::shared {

std::string JsonEscape(std::string_view input);
std::string UtcTimestampNow();

// One JSON object per line on stdout.
void WriteEventLine(std::string_view component, std::string_view action,
                    const grpc::Status& status, std::string_view detail);
void WriteWarningLine(std::string_view component, std::string_view action,
                      std::string_view detail);

}  // namespace warden::shared
