#pragma once

#include <memory>
#include <string>

#include <sw/redis++/redis++.h>

#include "warden/shared/shared_store.h"

namespace warden::shared {

sw::redis::ConnectionOptions BuildRedisOptions(
    const RedisConnectionConfig& parsed);

std::unique_ptr<sw::redis::Redis> ConnectRedis(const std::string& uri);

[[noreturn]] void ThrowUnavailable(const sw::redis::Error& error);

}  // namespace warden::shared
