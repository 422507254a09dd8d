#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "warden/shared/shared_store.h"

namespace warden::shared {

std::string GetEnvOrEmpty(const char* name);
std::string GetEnvOrDefault(const char* name, const std::string& fallback);

// Accepts 1/true/yes and 0/false/no. Anything else falls back.
bool GetEnvOrDefaultBool(const char* name, bool fallback);

// Positive integer or the fallback when unset. Throws std::runtime_error on
// malformed values.
size_t GetEnvOrDefaultSize(const char* name, size_t fallback);

// Comma separated, entries trimmed, empty entries dropped.
std::vector<std::string> GetEnvList(const char* name);

// memory, in-memory or redis. `name` is used in the error message.
SharedStoreBackend ParseStoreBackend(const std::string& value,
                                     const char* name);

std::string ReadFile(const std::string& path);

}  // namespace warden::shared
