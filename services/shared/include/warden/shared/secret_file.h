#pragma once

#include <cstddef>
#include <string>

namespace warden::shared {

void SecureErase(std::string* data);

// Reads a secret from disk with one trailing newline removed. Throws
// std::runtime_error when the file is shorter than min_bytes.
std::string LoadSecretFile(const std::string& path, std::size_t min_bytes,
                           const char* name);

}  // namespace warden::shared
