#include "warden/shared/env_config.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace warden::shared {
namespace {

std::string Trim(const std::string& value) {
  const auto first = value.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) {
    return {};
  }
  const auto last = value.find_last_not_of(" \t\r\n");
  return value.substr(first, last - first + 1);
}

}  // namespace

std::string GetEnvOrEmpty(const char* name) {
  const char* value = std::getenv(name);
  return value ? std::string(value) : std::string();
}

std::string GetEnvOrDefault(const char* name, const std::string& fallback) {
  const char* value = std::getenv(name);
  if (!value || value[0] == '\0') {
    return fallback;
  }
  return value;
}

bool GetEnvOrDefaultBool(const char* name, bool fallback) {
  const char* value = std::getenv(name);
  if (!value || value[0] == '\0') {
    return fallback;
  }
  std::string normalized(value);
  std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                 [](unsigned char ch) {
                   return static_cast<char>(std::tolower(ch));
                 });
  if (normalized == "1" || normalized == "true" || normalized == "yes") {
    return true;
  }
  if (normalized == "0" || normalized == "false" || normalized == "no") {
    return false;
  }
  return fallback;
}

size_t GetEnvOrDefaultSize(const char* name, size_t fallback) {
  const char* value = std::getenv(name);
  if (!value || value[0] == '\0') {
    return fallback;
  }

  errno = 0;
  char* end = nullptr;
  const unsigned long long parsed = std::strtoull(value, &end, 10);
  if (errno != 0 || end == value || (end && *end != '\0') || parsed == 0 ||
      parsed > std::numeric_limits<size_t>::max() || value[0] == '-') {
    throw std::runtime_error(std::string(name) +
                             " must be a positive integer");
  }
  return static_cast<size_t>(parsed);
}

std::vector<std::string> GetEnvList(const char* name) {
  std::vector<std::string> items;
  std::stringstream stream(GetEnvOrEmpty(name));
  std::string item;
  while (std::getline(stream, item, ',')) {
    item = Trim(item);
    if (!item.empty()) {
      items.push_back(item);
    }
  }
  return items;
}

SharedStoreBackend ParseStoreBackend(const std::string& value,
                                     const char* name) {
  if (value.empty() || value == "memory" || value == "in-memory") {
    return SharedStoreBackend::InMemory;
  }
  if (value == "redis") {
    return SharedStoreBackend::Redis;
  }
  throw std::runtime_error(std::string(name) +
                           " must be one of: memory, in-memory, redis");
}

std::string ReadFile(const std::string& path) {
  std::ifstream file(path, std::ios::in | std::ios::binary);
  if (!file) {
    throw std::runtime_error("Failed to open file: " + path);
  }
  std::ostringstream buffer;
  buffer << file.rdbuf();
  return buffer.str();
}

}  // namespace warden::shared
