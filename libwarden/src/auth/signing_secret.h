#pragma once

#include <cstddef>
#include <cstring>
#include <new>
#include <stdexcept>
#include <string_view>

#include <sodium.h>

namespace warden::auth {

// HMAC key material in guarded sodium memory. The pages are locked, made
// read-only after the copy and wiped when the secret is destroyed.
class SigningSecret {
 public:
  explicit SigningSecret(std::string_view key) : size_(key.size()) {
    if (sodium_init() < 0) {
      throw std::runtime_error("libsodium initialization failed");
    }
    if (size_ == 0) {
      throw std::invalid_argument("signing secret must not be empty");
    }
    data_ = static_cast<unsigned char*>(sodium_malloc(size_));
    if (!data_) {
      throw std::bad_alloc();
    }
    std::memcpy(data_, key.data(), size_);
    locked_ = sodium_mlock(data_, size_) == 0;
    sodium_mprotect_readonly(data_);
  }

  ~SigningSecret() {
    if (!data_) {
      return;
    }
    sodium_mprotect_readwrite(data_);
    if (locked_) {
      // sodium_munlock zeroes before unlocking.
      sodium_munlock(data_, size_);
    } else {
      sodium_memzero(data_, size_);
    }
    sodium_free(data_);
  }

  SigningSecret(const SigningSecret&) = delete;
  SigningSecret& operator=(const SigningSecret&) = delete;

  std::string_view view() const {
    return std::string_view(reinterpret_cast<const char*>(data_), size_);
  }

  std::size_t size() const { return size_; }
  bool is_locked() const { return locked_; }

 private:
  unsigned char* data_ = nullptr;
  std::size_t size_ = 0;
  bool locked_ = false;
};

}  // namespace warden::auth
