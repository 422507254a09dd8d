#include "warden/auth/encoding.h"

#include <cctype>
#include <cstring>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <vector>

#include <openssl/sha.h>
#include <sodium.h>

namespace warden::auth {
namespace {

void EnsureSodiumInitialized() {
  static std::once_flag once;
  static int init_result = -1;
  std::call_once(once, []() { init_result = sodium_init(); });
  if (init_result < 0) {
    throw std::runtime_error("Failed to initialize libsodium");
  }
}

std::string Encode(std::string_view bytes, int variant) {
  EnsureSodiumInitialized();
  const std::size_t out_size = sodium_base64_encoded_len(bytes.size(), variant);
  std::string out(out_size, '\0');
  sodium_bin2base64(out.data(), out.size(),
                    reinterpret_cast<const unsigned char*>(bytes.data()),
                    bytes.size(), variant);
  out.resize(std::strlen(out.c_str()));
  return out;
}

std::string Decode(std::string_view encoded, int variant, const char* ignore) {
  EnsureSodiumInitialized();
  std::vector<unsigned char> out(encoded.size() + 1, 0);
  std::size_t out_len = 0;
  const char* end = nullptr;
  if (sodium_base642bin(out.data(), out.size(), encoded.data(), encoded.size(),
                        ignore, &out_len, &end, variant) != 0 ||
      end != encoded.data() + encoded.size()) {
    throw std::invalid_argument("invalid base64 payload");
  }
  return std::string(reinterpret_cast<const char*>(out.data()), out_len);
}

int HexValue(char ch) {
  if (ch >= '0' && ch <= '9') {
    return ch - '0';
  }
  if (ch >= 'a' && ch <= 'f') {
    return ch - 'a' + 10;
  }
  if (ch >= 'A' && ch <= 'F') {
    return ch - 'A' + 10;
  }
  return -1;
}

}  // namespace

std::string Base64Encode(std::string_view bytes) {
  return Encode(bytes, sodium_base64_VARIANT_ORIGINAL);
}

std::string Base64Decode(std::string_view encoded) {
  return Decode(encoded, sodium_base64_VARIANT_ORIGINAL, " \t\r\n");
}

std::string Base64UrlEncode(std::string_view bytes) {
  return Encode(bytes, sodium_base64_VARIANT_URLSAFE_NO_PADDING);
}

std::string Base64UrlDecode(std::string_view encoded) {
  return Decode(encoded, sodium_base64_VARIANT_URLSAFE_NO_PADDING, nullptr);
}

std::string HexEncode(std::string_view bytes) {
  std::ostringstream stream;
  stream << std::hex << std::setfill('0');
  for (unsigned char byte : bytes) {
    stream << std::setw(2) << static_cast<int>(byte);
  }
  return stream.str();
}

std::string Sha256(std::string_view bytes) {
  unsigned char digest[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char*>(bytes.data()), bytes.size(),
         digest);
  return std::string(reinterpret_cast<const char*>(digest), sizeof(digest));
}

std::string UrlEncode(std::string_view value) {
  std::ostringstream out;
  out << std::hex << std::uppercase << std::setfill('0');
  for (unsigned char ch : value) {
    if (std::isalnum(ch) || ch == '-' || ch == '_' || ch == '.' || ch == '~') {
      out << static_cast<char>(ch);
    } else {
      out << '%' << std::setw(2) << static_cast<int>(ch);
    }
  }
  return out.str();
}

std::string UrlDecode(std::string_view value) {
  std::string out;
  out.reserve(value.size());
  for (std::size_t i = 0; i < value.size(); ++i) {
    const char ch = value[i];
    if (ch == '+') {
      out += ' ';
      continue;
    }
    if (ch != '%') {
      out += ch;
      continue;
    }
    if (i + 2 >= value.size()) {
      throw std::invalid_argument("truncated percent escape");
    }
    const int hi = HexValue(value[i + 1]);
    const int lo = HexValue(value[i + 2]);
    if (hi < 0 || lo < 0) {
      throw std::invalid_argument("invalid percent escape");
    }
    out += static_cast<char>((hi << 4) | lo);
    i += 2;
  }
  return out;
}

}  // namespace warden::auth
