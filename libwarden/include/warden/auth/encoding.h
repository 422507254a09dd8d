#pragma once

#include <string>
#include <string_view>

namespace warden::auth {

// Base64 helpers throw std::invalid_argument on malformed input. The standard
// decoder skips ASCII whitespace so line-wrapped payloads decode cleanly.
std::string Base64Encode(std::string_view bytes);
std::string Base64Decode(std::string_view encoded);
std::string Base64UrlEncode(std::string_view bytes);
std::string Base64UrlDecode(std::string_view encoded);

std::string HexEncode(std::string_view bytes);
std::string Sha256(std::string_view bytes);

// RFC 3986 unreserved characters pass through, everything else is %XX.
std::string UrlEncode(std::string_view value);
std::string UrlDecode(std::string_view value);

}  // namespace warden::auth
