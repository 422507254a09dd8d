#include "warden/token/token_codec.h"

#include <cstdint>
#include <exception>
#include <system_error>
#include <utility>

#include <jwt-cpp/jwt.h>

#include "auth/signing_secret.h"
#include "warden/token/token_error.h"

namespace warden::token {
namespace {

picojson::value ParseJsonObject(const std::string& text, const char* field) {
  picojson::value value;
  const std::string error = picojson::parse(value, text);
  if (!error.empty() || !value.is<picojson::object>()) {
    throw TokenError(TokenError::Kind::InvalidRequest,
                     std::string(field) + " must be a JSON object");
  }
  return value;
}

template <typename Decoded>
std::string OptionalString(const Decoded& decoded, const std::string& name) {
  if (!decoded.has_payload_claim(name)) {
    return {};
  }
  return decoded.get_payload_claim(name).as_string();
}

template <typename Decoded>
std::string OptionalJson(const Decoded& decoded, const std::string& name) {
  if (!decoded.has_payload_claim(name)) {
    return {};
  }
  const auto value = decoded.get_payload_claim(name).to_json();
  if (value.template is<picojson::null>()) {
    return {};
  }
  return value.serialize();
}

// iat_ms refines iat within the same second. Anything else is ignored.
TimePoint PreciseIssuedAt(TimePoint iat, std::int64_t iat_ms) {
  const auto precise = FromUnixMillis(iat_ms);
  if (std::chrono::time_point_cast<std::chrono::seconds>(precise) != iat) {
    return iat;
  }
  return precise;
}

}  // namespace

TokenCodec::TokenCodec(std::string_view secret, Clock clock)
    : secret_(std::make_unique<auth::SigningSecret>(secret)),
      clock_(std::move(clock)) {
  if (!clock_) {
    clock_ = SystemClock();
  }
}

TokenCodec::~TokenCodec() = default;

std::string TokenCodec::Sign(const TokenClaims& claims) const {
  if (claims.token_id.empty()) {
    throw TokenError(TokenError::Kind::InvalidRequest, "token id is required");
  }
  if (claims.role.empty()) {
    throw TokenError(TokenError::Kind::InvalidRequest, "role is required");
  }

  auto builder = jwt::create();
  builder.set_type("JWT");
  builder.set_id(claims.token_id);
  builder.set_issued_at(claims.issued_at);
  builder.set_payload_claim(
      "iat_ms",
      jwt::claim(picojson::value(
          static_cast<std::int64_t>(ToUnixMillis(claims.issued_at)))));
  builder.set_not_before(claims.not_before);
  builder.set_expires_at(claims.expires_at);
  if (!claims.issuer.empty()) {
    builder.set_issuer(claims.issuer);
  }
  if (!claims.subject.empty()) {
    builder.set_subject(claims.subject);
  }
  builder.set_payload_claim("user_id", jwt::claim(claims.subject));
  builder.set_payload_claim("role", jwt::claim(claims.role));
  builder.set_payload_claim(
      "token_type", jwt::claim(std::string(TokenKindName(claims.kind))));
  if (!claims.email.empty()) {
    builder.set_payload_claim("email", jwt::claim(claims.email));
  }
  if (!claims.name.empty()) {
    builder.set_payload_claim("name", jwt::claim(claims.name));
  }
  if (!claims.session_id.empty()) {
    builder.set_payload_claim("session_id", jwt::claim(claims.session_id));
  }
  if (claims.is_anonymous) {
    builder.set_payload_claim("is_anonymous",
                              jwt::claim(picojson::value(true)));
  }
  if (!claims.user_metadata.empty()) {
    builder.set_payload_claim(
        "user_metadata",
        jwt::claim(ParseJsonObject(claims.user_metadata, "user_metadata")));
  }
  if (!claims.app_metadata.empty()) {
    builder.set_payload_claim(
        "app_metadata",
        jwt::claim(ParseJsonObject(claims.app_metadata, "app_metadata")));
  }
  return builder.sign(jwt::algorithm::hs256{std::string(secret_->view())});
}

TokenClaims TokenCodec::Verify(const std::string& token) const {
  return Decode(token, true);
}

TokenClaims TokenCodec::VerifyIgnoringExpiry(const std::string& token) const {
  return Decode(token, false);
}

TokenClaims TokenCodec::Decode(const std::string& token,
                               bool enforce_expiry) const {
  if (token.empty()) {
    throw TokenError(TokenError::Kind::Invalid, "token is empty");
  }

  try {
    const auto decoded = jwt::decode(token);
    if (!decoded.has_algorithm() ||
        decoded.get_algorithm() != kSigningAlgorithm) {
      throw TokenError(TokenError::Kind::Invalid,
                       "unexpected signing algorithm");
    }

    const jwt::algorithm::hs256 algorithm{std::string(secret_->view())};
    std::error_code ec;
    algorithm.verify(
        decoded.get_header_base64() + "." + decoded.get_payload_base64(),
        decoded.get_signature(), ec);
    if (ec) {
      throw TokenError(TokenError::Kind::Invalid, "token signature mismatch");
    }

    if (!decoded.has_expires_at() || !decoded.has_id()) {
      throw TokenError(TokenError::Kind::Invalid,
                       "token is missing registered claims");
    }

    TokenClaims claims;
    claims.token_id = decoded.get_id();
    claims.expires_at = decoded.get_expires_at();
    if (decoded.has_issued_at()) {
      claims.issued_at = decoded.get_issued_at();
      if (decoded.has_payload_claim("iat_ms")) {
        claims.issued_at = PreciseIssuedAt(
            claims.issued_at, decoded.get_payload_claim("iat_ms").as_integer());
      }
    }
    if (decoded.has_not_before()) {
      claims.not_before = decoded.get_not_before();
    }
    if (decoded.has_issuer()) {
      claims.issuer = decoded.get_issuer();
    }

    const auto now = clock_();
    if (decoded.has_not_before() && now < claims.not_before) {
      throw TokenError(TokenError::Kind::Invalid, "token is not yet valid");
    }
    if (enforce_expiry && now >= claims.expires_at) {
      throw TokenError(TokenError::Kind::Expired, "token has expired");
    }

    const auto kind = ParseTokenKind(OptionalString(decoded, "token_type"));
    if (!kind.has_value()) {
      throw TokenError(TokenError::Kind::Invalid, "token type is missing");
    }
    claims.kind = *kind;
    claims.role = OptionalString(decoded, "role");
    if (claims.role.empty()) {
      throw TokenError(TokenError::Kind::Invalid, "token role is missing");
    }

    claims.subject = decoded.has_subject() ? decoded.get_subject()
                                           : OptionalString(decoded, "user_id");
    claims.email = OptionalString(decoded, "email");
    claims.name = OptionalString(decoded, "name");
    claims.session_id = OptionalString(decoded, "session_id");
    if (decoded.has_payload_claim("is_anonymous")) {
      claims.is_anonymous =
          decoded.get_payload_claim("is_anonymous").as_boolean();
    }
    claims.user_metadata = OptionalJson(decoded, "user_metadata");
    claims.app_metadata = OptionalJson(decoded, "app_metadata");
    claims.principal = ClassifyPrincipal(claims.role, claims.is_anonymous);
    return claims;
  } catch (const TokenError&) {
    throw;
  } catch (const std::exception& ex) {
    throw TokenError(TokenError::Kind::Invalid,
                     std::string("malformed token: ") + ex.what());
  }
}

}  // namespace warden::token
