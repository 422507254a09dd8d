#include "authority_service.h"

#include <chrono>
#include <cstdint>
#include <exception>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include <grpcpp/support/status_code_enum.h>

#include "log_utils.h"
#include "warden/shared/shared_store.h"
#include "warden/token/token_error.h"

namespace warden::authority {
namespace {

namespace v1 = warden::authority::v1;

constexpr size_t kMaxTokenBytes = 8 * 1024;
constexpr size_t kMaxUserIdBytes = 128;
constexpr size_t kMaxRoleBytes = 64;
constexpr size_t kMaxReasonBytes = 128;
constexpr size_t kMaxProfileFieldBytes = 512;
constexpr size_t kMaxMetadataBytes = 16 * 1024;
constexpr size_t kMaxTokenIdBytes = 128;

class RequestError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

void Require(bool condition, const char* message) {
  if (!condition) {
    throw RequestError(message);
  }
}

grpc::StatusCode TransportStatusForAuthorityCode(v1::AuthorityErrorCode code) {
  switch (code) {
    case v1::AUTHORITY_ERROR_CODE_INVALID_REQUEST:
      return grpc::StatusCode::INVALID_ARGUMENT;
    case v1::AUTHORITY_ERROR_CODE_TOKEN_INVALID:
    case v1::AUTHORITY_ERROR_CODE_TOKEN_EXPIRED:
    case v1::AUTHORITY_ERROR_CODE_TOKEN_REVOKED:
      return grpc::StatusCode::UNAUTHENTICATED;
    case v1::AUTHORITY_ERROR_CODE_CANNOT_REVOKE_SERVICE_ROLE:
      return grpc::StatusCode::PERMISSION_DENIED;
    case v1::AUTHORITY_ERROR_CODE_TEMPORARILY_UNAVAILABLE:
      return grpc::StatusCode::UNAVAILABLE;
    case v1::AUTHORITY_ERROR_CODE_INTERNAL:
    case v1::AUTHORITY_ERROR_CODE_UNSPECIFIED:
    default:
      return grpc::StatusCode::INTERNAL;
  }
}

v1::AuthorityErrorCode CodeForTokenError(token::TokenError::Kind kind) {
  switch (kind) {
    case token::TokenError::Kind::Invalid:
      return v1::AUTHORITY_ERROR_CODE_TOKEN_INVALID;
    case token::TokenError::Kind::Expired:
      return v1::AUTHORITY_ERROR_CODE_TOKEN_EXPIRED;
    case token::TokenError::Kind::CannotRevokeServiceRole:
      return v1::AUTHORITY_ERROR_CODE_CANNOT_REVOKE_SERVICE_ROLE;
    case token::TokenError::Kind::InvalidRequest:
      return v1::AUTHORITY_ERROR_CODE_INVALID_REQUEST;
  }
  return v1::AUTHORITY_ERROR_CODE_INTERNAL;
}

v1::AuthorityErrorCode CodeForStoreError(shared::SharedStoreError::Kind kind) {
  switch (kind) {
    case shared::SharedStoreError::Kind::InvalidArgument:
      return v1::AUTHORITY_ERROR_CODE_INVALID_REQUEST;
    case shared::SharedStoreError::Kind::Unavailable:
      return v1::AUTHORITY_ERROR_CODE_TEMPORARILY_UNAVAILABLE;
    case shared::SharedStoreError::Kind::Conflict:
    case shared::SharedStoreError::Kind::NotFound:
    default:
      return v1::AUTHORITY_ERROR_CODE_INTERNAL;
  }
}

template <typename Response>
grpc::Status StatusWithAuthorityError(Response* response,
                                      v1::AuthorityErrorCode code,
                                      std::string_view detail) {
  auto* error = response->mutable_error();
  error->set_code(code);
  error->set_detail(std::string(detail));
  return grpc::Status(TransportStatusForAuthorityCode(code),
                      std::string(detail));
}

// Runs a handler and converts domain exceptions into the response error
// detail plus transport status. Expired tokens are routine and not logged.
template <typename Response, typename Handler>
grpc::Status HandleRequest(std::string_view action, Response* response,
                           Handler&& handler) {
  std::string detail;
  grpc::Status status;
  try {
    status = handler(&detail);
  } catch (const RequestError& ex) {
    status = StatusWithAuthorityError(
        response, v1::AUTHORITY_ERROR_CODE_INVALID_REQUEST, ex.what());
  } catch (const token::TokenError& ex) {
    status = StatusWithAuthorityError(response, CodeForTokenError(ex.kind()),
                                      ex.what());
  } catch (const shared::SharedStoreError& ex) {
    status = StatusWithAuthorityError(response, CodeForStoreError(ex.kind()),
                                      ex.what());
  } catch (const std::exception& ex) {
    status = StatusWithAuthorityError(
        response, v1::AUTHORITY_ERROR_CODE_INTERNAL, "internal error");
    detail = ex.what();
  }
  if (response->has_error() &&
      response->error().code() == v1::AUTHORITY_ERROR_CODE_TOKEN_EXPIRED) {
    return status;
  }
  LogAuthorityEvent(action, status, detail);
  return status;
}

void FillTimestamp(TimePoint tp, google::protobuf::Timestamp* timestamp) {
  const auto since_epoch = tp.time_since_epoch();
  const auto seconds =
      std::chrono::duration_cast<std::chrono::seconds>(since_epoch);
  const auto nanos =
      std::chrono::duration_cast<std::chrono::nanoseconds>(since_epoch - seconds);
  timestamp->set_seconds(seconds.count());
  timestamp->set_nanos(static_cast<int32_t>(nanos.count()));
}

v1::PrincipalKind ToProto(token::PrincipalKind kind) {
  switch (kind) {
    case token::PrincipalKind::User:
      return v1::PRINCIPAL_KIND_USER;
    case token::PrincipalKind::Anonymous:
      return v1::PRINCIPAL_KIND_ANONYMOUS;
    case token::PrincipalKind::Service:
      return v1::PRINCIPAL_KIND_SERVICE;
  }
  return v1::PRINCIPAL_KIND_UNSPECIFIED;
}

void FillClaims(const token::TokenClaims& claims, v1::Claims* out) {
  out->set_subject(claims.subject);
  out->set_email(claims.email);
  out->set_name(claims.name);
  out->set_role(claims.role);
  out->set_session_id(claims.session_id);
  out->set_kind(claims.kind == token::TokenKind::Refresh
                    ? v1::TOKEN_KIND_REFRESH
                    : v1::TOKEN_KIND_ACCESS);
  out->set_principal(ToProto(claims.principal));
  out->set_is_anonymous(claims.is_anonymous);
  out->set_user_metadata_json(claims.user_metadata);
  out->set_app_metadata_json(claims.app_metadata);
  out->set_issuer(claims.issuer);
  out->set_token_id(claims.token_id);
  FillTimestamp(claims.issued_at, out->mutable_issued_at());
  FillTimestamp(claims.expires_at, out->mutable_expires_at());
}

void FillIssued(const token::IssuedToken& issued, v1::IssuedToken* out) {
  out->set_token(issued.token);
  FillClaims(issued.claims, out->mutable_claims());
}

void CheckToken(const std::string& token) {
  Require(!token.empty(), "token is required");
  Require(token.size() <= kMaxTokenBytes, "token is too large");
}

void CheckReason(const std::string& reason) {
  Require(reason.size() <= kMaxReasonBytes, "reason is too long");
}

token::TokenSubject ToSubject(const v1::Subject& subject) {
  Require(!subject.user_id().empty(), "subject.user_id is required");
  Require(subject.user_id().size() <= kMaxUserIdBytes,
          "subject.user_id is too long");
  Require(subject.role().size() <= kMaxRoleBytes, "subject.role is too long");
  Require(subject.email().size() <= kMaxProfileFieldBytes &&
              subject.name().size() <= kMaxProfileFieldBytes,
          "subject profile field is too long");
  Require(subject.user_metadata_json().size() <= kMaxMetadataBytes &&
              subject.app_metadata_json().size() <= kMaxMetadataBytes,
          "subject metadata is too large");

  token::TokenSubject out;
  out.user_id = subject.user_id();
  out.email = subject.email();
  out.name = subject.name();
  if (!subject.role().empty()) {
    out.role = subject.role();
  }
  out.user_metadata = subject.user_metadata_json();
  out.app_metadata = subject.app_metadata_json();
  return out;
}

}  // namespace

TokenAuthorityServiceImpl::TokenAuthorityServiceImpl(
    std::shared_ptr<const token::TokenIssuer> issuer,
    std::shared_ptr<const token::TokenValidator> validator,
    std::shared_ptr<RevocationService> revocation)
    : issuer_(std::move(issuer)),
      validator_(std::move(validator)),
      revocation_(std::move(revocation)) {
  if (!issuer_ || !validator_ || !revocation_) {
    throw std::runtime_error(
        "token authority requires issuer, validator and revocation service");
  }
}

grpc::Status TokenAuthorityServiceImpl::IssueTokenPair(
    grpc::ServerContext* /*context*/,
    const v1::IssueTokenPairRequest* request,
    v1::IssueTokenPairResponse* response) {
  return HandleRequest("IssueTokenPair", response, [&](std::string* detail) {
    Require(request->has_subject(), "subject is required");
    const auto pair = issuer_->IssueTokenPair(ToSubject(request->subject()));
    FillIssued(pair.access, response->mutable_access());
    FillIssued(pair.refresh, response->mutable_refresh());
    *detail = "session_id=" + pair.access.claims.session_id;
    return grpc::Status::OK;
  });
}

grpc::Status TokenAuthorityServiceImpl::IssueAnonymousSession(
    grpc::ServerContext* /*context*/,
    const v1::IssueAnonymousSessionRequest* request,
    v1::IssueAnonymousSessionResponse* response) {
  return HandleRequest(
      "IssueAnonymousSession", response, [&](std::string* detail) {
        Require(request->user_metadata_json().size() <= kMaxMetadataBytes,
                "user metadata is too large");
        const auto pair =
            issuer_->IssueAnonymousSession(request->user_metadata_json());
        FillIssued(pair.access, response->mutable_access());
        FillIssued(pair.refresh, response->mutable_refresh());
        *detail = "subject=" + pair.access.claims.subject;
        return grpc::Status::OK;
      });
}

grpc::Status TokenAuthorityServiceImpl::IssueSyntheticToken(
    grpc::ServerContext* /*context*/,
    const v1::IssueSyntheticTokenRequest* request,
    v1::IssueSyntheticTokenResponse* response) {
  return HandleRequest(
      "IssueSyntheticToken", response, [&](std::string* detail) {
        token::IssuedToken issued;
        switch (request->identity()) {
          case v1::SYNTHETIC_IDENTITY_ANONYMOUS:
            issued = issuer_->IssueAnonymousToken();
            break;
          case v1::SYNTHETIC_IDENTITY_SERVICE_ROLE:
            issued = issuer_->IssueServiceRoleToken();
            break;
          default:
            throw RequestError("identity must be anonymous or service_role");
        }
        FillIssued(issued, response->mutable_token());
        *detail = "role=" + issued.claims.role;
        return grpc::Status::OK;
      });
}

grpc::Status TokenAuthorityServiceImpl::ValidateToken(
    grpc::ServerContext* /*context*/,
    const v1::ValidateTokenRequest* request,
    v1::ValidateTokenResponse* response) {
  return HandleRequest("ValidateToken", response, [&](std::string* detail) {
    CheckToken(request->token());
    token::TokenClaims claims;
    switch (request->mode()) {
      case v1::VALIDATION_MODE_ACCESS:
        claims = validator_->ValidateAccess(request->token());
        break;
      case v1::VALIDATION_MODE_REFRESH:
        claims = validator_->ValidateRefresh(request->token());
        break;
      case v1::VALIDATION_MODE_ANY:
        claims = validator_->Validate(request->token());
        break;
      case v1::VALIDATION_MODE_CLIENT_KEY:
        claims = validator_->ValidateClientKey(request->token());
        break;
      default:
        throw RequestError("validation mode is required");
    }
    if (request->check_revocation() && revocation_->IsClaimsRevoked(claims)) {
      return StatusWithAuthorityError(
          response, v1::AUTHORITY_ERROR_CODE_TOKEN_REVOKED,
          "token has been revoked");
    }
    response->set_valid(true);
    FillClaims(claims, response->mutable_claims());
    *detail = "jti=" + claims.token_id;
    return grpc::Status::OK;
  });
}

grpc::Status TokenAuthorityServiceImpl::RefreshToken(
    grpc::ServerContext* /*context*/,
    const v1::RefreshTokenRequest* request,
    v1::RefreshTokenResponse* response) {
  return HandleRequest("RefreshToken", response, [&](std::string* detail) {
    CheckToken(request->refresh_token());
    const auto claims = validator_->ValidateRefresh(request->refresh_token());
    if (revocation_->IsClaimsRevoked(claims)) {
      return StatusWithAuthorityError(
          response, v1::AUTHORITY_ERROR_CODE_TOKEN_REVOKED,
          "refresh token has been revoked");
    }
    const auto issued = issuer_->Refresh(claims);
    FillIssued(issued, response->mutable_access());
    *detail = "session_id=" + issued.claims.session_id;
    return grpc::Status::OK;
  });
}

grpc::Status TokenAuthorityServiceImpl::RevokeToken(
    grpc::ServerContext* /*context*/,
    const v1::RevokeTokenRequest* request,
    v1::RevokeTokenResponse* response) {
  return HandleRequest("RevokeToken", response, [&](std::string* detail) {
    CheckToken(request->token());
    CheckReason(request->reason());
    const auto entry = revocation_->Revoke(request->token(), request->reason());
    response->set_revoked(true);
    response->set_token_id(entry.token_id);
    *detail = "jti=" + entry.token_id;
    return grpc::Status::OK;
  });
}

grpc::Status TokenAuthorityServiceImpl::RevokeAllForUser(
    grpc::ServerContext* /*context*/,
    const v1::RevokeAllForUserRequest* request,
    v1::RevokeAllForUserResponse* response) {
  return HandleRequest("RevokeAllForUser", response, [&](std::string* detail) {
    Require(!request->user_id().empty(), "user_id is required");
    Require(request->user_id().size() <= kMaxUserIdBytes,
            "user_id is too long");
    CheckReason(request->reason());
    revocation_->RevokeAllForUser(request->user_id(), request->reason());
    response->set_revoked(true);
    *detail = "user_id=" + request->user_id();
    return grpc::Status::OK;
  });
}

grpc::Status TokenAuthorityServiceImpl::GetRevocationStatus(
    grpc::ServerContext* /*context*/,
    const v1::GetRevocationStatusRequest* request,
    v1::GetRevocationStatusResponse* response) {
  return HandleRequest(
      "GetRevocationStatus", response, [&](std::string* detail) {
        Require(!request->token_id().empty(), "token_id is required");
        Require(request->token_id().size() <= kMaxTokenIdBytes,
                "token_id is too long");
        const auto entry = revocation_->Status(request->token_id());
        response->set_revoked(entry.has_value());
        if (entry) {
          response->set_reason(entry->reason);
          FillTimestamp(entry->revoked_at, response->mutable_revoked_at());
          FillTimestamp(entry->expires_at, response->mutable_expires_at());
        }
        *detail = "jti=" + request->token_id();
        return grpc::Status::OK;
      });
}

}  // namespace warden::authority
