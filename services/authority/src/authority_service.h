#pragma once

#include <memory>

#include <grpcpp/server_context.h>
#include <grpcpp/support/status.h>

#include "authority.grpc.pb.h"
#include "revocation_service.h"
#include "warden/token/token_issuer.h"
#include "warden/token/token_validator.h"

namespace warden::authority {

class TokenAuthorityServiceImpl final
    : public warden::authority::v1::TokenAuthority::Service {
 public:
  TokenAuthorityServiceImpl(
      std::shared_ptr<const token::TokenIssuer> issuer,
      std::shared_ptr<const token::TokenValidator> validator,
      std::shared_ptr<RevocationService> revocation);

  grpc::Status IssueTokenPair(
      grpc::ServerContext* context,
      const warden::authority::v1::IssueTokenPairRequest* request,
      warden::authority::v1::IssueTokenPairResponse* response) override;
  grpc::Status IssueAnonymousSession(
      grpc::ServerContext* context,
      const warden::authority::v1::IssueAnonymousSessionRequest* request,
      warden::authority::v1::IssueAnonymousSessionResponse* response) override;
  grpc::Status IssueSyntheticToken(
      grpc::ServerContext* context,
      const warden::authority::v1::IssueSyntheticTokenRequest* request,
      warden::authority::v1::IssueSyntheticTokenResponse* response) override;
  grpc::Status ValidateToken(
      grpc::ServerContext* context,
      const warden::authority::v1::ValidateTokenRequest* request,
      warden::authority::v1::ValidateTokenResponse* response) override;
  grpc::Status RefreshToken(
      grpc::ServerContext* context,
      const warden::authority::v1::RefreshTokenRequest* request,
      warden::authority::v1::RefreshTokenResponse* response) override;
  grpc::Status RevokeToken(
      grpc::ServerContext* context,
      const warden::authority::v1::RevokeTokenRequest* request,
      warden::authority::v1::RevokeTokenResponse* response) override;
  grpc::Status RevokeAllForUser(
      grpc::ServerContext* context,
      const warden::authority::v1::RevokeAllForUserRequest* request,
      warden::authority::v1::RevokeAllForUserResponse* response) override;
  grpc::Status GetRevocationStatus(
      grpc::ServerContext* context,
      const warden::authority::v1::GetRevocationStatusRequest* request,
      warden::authority::v1::GetRevocationStatusResponse* response) override;

 private:
  std::shared_ptr<const token::TokenIssuer> issuer_;
  std::shared_ptr<const token::TokenValidator> validator_;
  std::shared_ptr<RevocationService> revocation_;
};

}  // namespace warden::authority
