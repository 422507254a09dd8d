#include "authority_service.h"

#include <chrono>
#include <memory>

#include <gtest/gtest.h>

#include "warden/shared/revocation_ledger.h"

namespace warden::authority {
namespace {

namespace v1 = warden::authority::v1;

constexpr char kSecret[] = "0123456789abcdef0123456789abcdef";

struct Fixture {
  TimePoint now = FromUnixSeconds(1700000000);
  Clock clock = [this] { return now; };
  std::shared_ptr<const token::TokenCodec> codec =
      std::make_shared<token::TokenCodec>(kSecret, clock);
  std::shared_ptr<const token::TokenIssuer> issuer =
      std::make_shared<token::TokenIssuer>(codec);
  std::shared_ptr<const token::TokenValidator> validator =
      std::make_shared<token::TokenValidator>(codec);
  std::shared_ptr<RevocationService> revocation = [this] {
    shared::RevocationLedgerOptions options;
    options.clock = clock;
    return std::make_shared<RevocationService>(
        validator,
        shared::CreateRevocationLedger(shared::SharedStoreConfig{}, options),
        clock);
  }();
  TokenAuthorityServiceImpl service{issuer, validator, revocation};

  v1::IssueTokenPairResponse IssuePair(const std::string& user_id) {
    v1::IssueTokenPairRequest request;
    request.mutable_subject()->set_user_id(user_id);
    request.mutable_subject()->set_email(user_id + "@example.com");
    v1::IssueTokenPairResponse response;
    EXPECT_TRUE(service.IssueTokenPair(nullptr, &request, &response).ok());
    return response;
  }
};

}  // namespace

TEST(AuthorityServiceTest, IssueTokenPairFillsClaims) {
  Fixture f;
  const auto response = f.IssuePair("user-1");
  EXPECT_FALSE(response.has_error());
  EXPECT_EQ(response.access().claims().subject(), "user-1");
  EXPECT_EQ(response.access().claims().kind(), v1::TOKEN_KIND_ACCESS);
  EXPECT_EQ(response.refresh().claims().kind(), v1::TOKEN_KIND_REFRESH);
  EXPECT_EQ(response.access().claims().principal(), v1::PRINCIPAL_KIND_USER);
  EXPECT_EQ(response.access().claims().session_id(),
            response.refresh().claims().session_id());
}

TEST(AuthorityServiceTest, IssueTokenPairRejectsMissingSubject) {
  Fixture f;
  v1::IssueTokenPairRequest request;
  v1::IssueTokenPairResponse response;
  const auto status = f.service.IssueTokenPair(nullptr, &request, &response);
  EXPECT_EQ(status.error_code(), grpc::StatusCode::INVALID_ARGUMENT);
  EXPECT_EQ(response.error().code(), v1::AUTHORITY_ERROR_CODE_INVALID_REQUEST);
}

TEST(AuthorityServiceTest, ValidateReportsExpiredTokens) {
  Fixture f;
  const auto pair = f.IssuePair("user-1");
  f.now += std::chrono::hours(1);

  v1::ValidateTokenRequest request;
  request.set_token(pair.access().token());
  request.set_mode(v1::VALIDATION_MODE_ACCESS);
  v1::ValidateTokenResponse response;
  const auto status = f.service.ValidateToken(nullptr, &request, &response);
  EXPECT_EQ(status.error_code(), grpc::StatusCode::UNAUTHENTICATED);
  EXPECT_EQ(response.error().code(), v1::AUTHORITY_ERROR_CODE_TOKEN_EXPIRED);
  EXPECT_FALSE(response.valid());
}

TEST(AuthorityServiceTest, RevokedTokenFailsRevocationAwareValidation) {
  Fixture f;
  const auto pair = f.IssuePair("user-1");

  v1::RevokeTokenRequest revoke;
  revoke.set_token(pair.access().token());
  revoke.set_reason("logout");
  v1::RevokeTokenResponse revoked;
  ASSERT_TRUE(f.service.RevokeToken(nullptr, &revoke, &revoked).ok());
  EXPECT_EQ(revoked.token_id(), pair.access().claims().token_id());

  v1::ValidateTokenRequest request;
  request.set_token(pair.access().token());
  request.set_mode(v1::VALIDATION_MODE_ACCESS);
  v1::ValidateTokenResponse plain;
  EXPECT_TRUE(f.service.ValidateToken(nullptr, &request, &plain).ok());

  request.set_check_revocation(true);
  v1::ValidateTokenResponse checked;
  const auto status = f.service.ValidateToken(nullptr, &request, &checked);
  EXPECT_EQ(status.error_code(), grpc::StatusCode::UNAUTHENTICATED);
  EXPECT_EQ(checked.error().code(), v1::AUTHORITY_ERROR_CODE_TOKEN_REVOKED);

  v1::GetRevocationStatusRequest status_request;
  status_request.set_token_id(pair.access().claims().token_id());
  v1::GetRevocationStatusResponse status_response;
  ASSERT_TRUE(f.service
                  .GetRevocationStatus(nullptr, &status_request,
                                       &status_response)
                  .ok());
  EXPECT_TRUE(status_response.revoked());
  EXPECT_EQ(status_response.reason(), "logout");
}

TEST(AuthorityServiceTest, RevokeServiceRoleIsPermissionDenied) {
  Fixture f;
  v1::IssueSyntheticTokenRequest synthetic;
  synthetic.set_identity(v1::SYNTHETIC_IDENTITY_SERVICE_ROLE);
  v1::IssueSyntheticTokenResponse issued;
  ASSERT_TRUE(f.service.IssueSyntheticToken(nullptr, &synthetic, &issued).ok());
  EXPECT_EQ(issued.token().claims().principal(), v1::PRINCIPAL_KIND_SERVICE);

  v1::RevokeTokenRequest revoke;
  revoke.set_token(issued.token().token());
  v1::RevokeTokenResponse response;
  const auto status = f.service.RevokeToken(nullptr, &revoke, &response);
  EXPECT_EQ(status.error_code(), grpc::StatusCode::PERMISSION_DENIED);
  EXPECT_EQ(response.error().code(),
            v1::AUTHORITY_ERROR_CODE_CANNOT_REVOKE_SERVICE_ROLE);
}

TEST(AuthorityServiceTest, RefreshIsRefusedAfterUserWideRevocation) {
  Fixture f;
  const auto pair = f.IssuePair("user-1");

  v1::RefreshTokenRequest refresh;
  refresh.set_refresh_token(pair.refresh().token());
  v1::RefreshTokenResponse refreshed;
  ASSERT_TRUE(f.service.RefreshToken(nullptr, &refresh, &refreshed).ok());
  EXPECT_NE(refreshed.access().claims().session_id(),
            pair.refresh().claims().session_id());

  f.now += std::chrono::seconds(1);
  v1::RevokeAllForUserRequest revoke_all;
  revoke_all.set_user_id("user-1");
  v1::RevokeAllForUserResponse revoke_response;
  ASSERT_TRUE(
      f.service.RevokeAllForUser(nullptr, &revoke_all, &revoke_response).ok());

  v1::RefreshTokenResponse denied;
  const auto status = f.service.RefreshToken(nullptr, &refresh, &denied);
  EXPECT_EQ(status.error_code(), grpc::StatusCode::UNAUTHENTICATED);
  EXPECT_EQ(denied.error().code(), v1::AUTHORITY_ERROR_CODE_TOKEN_REVOKED);
}

TEST(AuthorityServiceTest, ValidateRequiresMode) {
  Fixture f;
  const auto pair = f.IssuePair("user-1");
  v1::ValidateTokenRequest request;
  request.set_token(pair.access().token());
  v1::ValidateTokenResponse response;
  EXPECT_EQ(f.service.ValidateToken(nullptr, &request, &response).error_code(),
            grpc::StatusCode::INVALID_ARGUMENT);
}

}  // namespace warden::authority
