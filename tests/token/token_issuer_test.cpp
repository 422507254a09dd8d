#include "warden/token/token_issuer.h"

#include <chrono>
#include <memory>
#include <stdexcept>

#include <gtest/gtest.h>

#include "warden/token/token_error.h"

namespace warden::token {
namespace {

constexpr char kSecret[] = "0123456789abcdef0123456789abcdef";

std::shared_ptr<const TokenCodec> MakeCodec() {
  return std::make_shared<TokenCodec>(kSecret);
}

TokenSubject MakeSubject() {
  TokenSubject subject;
  subject.user_id = "user-1";
  subject.email = "ada@example.com";
  subject.name = "Ada";
  return subject;
}

}  // namespace

TEST(TokenIssuerTest, TokenPairSharesOneSession) {
  TokenIssuer issuer(MakeCodec());
  const auto pair = issuer.IssueTokenPair(MakeSubject());

  EXPECT_EQ(pair.access.claims.kind, TokenKind::Access);
  EXPECT_EQ(pair.refresh.claims.kind, TokenKind::Refresh);
  EXPECT_FALSE(pair.access.claims.session_id.empty());
  EXPECT_EQ(pair.access.claims.session_id, pair.refresh.claims.session_id);
  EXPECT_NE(pair.access.claims.token_id, pair.refresh.claims.token_id);
  EXPECT_EQ(pair.access.claims.issuer, "warden");
  EXPECT_EQ(pair.access.claims.expires_at - pair.access.claims.issued_at,
            std::chrono::minutes(15));
  EXPECT_EQ(pair.refresh.claims.expires_at - pair.refresh.claims.issued_at,
            std::chrono::hours(24 * 7));
}

TEST(TokenIssuerTest, RefreshStartsANewSession) {
  TokenIssuer issuer(MakeCodec());
  const auto pair = issuer.IssueTokenPair(MakeSubject());

  const auto refreshed = issuer.Refresh(pair.refresh.claims);
  EXPECT_EQ(refreshed.claims.kind, TokenKind::Access);
  EXPECT_EQ(refreshed.claims.subject, "user-1");
  EXPECT_EQ(refreshed.claims.email, "ada@example.com");
  EXPECT_FALSE(refreshed.claims.session_id.empty());
  EXPECT_NE(refreshed.claims.session_id, pair.refresh.claims.session_id);
  EXPECT_NE(refreshed.claims.token_id, pair.refresh.claims.token_id);
}

TEST(TokenIssuerTest, RefreshRejectsAccessTokens) {
  TokenIssuer issuer(MakeCodec());
  const auto pair = issuer.IssueTokenPair(MakeSubject());
  EXPECT_THROW(issuer.Refresh(pair.access.claims), TokenError);
}

TEST(TokenIssuerTest, ReservedRolesCannotBeIssuedToUsers) {
  TokenIssuer issuer(MakeCodec());
  auto subject = MakeSubject();
  subject.role = kRoleServiceRole;
  try {
    issuer.IssueTokenPair(subject);
    FAIL() << "service_role subjects must be rejected";
  } catch (const TokenError& ex) {
    EXPECT_EQ(ex.kind(), TokenError::Kind::InvalidRequest);
  }

  subject.role = kRoleAuthenticated;
  subject.user_id.clear();
  EXPECT_THROW(issuer.IssueAccessToken(subject), TokenError);
}

TEST(TokenIssuerTest, SyntheticTokensUseWellKnownSubjects) {
  TokenIssuer issuer(MakeCodec());

  const auto anon = issuer.IssueAnonymousToken();
  EXPECT_EQ(anon.claims.subject, kAnonymousSubject);
  EXPECT_EQ(anon.claims.role, kRoleAnon);
  EXPECT_EQ(anon.claims.principal, PrincipalKind::Anonymous);
  EXPECT_TRUE(anon.claims.session_id.empty());

  const auto service = issuer.IssueServiceRoleToken();
  EXPECT_EQ(service.claims.subject, kServiceRoleSubject);
  EXPECT_EQ(service.claims.role, kRoleServiceRole);
  EXPECT_EQ(service.claims.principal, PrincipalKind::Service);
  EXPECT_THROW(issuer.Refresh(service.claims), TokenError);
}

TEST(TokenIssuerTest, AnonymousSessionHasRandomSubjectAndNoSession) {
  TokenIssuer issuer(MakeCodec());
  const auto first = issuer.IssueAnonymousSession(R"({"theme":"dark"})");
  const auto second = issuer.IssueAnonymousSession();

  EXPECT_TRUE(first.access.claims.is_anonymous);
  EXPECT_EQ(first.access.claims.subject, first.refresh.claims.subject);
  EXPECT_NE(first.access.claims.subject, second.access.claims.subject);
  EXPECT_NE(first.access.claims.subject, kAnonymousSubject);
  EXPECT_TRUE(first.access.claims.session_id.empty());
  EXPECT_EQ(first.access.claims.user_metadata, R"({"theme":"dark"})");

  const auto refreshed = issuer.Refresh(first.refresh.claims);
  EXPECT_TRUE(refreshed.claims.session_id.empty());
  EXPECT_TRUE(refreshed.claims.is_anonymous);
}

TEST(TokenIssuerTest, RejectsNonPositiveTtls) {
  TokenIssuerConfig config;
  config.access_ttl = std::chrono::seconds(0);
  EXPECT_THROW(TokenIssuer issuer(MakeCodec(), config), std::runtime_error);
}

}  // namespace warden::token
