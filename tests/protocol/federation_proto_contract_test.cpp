#include <gtest/gtest.h>

#include <google/protobuf/descriptor.h>

#include "federation.pb.h"

namespace {

TEST(FederationProtoContractTest, ServiceShapeIsFrozen) {
  const auto* service =
      google::protobuf::DescriptorPool::generated_pool()->FindServiceByName(
          "warden.federation.v1.Federation");
  ASSERT_NE(service, nullptr);
  ASSERT_EQ(service->method_count(), 10);
  EXPECT_EQ(service->method(0)->name(), "ListProviders");
  EXPECT_EQ(service->method(1)->name(), "RegisterProvider");
  EXPECT_EQ(service->method(2)->name(), "GetServiceProviderMetadata");
  EXPECT_EQ(service->method(3)->name(), "BeginSamlLogin");
  EXPECT_EQ(service->method(4)->name(), "CompleteSamlLogin");
  EXPECT_EQ(service->method(5)->name(), "BeginSamlLogout");
  EXPECT_EQ(service->method(6)->name(), "HandleSamlLogoutRequest");
  EXPECT_EQ(service->method(7)->name(), "HandleSamlLogoutResponse");
  EXPECT_EQ(service->method(8)->name(), "BeginOAuthFlow");
  EXPECT_EQ(service->method(9)->name(), "CompleteOAuthFlow");
}

TEST(FederationProtoContractTest, ErrorCodeValuesAreStable) {
  using namespace warden::federation::v1;

  EXPECT_EQ(static_cast<int>(FEDERATION_ERROR_CODE_UNSPECIFIED), 0);
  EXPECT_EQ(static_cast<int>(FEDERATION_ERROR_CODE_INVALID_REQUEST), 1);
  EXPECT_EQ(static_cast<int>(FEDERATION_ERROR_CODE_ASSERTION_INVALID), 2);
  EXPECT_EQ(static_cast<int>(FEDERATION_ERROR_CODE_ASSERTION_EXPIRED), 3);
  EXPECT_EQ(static_cast<int>(FEDERATION_ERROR_CODE_ASSERTION_REPLAYED), 4);
  EXPECT_EQ(static_cast<int>(FEDERATION_ERROR_CODE_AUDIENCE_MISMATCH), 5);
  EXPECT_EQ(static_cast<int>(FEDERATION_ERROR_CODE_MISSING_EMAIL), 6);
  EXPECT_EQ(static_cast<int>(FEDERATION_ERROR_CODE_PROVIDER_NOT_FOUND), 7);
  EXPECT_EQ(static_cast<int>(FEDERATION_ERROR_CODE_PROVIDER_DISABLED), 8);
  EXPECT_EQ(static_cast<int>(FEDERATION_ERROR_CODE_INVALID_REDIRECT), 9);
  EXPECT_EQ(static_cast<int>(FEDERATION_ERROR_CODE_METADATA_FETCH_FAILED), 10);
  EXPECT_EQ(static_cast<int>(FEDERATION_ERROR_CODE_METADATA_INSECURE_URL), 11);
  EXPECT_EQ(static_cast<int>(FEDERATION_ERROR_CODE_METADATA_PARSE_FAILED), 12);
  EXPECT_EQ(static_cast<int>(FEDERATION_ERROR_CODE_GROUP_ACCESS_DENIED), 13);
  EXPECT_EQ(static_cast<int>(FEDERATION_ERROR_CODE_STATE_INVALID), 14);
  EXPECT_EQ(static_cast<int>(FEDERATION_ERROR_CODE_USER_NOT_PROVISIONED), 15);
  EXPECT_EQ(static_cast<int>(FEDERATION_ERROR_CODE_SLO_NOT_SUPPORTED), 16);
  EXPECT_EQ(static_cast<int>(FEDERATION_ERROR_CODE_SIGNING_KEY_MISSING), 17);
  EXPECT_EQ(static_cast<int>(FEDERATION_ERROR_CODE_INVALID_LOGOUT_MESSAGE), 18);
  EXPECT_EQ(static_cast<int>(FEDERATION_ERROR_CODE_TEMPORARILY_UNAVAILABLE),
            19);
  EXPECT_EQ(static_cast<int>(FEDERATION_ERROR_CODE_INTERNAL), 20);
}

TEST(FederationProtoContractTest, BindingAndSurfaceValuesAreStable) {
  using namespace warden::federation::v1;

  EXPECT_EQ(static_cast<int>(SAML_BINDING_HTTP_POST), 1);
  EXPECT_EQ(static_cast<int>(SAML_BINDING_HTTP_REDIRECT), 2);
  EXPECT_EQ(static_cast<int>(LOGIN_SURFACE_APP), 1);
  EXPECT_EQ(static_cast<int>(LOGIN_SURFACE_DASHBOARD), 2);
}

TEST(FederationProtoContractTest, LoginResponseReusesAuthorityTokens) {
  const auto* descriptor =
      warden::federation::v1::CompleteSamlLoginResponse::descriptor();
  ASSERT_NE(descriptor, nullptr);
  const auto* access = descriptor->FindFieldByName("access");
  ASSERT_NE(access, nullptr);
  EXPECT_EQ(access->message_type()->full_name(),
            "warden.authority.v1.IssuedToken");
  EXPECT_NE(descriptor->FindFieldByName("refresh"), nullptr);
  EXPECT_NE(descriptor->FindFieldByName("user_created"), nullptr);
  EXPECT_NE(descriptor->FindFieldByName("redirect_to"), nullptr);
  EXPECT_NE(descriptor->FindFieldByName("error"), nullptr);
}

TEST(FederationProtoContractTest, ProviderConfigCoversGroupRules) {
  const auto* descriptor =
      warden::federation::v1::ProviderConfig::descriptor();
  ASSERT_NE(descriptor, nullptr);
  for (const char* field :
       {"metadata_url", "metadata_xml", "allowed_redirect_hosts",
        "required_groups", "required_groups_all", "denied_groups",
        "group_attribute", "sp_certificate_pem", "sp_private_key_pem"}) {
    EXPECT_NE(descriptor->FindFieldByName(field), nullptr) << field;
  }
}

}  // namespace
