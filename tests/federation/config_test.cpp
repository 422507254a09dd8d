#include "config.h"

#include <filesystem>
#include <stdexcept>
#include <string>

#include <gtest/gtest.h>

#include "support/scoped_env.h"

namespace warden::federation {
namespace {

using warden::testing::ScopedEnv;
using warden::testing::WriteTempFile;

struct RequiredEnv {
  ScopedEnv bind{"FEDERATION_BIND_ADDR", "127.0.0.1:0"};
  ScopedEnv cert{"FEDERATION_TLS_CERT", "/tmp/test-cert.pem"};
  ScopedEnv key{"FEDERATION_TLS_KEY", "/tmp/test-key.pem"};
  ScopedEnv base{"FEDERATION_BASE_URL", "https://auth.example.com"};
  ScopedEnv secret{"FEDERATION_JWT_SECRET_FILE", "/tmp/jwt-secret"};
  ScopedEnv providers{"FEDERATION_SAML_PROVIDERS", nullptr};
};

}  // namespace

TEST(FederationConfigTest, ProviderPrefixIsUppercasedAndSanitized) {
  EXPECT_EQ(ProviderEnvPrefix("okta"), "FEDERATION_SAML_OKTA_");
  EXPECT_EQ(ProviderEnvPrefix("azure-ad.prod"), "FEDERATION_SAML_AZURE_AD_PROD_");
}

TEST(FederationConfigTest, RequiresBaseUrl) {
  RequiredEnv env;
  ScopedEnv base("FEDERATION_BASE_URL", nullptr);
  EXPECT_THROW(LoadConfig(), std::runtime_error);
}

TEST(FederationConfigTest, LoadsProviderSettings) {
  RequiredEnv env;
  const auto metadata_path = WriteTempFile("warden_idp_metadata", "<xml/>");
  ScopedEnv providers("FEDERATION_SAML_PROVIDERS", "okta");
  ScopedEnv metadata("FEDERATION_SAML_OKTA_METADATA_FILE", metadata_path);
  ScopedEnv hosts("FEDERATION_SAML_OKTA_ALLOWED_REDIRECT_HOSTS",
                  "app.example.com, example.org");
  ScopedEnv groups("FEDERATION_SAML_OKTA_REQUIRED_GROUPS", "staff");
  ScopedEnv denied("FEDERATION_SAML_OKTA_DENIED_GROUPS", "contractors");
  ScopedEnv email("FEDERATION_SAML_OKTA_EMAIL_ATTRIBUTE", "mail");
  ScopedEnv idp_initiated("FEDERATION_SAML_OKTA_ALLOW_IDP_INITIATED", "true");

  const auto config = LoadConfig();
  ASSERT_EQ(config.providers.size(), 1u);
  const auto& provider = config.providers.front();
  EXPECT_EQ(provider.name, "okta");
  EXPECT_EQ(provider.metadata_xml, "<xml/>");
  ASSERT_EQ(provider.allowed_redirect_hosts.size(), 2u);
  EXPECT_EQ(provider.allowed_redirect_hosts[1], "example.org");
  EXPECT_EQ(provider.group_rules.required_any.front(), "staff");
  EXPECT_EQ(provider.group_rules.denied.front(), "contractors");
  EXPECT_EQ(provider.attribute_mapping.at("email"), "mail");
  EXPECT_TRUE(provider.allow_idp_initiated);
  EXPECT_FALSE(provider.allow_dashboard_login);
  EXPECT_TRUE(provider.allow_app_login);
  std::filesystem::remove(metadata_path);
}

TEST(FederationConfigTest, EnabledProviderNeedsMetadataSource) {
  ScopedEnv url("FEDERATION_SAML_OKTA_METADATA_URL", nullptr);
  ScopedEnv file("FEDERATION_SAML_OKTA_METADATA_FILE", nullptr);
  EXPECT_THROW(LoadProviderConfig("okta"), std::runtime_error);
}

TEST(FederationConfigTest, MisconfiguredProviderIsSkipped) {
  RequiredEnv env;
  ScopedEnv providers("FEDERATION_SAML_PROVIDERS", "good,bad,unpaired");
  ScopedEnv good_url("FEDERATION_SAML_GOOD_METADATA_URL",
                     "https://idp.example.com/metadata");
  ScopedEnv bad_file("FEDERATION_SAML_BAD_METADATA_FILE",
                     "/nonexistent/idp.xml");
  ScopedEnv unpaired_url("FEDERATION_SAML_UNPAIRED_METADATA_URL",
                         "https://idp.example.com/other");
  ScopedEnv unpaired_cert("FEDERATION_SAML_UNPAIRED_SP_CERT_FILE",
                          "/tmp/sp.pem");
  ScopedEnv unpaired_key("FEDERATION_SAML_UNPAIRED_SP_KEY_FILE", nullptr);

  FederationConfig config;
  ASSERT_NO_THROW(config = LoadConfig());
  ASSERT_EQ(config.providers.size(), 1u);
  EXPECT_EQ(config.providers.front().name, "good");
  EXPECT_EQ(config.providers.front().metadata_url,
            "https://idp.example.com/metadata");
}

TEST(FederationConfigTest, SpCertificateAndKeyMustBePaired) {
  ScopedEnv url("FEDERATION_SAML_OKTA_METADATA_URL",
                "https://idp.example.com/metadata");
  ScopedEnv cert("FEDERATION_SAML_OKTA_SP_CERT_FILE", "/tmp/sp.pem");
  ScopedEnv key("FEDERATION_SAML_OKTA_SP_KEY_FILE", nullptr);
  EXPECT_THROW(LoadProviderConfig("okta"), std::runtime_error);
}

}  // namespace warden::federation
