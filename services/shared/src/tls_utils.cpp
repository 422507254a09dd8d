#include "warden/shared/tls_utils.h"

#include <memory>
#include <stdexcept>
#include <vector>

#include <grpcpp/security/tls_certificate_provider.h>
#include <grpcpp/security/tls_credentials_options.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/x509.h>

#include "warden/shared/env_config.h"

namespace warden::shared {
namespace {

template <typename T>
using OpenSslPtr = std::unique_ptr<T, void (*)(T*)>;

template <typename T>
using PemReader = T* (*)(BIO*, T**, pem_password_cb*, void*);

OpenSslPtr<BIO> PemBio(const std::string& pem) {
  OpenSslPtr<BIO> bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())),
                      BIO_free_all);
  if (!bio) {
    throw std::runtime_error("Failed to allocate PEM BIO");
  }
  return bio;
}

template <typename T>
OpenSslPtr<T> ReadPem(const std::string& pem, PemReader<T> read,
                      void (*release)(T*), const char* what) {
  auto bio = PemBio(pem);
  OpenSslPtr<T> object(read(bio.get(), nullptr, nullptr, nullptr), release);
  if (!object) {
    throw std::runtime_error(std::string("Invalid TLS ") + what + " PEM");
  }
  return object;
}

std::size_t CountCertificates(const std::string& pem) {
  auto bio = PemBio(pem);
  STACK_OF(X509_INFO)* infos =
      PEM_X509_INFO_read_bio(bio.get(), nullptr, nullptr, nullptr);
  std::size_t count = 0;
  for (int i = 0; infos != nullptr && i < sk_X509_INFO_num(infos); ++i) {
    if (sk_X509_INFO_value(infos, i)->x509 != nullptr) {
      ++count;
    }
  }
  sk_X509_INFO_pop_free(infos, X509_INFO_free);
  return count;
}

}  // namespace

void ValidateServerTlsCredentials(const std::string& cert_pem,
                                  const std::string& key_pem,
                                  const std::string& ca_bundle_pem) {
  const auto cert =
      ReadPem<X509>(cert_pem, PEM_read_bio_X509, X509_free, "certificate");
  const auto key = ReadPem<EVP_PKEY>(key_pem, PEM_read_bio_PrivateKey,
                                     EVP_PKEY_free, "private key");
  if (X509_check_private_key(cert.get(), key.get()) != 1) {
    throw std::runtime_error("TLS private key does not match certificate");
  }
  if (X509_cmp_current_time(X509_get0_notBefore(cert.get())) > 0) {
    throw std::runtime_error("TLS certificate is not yet valid");
  }
  if (X509_cmp_current_time(X509_get0_notAfter(cert.get())) < 0) {
    throw std::runtime_error("TLS certificate has expired");
  }
  if (!ca_bundle_pem.empty() && CountCertificates(ca_bundle_pem) == 0) {
    throw std::runtime_error("TLS CA bundle does not contain any certificate");
  }
}

std::shared_ptr<grpc::ServerCredentials> BuildServerCredentials(
    const ServerTlsFiles& files) {
  const auto cert = ReadFile(files.cert_path);
  const auto key = ReadFile(files.key_path);
  const auto ca_bundle = files.ca_path.empty() ? std::string()
                                               : ReadFile(files.ca_path);
  ValidateServerTlsCredentials(cert, key, ca_bundle);

  std::vector<grpc::experimental::IdentityKeyCertPair> identity{{key, cert}};
  grpc::experimental::TlsServerCredentialsOptions options(
      std::make_shared<grpc::experimental::StaticDataCertificateProvider>(
          ca_bundle, identity));
  options.watch_identity_key_cert_pairs();
  if (!ca_bundle.empty()) {
    options.watch_root_certs();
  }
  options.set_min_tls_version(TLS1_3);
  options.set_max_tls_version(TLS1_3);
  options.set_cert_request_type(
      files.require_client_cert
          ? GRPC_SSL_REQUEST_AND_REQUIRE_CLIENT_CERTIFICATE_AND_VERIFY
          : GRPC_SSL_DONT_REQUEST_CLIENT_CERTIFICATE);
  return grpc::experimental::TlsServerCredentials(options);
}

std::string BuildBoundAddress(const std::string& original_bind_addr,
                              int selected_port) {
  if (selected_port <= 0) {
    return original_bind_addr;
  }
  const auto pos = original_bind_addr.rfind(':');
  if (pos == std::string::npos) {
    return original_bind_addr;
  }
  return original_bind_addr.substr(0, pos + 1) + std::to_string(selected_port);
}

}  // namespace warden::shared
