#include "metadata_fetcher.h"

#include <curl/curl.h>

#include <memory>
#include <mutex>
#include <string>
#include <utility>

#include "saml_error.h"

namespace warden::federation {
namespace {

// IdP metadata documents are small. Anything larger is refused.
constexpr size_t kMaxMetadataBytes = 4 * 1024 * 1024;

struct CurlHandleDeleter {
  void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};

struct ResponseBuffer {
  std::string body;
  bool overflow = false;
};

size_t WriteBody(char* ptr, size_t size, size_t nmemb, void* userdata) {
  auto* buffer = static_cast<ResponseBuffer*>(userdata);
  const size_t bytes = size * nmemb;
  if (buffer->body.size() + bytes > kMaxMetadataBytes) {
    buffer->overflow = true;
    return 0;
  }
  buffer->body.append(ptr, bytes);
  return bytes;
}

[[noreturn]] void Fail(const std::string& message) {
  throw SamlError(SamlError::Kind::MetadataFetchFailed, message);
}

void EnsureCurlGlobal() {
  static std::once_flag once;
  static CURLcode result = CURLE_OK;
  std::call_once(once, [] { result = curl_global_init(CURL_GLOBAL_DEFAULT); });
  if (result != CURLE_OK) {
    Fail(std::string("curl init failed: ") + curl_easy_strerror(result));
  }
}

}  // namespace

CurlMetadataFetcher::CurlMetadataFetcher(std::chrono::seconds timeout)
    : timeout_(timeout) {}

std::string CurlMetadataFetcher::Fetch(const std::string& url) {
  EnsureCurlGlobal();
  std::unique_ptr<CURL, CurlHandleDeleter> curl(curl_easy_init());
  if (!curl) {
    Fail("curl handle allocation failed");
  }

  ResponseBuffer buffer;
  CURL* handle = curl.get();
  curl_easy_setopt(handle, CURLOPT_URL, url.c_str());
  curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, &WriteBody);
  curl_easy_setopt(handle, CURLOPT_WRITEDATA, &buffer);
  curl_easy_setopt(handle, CURLOPT_TIMEOUT, static_cast<long>(timeout_.count()));
  curl_easy_setopt(handle, CURLOPT_FOLLOWLOCATION, 0L);
  curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(handle, CURLOPT_PROTOCOLS, CURLPROTO_HTTP | CURLPROTO_HTTPS);
  curl_easy_setopt(handle, CURLOPT_SSL_VERIFYPEER, 1L);
  curl_easy_setopt(handle, CURLOPT_SSL_VERIFYHOST, 2L);
  curl_easy_setopt(handle, CURLOPT_USERAGENT, "warden-federation");

  const CURLcode res = curl_easy_perform(handle);
  if (buffer.overflow) {
    Fail("metadata response exceeds size limit");
  }
  if (res != CURLE_OK) {
    Fail(std::string("metadata request failed: ") + curl_easy_strerror(res));
  }

  long status = 0;
  curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &status);
  if (status != 200) {
    Fail("metadata endpoint returned HTTP " + std::to_string(status));
  }
  return std::move(buffer.body);
}

}  // namespace warden::federation
