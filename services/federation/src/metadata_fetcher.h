#pragma once

#include <chrono>
#include <string>

namespace warden::federation {

class MetadataFetcher {
 public:
  virtual ~MetadataFetcher() = default;

  // Returns the response body. Throws SamlError::Kind::MetadataFetchFailed.
  virtual std::string Fetch(const std::string& url) = 0;
};

// libcurl GET. Redirects are not followed and nothing is retried.
class CurlMetadataFetcher final : public MetadataFetcher {
 public:
  explicit CurlMetadataFetcher(
      std::chrono::seconds timeout = std::chrono::seconds(30));

  std::string Fetch(const std::string& url) override;

 private:
  std::chrono::seconds timeout_;
};

}  // namespace warden::federation
