#pragma once

#include <chrono>
#include <string>

namespace confq {

/// Transfers one URL into memory.
/// MUST throw NetworkError on any failed transfer, including HTTP error statuses.
class Downloader {
 public:
  virtual ~Downloader() = default;
  virtual std::string download(const std::string& url, std::chrono::milliseconds timeout) = 0;
};

/// libcurl-backed downloader. Follows redirects, sends a stable user agent, and adds
/// "Authorization: Bearer <token>" when a token is configured.
/// Without CONFQ_USE_CURL every call throws BinaryFetchError.
class CurlDownloader : public Downloader {
 public:
  explicit CurlDownloader(std::string auth_token = "");
  std::string download(const std::string& url, std::chrono::milliseconds timeout) override;

 private:
  std::string auth_token_;
};

/// Returns "confq/<version>".
std::string user_agent();

}  // namespace confq
