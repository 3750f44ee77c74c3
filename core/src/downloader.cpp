#include "confq/downloader.h"

#include <mutex>
#include <string>
#include <utility>

#ifdef CONFQ_USE_CURL
#include <curl/curl.h>
#endif

#include "confq/errors.h"
#include "confq/logging.h"
#include "confq/version.h"

namespace confq {

#ifdef CONFQ_USE_CURL
namespace {

/// Appends curl response bytes into a caller-provided buffer.
/// MUST return the full byte count or curl treats it as an error.
size_t write_to_string(void* contents, size_t size, size_t nmemb, void* userp) {
  size_t total = size * nmemb;
  auto* out = static_cast<std::string*>(userp);
  out->append(static_cast<const char*>(contents), total);
  return total;
}

void global_init_once() {
  static std::once_flag flag;
  std::call_once(flag, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

/// Owns one easy handle and its header list.
struct CurlHandle {
  CURL* curl = curl_easy_init();
  curl_slist* headers = nullptr;

  ~CurlHandle() {
    if (headers) curl_slist_free_all(headers);
    if (curl) curl_easy_cleanup(curl);
  }
};

}  // namespace
#endif

std::string user_agent() {
  return "confq/" + get_version_info().version;
}

CurlDownloader::CurlDownloader(std::string auth_token) : auth_token_(std::move(auth_token)) {}

std::string CurlDownloader::download(const std::string& url, std::chrono::milliseconds timeout) {
#ifdef CONFQ_USE_CURL
  global_init_once();
  CurlHandle handle;
  if (!handle.curl) {
    throw NetworkError("Failed to initialize curl");
  }
  const std::string agent = user_agent();
  std::string buffer;
  curl_easy_setopt(handle.curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(handle.curl, CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(handle.curl, CURLOPT_MAXREDIRS, 10L);
  curl_easy_setopt(handle.curl, CURLOPT_FAILONERROR, 1L);
  curl_easy_setopt(handle.curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(handle.curl, CURLOPT_WRITEFUNCTION, write_to_string);
  curl_easy_setopt(handle.curl, CURLOPT_WRITEDATA, &buffer);
  curl_easy_setopt(handle.curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
  curl_easy_setopt(handle.curl, CURLOPT_USERAGENT, agent.c_str());
  if (!auth_token_.empty()) {
    const std::string header = "Authorization: Bearer " + auth_token_;
    handle.headers = curl_slist_append(handle.headers, header.c_str());
    curl_easy_setopt(handle.curl, CURLOPT_HTTPHEADER, handle.headers);
  }
  log::logger()->debug("GET {}", url);
  CURLcode res = curl_easy_perform(handle.curl);
  if (res != CURLE_OK) {
    long status = 0;
    curl_easy_getinfo(handle.curl, CURLINFO_RESPONSE_CODE, &status);
    std::string message = std::string("Failed to fetch ") + url + ": " + curl_easy_strerror(res);
    if (status != 0) message += " (HTTP " + std::to_string(status) + ")";
    throw NetworkError(message);
  }
  return buffer;
#else
  (void)url;
  (void)timeout;
  throw BinaryFetchError("Downloads are disabled (built without libcurl)");
#endif
}

}  // namespace confq
