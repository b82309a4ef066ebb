#include "curl_fetcher.hpp"

#include <curl/curl.h>

#include <memory>
#include <mutex>
#include <stdexcept>

#include "config/config.pb.h"
#include "internal/storage/common/arrow_utils.hpp"

namespace skycache::net {

namespace {

std::once_flag g_curl_init;

struct EasyHandleDeleter {
  void operator()(CURL* handle) const {
    curl_easy_cleanup(handle);
  }
};

using EasyHandle = std::unique_ptr<CURL, EasyHandleDeleter>;

size_t WriteBody(char* ptr, size_t size, size_t nmemb, void* userdata) {
  auto* body = static_cast<std::string*>(userdata);
  body->append(ptr, size * nmemb);
  return size * nmemb;
}

// non-zero return aborts the transfer with CURLE_ABORTED_BY_CALLBACK
int OnTransferInfo(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
  const auto* token = static_cast<const util::CancellationToken*>(clientp);
  return token->IsCancelled() ? 1 : 0;
}

} // namespace

CurlFetcherOptions CurlFetcherOptions::FromConfig(const skycache::runtime::config::NetworkConfig& cfg) {
  CurlFetcherOptions options;
  if (cfg.connect_timeout_ms() > 0) options.connect_timeout_ms = static_cast<long>(cfg.connect_timeout_ms());
  if (cfg.request_timeout_ms() > 0) options.request_timeout_ms = static_cast<long>(cfg.request_timeout_ms());
  if (!cfg.user_agent().empty()) options.user_agent = cfg.user_agent();
  options.start_online = !cfg.start_offline();
  return options;
}

CurlFetcher::CurlFetcher(CurlFetcherOptions options) : options_(std::move(options)), online_(options_.start_online) {
  std::call_once(g_curl_init, [] {
    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
      throw std::runtime_error("curl_global_init failed");
    }
  });
}

FetchResult CurlFetcher::Fetch(const std::string& url, const util::CancellationToken& token) {
  FetchResult result;

  if (token.IsCancelled()) {
    result.outcome = FetchOutcome::kCancelled;
    result.error   = "cancelled before request";
    return result;
  }

  EasyHandle handle(curl_easy_init());
  if (!handle) {
    result.error = "curl_easy_init failed";
    return result;
  }

  std::string body;
  char        error_buffer[CURL_ERROR_SIZE] = {0};

  CURL* curl = handle.get();
  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 5L);
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, options_.connect_timeout_ms);
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, options_.request_timeout_ms);
  curl_easy_setopt(curl, CURLOPT_USERAGENT, options_.user_agent.c_str());
  curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "");
  curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, error_buffer);
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, &WriteBody);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &body);
  curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
  curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, &OnTransferInfo);
  curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &token);

  CURLcode rc = curl_easy_perform(curl);

  if (rc == CURLE_ABORTED_BY_CALLBACK || token.IsCancelled()) {
    result.outcome = FetchOutcome::kCancelled;
    result.error   = "cancelled during transfer";
    return result;
  }

  if (rc != CURLE_OK) {
    result.outcome = FetchOutcome::kNetworkError;
    result.error   = error_buffer[0] != '\0' ? error_buffer : curl_easy_strerror(rc);
    return result;
  }

  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &result.http_status);

  char* content_type = nullptr;
  if (curl_easy_getinfo(curl, CURLINFO_CONTENT_TYPE, &content_type) == CURLE_OK && content_type) {
    result.content_type = content_type;
  }

  // file:// and similar schemes report 0
  if (result.http_status != 0 && (result.http_status < 200 || result.http_status >= 300)) {
    result.outcome = FetchOutcome::kHttpError;
    result.error   = "HTTP " + std::to_string(result.http_status);
    return result;
  }

  result.outcome = FetchOutcome::kOk;
  result.body    = storage::common::WrapString(std::move(body));
  return result;
}

} // namespace skycache::net
