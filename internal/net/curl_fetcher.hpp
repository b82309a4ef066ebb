#pragma once

#include <atomic>
#include <string>

#include "fetcher.hpp"

namespace skycache::runtime::config {
class NetworkConfig;
}

namespace skycache::net {

struct CurlFetcherOptions {
  long        connect_timeout_ms = 10000;
  long        request_timeout_ms = 60000;
  std::string user_agent         = "skycache/1.0";
  bool        start_online       = true;

  static CurlFetcherOptions FromConfig(const skycache::runtime::config::NetworkConfig& cfg);
};

/*
  libcurl easy-interface fetcher.

  One easy handle per request, so concurrent Fetch calls share nothing
  but the global init. Redirects are followed. The transfer-info
  callback polls the cancellation token and aborts the transfer.
*/
class CurlFetcher final : public Fetcher {
 public:
  explicit CurlFetcher(CurlFetcherOptions options = {});

  FetchResult Fetch(const std::string& url, const util::CancellationToken& token) override;

  bool IsOnline() const override {
    return online_.load(std::memory_order_relaxed);
  }

  void SetOnline(bool online) {
    online_.store(online, std::memory_order_relaxed);
  }

 private:
  CurlFetcherOptions options_;
  std::atomic<bool>  online_{true};
};

} // namespace skycache::net
