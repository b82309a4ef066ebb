#pragma once

#include <cstddef>
#include <cstdint>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/net/fetcher.hpp"
#include "internal/storage/cache_store.hpp"
#include "internal/storage/partition_naming.hpp"

namespace skycache::runtime::config {
class UnifiedConfig;
}

namespace skycache::unified {

enum class CacheStrategy {
  kCacheFirst,   // cache, then network
  kNetworkFirst, // network, cache when the network is unreachable
  kCacheOnly,
  kNetworkOnly,  // never reads or writes the cache
  kStaleWhileRevalidate, // cached entry now, refreshed in the background
};

const char*                  ToString(CacheStrategy strategy);
std::optional<CacheStrategy> ParseCacheStrategy(std::string_view text);

struct UnifiedCacheOptions {
  std::string              name           = "cache";
  std::int64_t             default_ttl_ms = 7LL * 24 * 60 * 60 * 1000;
  std::vector<std::string> url_patterns   = DefaultUrlPatterns();
  std::size_t              prefetch_concurrency = 5;

  static std::vector<std::string> DefaultUrlPatterns();
  static UnifiedCacheOptions      FromConfig(const skycache::runtime::config::UnifiedConfig& cfg);
};

struct FetchOptions {
  // skip the cache read in kCacheFirst
  bool                        force_network = false;
  std::optional<std::int64_t> ttl_ms;
  // defaults to the URL
  std::string cache_key;
};

struct UnifiedResponse {
  bool                           ok         = false;
  bool                           from_cache = false;
  long                           http_status = 0;
  std::shared_ptr<arrow::Buffer> body;
  std::string                    content_type;
  std::string                    error;
};

struct PrefetchSummary {
  std::size_t                 succeeded = 0;
  std::size_t                 failed    = 0;
  std::map<std::string, bool> results;
};

/*
  General URL cache in front of the fetcher, one partition
  ({unified_prefix}{name}-v{schema}).

  Only URLs matching one of url_patterns (plain substring match) are
  written; an empty pattern list caches everything. Entries carry a TTL
  and are dropped on the first read after they expire.

  Concurrent network fetches for the same cache key share one request.
  Background refreshes started by kStaleWhileRevalidate are joined by
  WaitForBackgroundRefresh() and by the destructor.
*/
class UnifiedCache {
 public:
  UnifiedCache(storage::CacheStorePtr cache, net::FetcherPtr fetcher, storage::PartitionNaming naming = {}, UnifiedCacheOptions options = {});
  ~UnifiedCache();

  UnifiedCache(const UnifiedCache&)            = delete;
  UnifiedCache& operator=(const UnifiedCache&) = delete;

  bool ShouldCache(const std::string& url) const;

  UnifiedResponse Fetch(const std::string& url, CacheStrategy strategy = CacheStrategy::kCacheFirst, const FetchOptions& options = {});

  /*
    Network fetch that stores the response. True if the fetch succeeded.
  */
  bool Prefetch(const std::string& url, std::optional<std::int64_t> ttl_ms = std::nullopt);

  /*
    Prefetch in batches of prefetch_concurrency concurrent requests.
  */
  PrefetchSummary PrefetchAll(const std::vector<std::string>& urls, std::optional<std::int64_t> ttl_ms = std::nullopt);

  bool Delete(const std::string& url);

  bool Clear();

  std::vector<std::string> Keys();

  std::size_t CleanupExpired();

  void WaitForBackgroundRefresh();

  const std::string& Partition() const {
    return partition_;
  }

 private:
  std::optional<UnifiedResponse> Lookup(const std::string& key);
  UnifiedResponse                FetchAndStore(const std::string& url, const std::string& key, std::optional<std::int64_t> ttl_ms);
  UnifiedResponse                FetchFromNetwork(const std::string& url, const std::string& key, std::optional<std::int64_t> ttl_ms);
  void                           RefreshInBackground(const std::string& url, const std::string& key, std::optional<std::int64_t> ttl_ms);

  storage::CacheStorePtr cache_;
  net::FetcherPtr        fetcher_;
  UnifiedCacheOptions    options_;
  std::string            partition_;

  std::mutex                                                pending_mutex_;
  std::map<std::string, std::shared_future<UnifiedResponse>> pending_;

  std::mutex                     background_mutex_;
  std::vector<std::future<void>> background_;
};

} // namespace skycache::unified
