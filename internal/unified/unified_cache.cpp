#include "unified_cache.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <future>
#include <stdexcept>

#include "config/config.pb.h"
#include "internal/observability/logging.hpp"

namespace skycache::unified {

using observability::StringField;

const char* ToString(CacheStrategy strategy) {
  switch (strategy) {
    case CacheStrategy::kCacheFirst:
      return "cache-first";
    case CacheStrategy::kNetworkFirst:
      return "network-first";
    case CacheStrategy::kCacheOnly:
      return "cache-only";
    case CacheStrategy::kNetworkOnly:
      return "network-only";
    case CacheStrategy::kStaleWhileRevalidate:
      return "stale-while-revalidate";
  }
  return "cache-first";
}

std::optional<CacheStrategy> ParseCacheStrategy(std::string_view text) {
  for (auto strategy : {CacheStrategy::kCacheFirst, CacheStrategy::kNetworkFirst, CacheStrategy::kCacheOnly, CacheStrategy::kNetworkOnly,
                        CacheStrategy::kStaleWhileRevalidate}) {
    if (text == ToString(strategy)) return strategy;
  }
  return std::nullopt;
}

std::vector<std::string> UnifiedCacheOptions::DefaultUrlPatterns() {
  return {
      "/stellarium-data/",   "/stellarium-js/",        "alasky.cds.unistra.fr", "alaskybis.cds.unistra.fr",
      "celestrak.org",       "celestrak.com",          "ssd.jpl.nasa.gov",      "minorplanetcenter.net",
  };
}

UnifiedCacheOptions UnifiedCacheOptions::FromConfig(const skycache::runtime::config::UnifiedConfig& cfg) {
  UnifiedCacheOptions options;
  if (cfg.default_ttl_ms() > 0) options.default_ttl_ms = static_cast<std::int64_t>(cfg.default_ttl_ms());
  if (cfg.url_patterns_size() > 0) options.url_patterns.assign(cfg.url_patterns().begin(), cfg.url_patterns().end());
  if (cfg.prefetch_concurrency() > 0) options.prefetch_concurrency = cfg.prefetch_concurrency();
  return options;
}

UnifiedCache::UnifiedCache(storage::CacheStorePtr cache, net::FetcherPtr fetcher, storage::PartitionNaming naming, UnifiedCacheOptions options)
    : cache_(std::move(cache)), fetcher_(std::move(fetcher)), options_(std::move(options)), partition_(naming.UnifiedPartition(options_.name)) {
  if (!cache_ || !fetcher_) {
    throw std::invalid_argument("UnifiedCache requires cache store and fetcher");
  }
  if (options_.prefetch_concurrency == 0) {
    throw std::invalid_argument("prefetch_concurrency must be positive");
  }
}

UnifiedCache::~UnifiedCache() {
  WaitForBackgroundRefresh();
}

bool UnifiedCache::ShouldCache(const std::string& url) const {
  if (options_.url_patterns.empty()) return true;

  return std::any_of(options_.url_patterns.begin(), options_.url_patterns.end(),
                     [&](const std::string& pattern) { return url.find(pattern) != std::string::npos; });
}

// ------------------------------------------------------------------
// Fetch
// ------------------------------------------------------------------

std::optional<UnifiedResponse> UnifiedCache::Lookup(const std::string& key) {
  auto blob = cache_->Match(partition_, key);
  if (!blob) return std::nullopt;

  UnifiedResponse response;
  response.ok           = true;
  response.from_cache   = true;
  response.body         = blob->data;
  response.content_type = blob->content_type;
  return response;
}

UnifiedResponse UnifiedCache::FetchAndStore(const std::string& url, const std::string& key, std::optional<std::int64_t> ttl_ms) {
  std::promise<UnifiedResponse> promise;
  {
    std::unique_lock<std::mutex> lock(pending_mutex_);
    auto                         it = pending_.find(key);
    if (it != pending_.end()) {
      auto shared = it->second;
      lock.unlock();
      return shared.get();
    }
    pending_.emplace(key, promise.get_future().share());
  }

  UnifiedResponse response;
  try {
    response = FetchFromNetwork(url, key, ttl_ms);
  } catch (const std::exception&) {
    promise.set_exception(std::current_exception());
    std::lock_guard<std::mutex> lock(pending_mutex_);
    pending_.erase(key);
    throw;
  }
  promise.set_value(response);

  std::lock_guard<std::mutex> lock(pending_mutex_);
  pending_.erase(key);
  return response;
}

UnifiedResponse UnifiedCache::FetchFromNetwork(const std::string& url, const std::string& key, std::optional<std::int64_t> ttl_ms) {
  net::FetchResult result;
  try {
    result = fetcher_->Fetch(url, util::CancellationToken{});
  } catch (const std::exception& e) {
    result.outcome = net::FetchOutcome::kNetworkError;
    result.error   = e.what();
  }

  UnifiedResponse response;
  response.ok           = result.ok();
  response.http_status  = result.http_status;
  response.body         = result.body;
  response.content_type = result.content_type;
  response.error        = result.error;

  if (result.ok() && ShouldCache(url)) {
    if (!cache_->Put(partition_, key, result.body, result.content_type, ttl_ms.value_or(options_.default_ttl_ms))) {
      SKYCACHE_LOG_DEBUG("response not cached", {StringField("url", url)});
    }
  }
  return response;
}

UnifiedResponse UnifiedCache::Fetch(const std::string& url, CacheStrategy strategy, const FetchOptions& options) {
  const std::string key = options.cache_key.empty() ? url : options.cache_key;

  switch (strategy) {
    case CacheStrategy::kCacheOnly: {
      if (auto cached = Lookup(key)) return *cached;

      UnifiedResponse miss;
      miss.error = "cache miss for " + key;
      return miss;
    }

    case CacheStrategy::kNetworkOnly: {
      UnifiedResponse response;
      try {
        auto result           = fetcher_->Fetch(url, util::CancellationToken{});
        response.ok           = result.ok();
        response.http_status  = result.http_status;
        response.body         = result.body;
        response.content_type = result.content_type;
        response.error        = result.error;
      } catch (const std::exception& e) {
        response.error = e.what();
      }
      return response;
    }

    case CacheStrategy::kNetworkFirst: {
      auto response = FetchAndStore(url, key, options.ttl_ms);
      if (response.ok || response.http_status != 0) return response;

      // no answer from the network at all
      if (auto cached = Lookup(key)) return *cached;
      return response;
    }

    case CacheStrategy::kStaleWhileRevalidate: {
      if (auto cached = Lookup(key)) {
        RefreshInBackground(url, key, options.ttl_ms);
        return *cached;
      }
      return FetchAndStore(url, key, options.ttl_ms);
    }

    case CacheStrategy::kCacheFirst:
      break;
  }

  if (!options.force_network) {
    if (auto cached = Lookup(key)) return *cached;
  }
  return FetchAndStore(url, key, options.ttl_ms);
}

void UnifiedCache::RefreshInBackground(const std::string& url, const std::string& key, std::optional<std::int64_t> ttl_ms) {
  std::lock_guard<std::mutex> lock(background_mutex_);

  // drop refreshes that already finished
  background_.erase(std::remove_if(background_.begin(), background_.end(),
                                   [](std::future<void>& f) { return f.wait_for(std::chrono::seconds(0)) == std::future_status::ready; }),
                    background_.end());

  background_.push_back(std::async(std::launch::async, [this, url, key, ttl_ms]() {
    try {
      auto response = FetchAndStore(url, key, ttl_ms);
      if (!response.ok) {
        SKYCACHE_LOG_DEBUG("background refresh failed", {StringField("url", url), StringField("error", response.error)});
      }
    } catch (const std::exception& e) {
      SKYCACHE_LOG_WARN("background refresh failed", {StringField("url", url), StringField("error", e.what())});
    }
  }));
}

void UnifiedCache::WaitForBackgroundRefresh() {
  std::vector<std::future<void>> running;
  {
    std::lock_guard<std::mutex> lock(background_mutex_);
    running.swap(background_);
  }
  for (auto& f : running) {
    f.get();
  }
}

// ------------------------------------------------------------------
// Prefetch
// ------------------------------------------------------------------

bool UnifiedCache::Prefetch(const std::string& url, std::optional<std::int64_t> ttl_ms) {
  auto response = FetchAndStore(url, url, ttl_ms);
  if (!response.ok) {
    SKYCACHE_LOG_WARN("prefetch failed", {StringField("url", url), StringField("error", response.error)});
  }
  return response.ok;
}

PrefetchSummary UnifiedCache::PrefetchAll(const std::vector<std::string>& urls, std::optional<std::int64_t> ttl_ms) {
  PrefetchSummary summary;

  for (std::size_t start = 0; start < urls.size(); start += options_.prefetch_concurrency) {
    const std::size_t end = std::min(start + options_.prefetch_concurrency, urls.size());

    std::vector<std::future<bool>> batch;
    batch.reserve(end - start);
    for (std::size_t i = start; i < end; ++i) {
      batch.push_back(std::async(std::launch::async, [this, &urls, i, ttl_ms]() { return Prefetch(urls[i], ttl_ms); }));
    }

    for (std::size_t i = start; i < end; ++i) {
      bool ok = batch[i - start].get();
      summary.results[urls[i]] = ok;
      if (ok) {
        ++summary.succeeded;
      } else {
        ++summary.failed;
      }
    }
  }
  return summary;
}

// ------------------------------------------------------------------
// Maintenance
// ------------------------------------------------------------------

bool UnifiedCache::Delete(const std::string& url) {
  return cache_->Delete(partition_, url);
}

bool UnifiedCache::Clear() {
  return cache_->DeletePartition(partition_);
}

std::vector<std::string> UnifiedCache::Keys() {
  return cache_->ListKeys(partition_);
}

std::size_t UnifiedCache::CleanupExpired() {
  return cache_->PurgeExpired(partition_);
}

} // namespace skycache::unified
