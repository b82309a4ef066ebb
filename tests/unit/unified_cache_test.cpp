#include "internal/unified/unified_cache.hpp"

#include <cassert>
#include <chrono>
#include <future>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/ram/ram_blob_store.hpp"
#include "tests/unit/support/scripted_fetcher.hpp"

namespace {

using skycache::storage::CacheStore;
using skycache::storage::RamBlobStore;
using skycache::storage::common::ToString;
using skycache::testing::ScriptedFetcher;
using skycache::unified::CacheStrategy;
using skycache::unified::FetchOptions;
using skycache::unified::ParseCacheStrategy;
using skycache::unified::UnifiedCache;
using skycache::unified::UnifiedCacheOptions;

const std::string kTle   = "https://celestrak.org/NORAD/elements/gp.php?GROUP=stations";
const std::string kOther = "https://example.com/weather.json";

struct Fixture {
  std::shared_ptr<RamBlobStore>    blobs   = std::make_shared<RamBlobStore>();
  std::shared_ptr<CacheStore>      cache   = std::make_shared<CacheStore>(blobs, nullptr);
  std::shared_ptr<ScriptedFetcher> fetcher = std::make_shared<ScriptedFetcher>();
  std::shared_ptr<UnifiedCache>    unified;

  explicit Fixture(UnifiedCacheOptions options = {}) {
    unified = std::make_shared<UnifiedCache>(cache, fetcher, skycache::storage::PartitionNaming{}, options);
    fetcher->Serve(kTle, "ISS (ZARYA)", "text/plain");
    fetcher->Serve(kOther, R"({"clouds":0})", "application/json");
  }
};

void TestStrategyNames() {
  assert(ParseCacheStrategy("network-first") == CacheStrategy::kNetworkFirst);
  assert(ParseCacheStrategy("cache-only") == CacheStrategy::kCacheOnly);
  assert(ParseCacheStrategy("stale-while-revalidate") == CacheStrategy::kStaleWhileRevalidate);
  assert(!ParseCacheStrategy("fastest").has_value());
  assert(std::string(skycache::unified::ToString(CacheStrategy::kNetworkOnly)) == "network-only");
}

void TestUrlPatterns() {
  Fixture f;
  assert(f.unified->Partition() == "skymap-unified-cache-v1");
  assert(f.unified->ShouldCache(kTle));
  assert(f.unified->ShouldCache("https://stellarium-web.org/stellarium-data/stars/info.json"));
  assert(!f.unified->ShouldCache(kOther));

  UnifiedCacheOptions everything;
  everything.url_patterns.clear();
  Fixture g(everything);
  assert(g.unified->ShouldCache(kOther));
}

void TestCacheFirst() {
  Fixture f;

  auto first = f.unified->Fetch(kTle);
  assert(first.ok);
  assert(!first.from_cache);
  assert(first.http_status == 200);

  auto second = f.unified->Fetch(kTle);
  assert(second.ok);
  assert(second.from_cache);
  assert(ToString(second.body) == "ISS (ZARYA)");
  assert(second.content_type == "text/plain");
  assert(f.fetcher->RequestCount(kTle) == 1);

  FetchOptions force;
  force.force_network = true;
  assert(!f.unified->Fetch(kTle, CacheStrategy::kCacheFirst, force).from_cache);
  assert(f.fetcher->RequestCount(kTle) == 2);

  // URLs outside the patterns always go to the network
  assert(f.unified->Fetch(kOther).ok);
  assert(!f.unified->Fetch(kOther).from_cache);
  assert(f.fetcher->RequestCount(kOther) == 2);
  assert(f.unified->Keys() == std::vector<std::string>{kTle});
}

void TestNetworkFirst() {
  Fixture f;

  assert(!f.unified->Fetch(kTle, CacheStrategy::kNetworkFirst).from_cache);
  f.fetcher->Serve(kTle, "ISS (ZARYA) updated", "text/plain");
  auto fresh = f.unified->Fetch(kTle, CacheStrategy::kNetworkFirst);
  assert(!fresh.from_cache);
  assert(ToString(f.unified->Fetch(kTle, CacheStrategy::kCacheOnly).body) == "ISS (ZARYA) updated");

  f.fetcher->SetOffline(true);
  auto fallback = f.unified->Fetch(kTle, CacheStrategy::kNetworkFirst);
  assert(fallback.ok);
  assert(fallback.from_cache);

  // an HTTP error is an answer; no fallback
  f.fetcher->SetOffline(false);
  const std::string gone = "https://celestrak.org/missing.txt";
  auto              not_found = f.unified->Fetch(gone, CacheStrategy::kNetworkFirst);
  assert(!not_found.ok);
  assert(not_found.http_status == 404);
}

void TestCacheOnlyAndNetworkOnly() {
  Fixture f;

  auto miss = f.unified->Fetch(kTle, CacheStrategy::kCacheOnly);
  assert(!miss.ok);
  assert(!miss.error.empty());
  assert(f.fetcher->Requests().empty());

  auto direct = f.unified->Fetch(kTle, CacheStrategy::kNetworkOnly);
  assert(direct.ok);
  assert(f.unified->Keys().empty());
}

void TestCustomCacheKey() {
  Fixture f;

  FetchOptions options;
  options.cache_key = "tle:stations";
  assert(f.unified->Fetch(kTle, CacheStrategy::kCacheFirst, options).ok);
  assert(f.unified->Keys() == std::vector<std::string>{"tle:stations"});
  assert(f.unified->Fetch(kTle, CacheStrategy::kCacheFirst, options).from_cache);
  assert(!f.unified->Fetch(kTle, CacheStrategy::kCacheOnly).ok);
}

void TestTtl() {
  Fixture f;

  FetchOptions short_lived;
  short_lived.ttl_ms = 1;
  assert(f.unified->Fetch(kTle, CacheStrategy::kCacheFirst, short_lived).ok);

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  assert(!f.unified->Fetch(kTle, CacheStrategy::kCacheOnly).ok);

  assert(f.unified->Prefetch(kTle, 1));
  assert(!f.unified->Prefetch("https://celestrak.org/other.txt"));
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  assert(f.unified->CleanupExpired() == 1);
  assert(f.unified->Keys().empty());

  // default TTL keeps entries
  assert(f.unified->Prefetch(kTle));
  assert(f.unified->CleanupExpired() == 0);
}

void TestPrefetchAll() {
  UnifiedCacheOptions options;
  options.prefetch_concurrency = 2;
  Fixture f(options);

  std::vector<std::string> urls;
  for (int i = 0; i < 4; ++i) {
    urls.push_back("https://celestrak.org/set" + std::to_string(i) + ".txt");
    f.fetcher->Serve(urls.back(), "set" + std::to_string(i), "text/plain");
  }
  urls.push_back("https://celestrak.org/missing.txt");

  auto summary = f.unified->PrefetchAll(urls);
  assert(summary.succeeded == 4);
  assert(summary.failed == 1);
  assert(summary.results.size() == 5);
  assert(!summary.results["https://celestrak.org/missing.txt"]);
  assert(f.unified->Keys().size() == 4);
}

void TestDeleteAndClear() {
  Fixture f;
  assert(f.unified->Prefetch(kTle));
  assert(f.unified->Delete(kTle));
  assert(!f.unified->Delete(kTle));

  assert(f.unified->Prefetch(kTle));
  assert(f.unified->Clear());
  assert(f.unified->Keys().empty());
  assert(f.cache->ListPartitions("skymap-unified-").empty());
}

void TestStaleWhileRevalidate() {
  Fixture f;

  // nothing cached: waits for the network
  auto first = f.unified->Fetch(kTle, CacheStrategy::kStaleWhileRevalidate);
  assert(first.ok);
  assert(!first.from_cache);
  assert(f.fetcher->RequestCount(kTle) == 1);

  f.fetcher->Serve(kTle, "ISS (ZARYA) updated", "text/plain");
  auto stale = f.unified->Fetch(kTle, CacheStrategy::kStaleWhileRevalidate);
  assert(stale.ok);
  assert(stale.from_cache);
  assert(ToString(stale.body) == "ISS (ZARYA)");

  f.unified->WaitForBackgroundRefresh();
  assert(f.fetcher->RequestCount(kTle) == 2);
  assert(ToString(f.unified->Fetch(kTle, CacheStrategy::kCacheOnly).body) == "ISS (ZARYA) updated");

  // a failed refresh keeps the cached entry
  f.fetcher->SetOffline(true);
  assert(f.unified->Fetch(kTle, CacheStrategy::kStaleWhileRevalidate).from_cache);
  f.unified->WaitForBackgroundRefresh();
  assert(ToString(f.unified->Fetch(kTle, CacheStrategy::kCacheOnly).body) == "ISS (ZARYA) updated");
}

void TestConcurrentFetchesShareOneRequest() {
  Fixture f;

  std::promise<void>       release;
  std::shared_future<void> gate = release.get_future().share();
  f.fetcher->SetOnFetch([gate](const std::string&) { gate.wait(); });

  FetchOptions force;
  force.force_network = true;

  std::vector<std::future<skycache::unified::UnifiedResponse>> callers;
  callers.push_back(std::async(std::launch::async, [&]() { return f.unified->Fetch(kTle, CacheStrategy::kCacheFirst, force); }));
  while (f.fetcher->RequestCount(kTle) == 0) {
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  for (int i = 0; i < 3; ++i) {
    callers.push_back(std::async(std::launch::async, [&]() { return f.unified->Fetch(kTle, CacheStrategy::kNetworkFirst); }));
  }

  // let the followers reach the in-flight request
  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  release.set_value();

  for (auto& caller : callers) {
    auto response = caller.get();
    assert(response.ok);
    assert(!response.from_cache);
    assert(ToString(response.body) == "ISS (ZARYA)");
  }
  assert(f.fetcher->RequestCount(kTle) == 1);

  // the in-flight entry is gone once settled
  assert(!f.unified->Fetch(kTle, CacheStrategy::kNetworkFirst).from_cache);
  assert(f.fetcher->RequestCount(kTle) == 2);
}

} // namespace

int main() {
  TestStrategyNames();
  TestUrlPatterns();
  TestCacheFirst();
  TestNetworkFirst();
  TestCacheOnlyAndNetworkOnly();
  TestCustomCacheKey();
  TestTtl();
  TestPrefetchAll();
  TestDeleteAndClear();
  TestStaleWhileRevalidate();
  TestConcurrentFetchesShareOneRequest();

  std::cout << "skycache_unit_unified_cache: pass\n";
  return 0;
}
