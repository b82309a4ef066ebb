#include "internal/stats/storage_usage_reporter.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/ram/ram_blob_store.hpp"

namespace {

using skycache::stats::FormatBytes;
using skycache::stats::FormatCacheStats;
using skycache::stats::FormatHitRate;
using skycache::stats::HitRate;
using skycache::stats::PartitionPrefixStatsSource;
using skycache::stats::StorageUsageReporter;
using skycache::storage::CacheStore;
using skycache::storage::RamBlobStore;
using skycache::storage::common::CopyToBuffer;

void TestFormatting() {
  assert(FormatBytes(0) == "0 B");
  assert(FormatBytes(512) == "512 B");
  assert(FormatBytes(1536) == "1.50 KB");
  assert(FormatBytes(2 * 1024 * 1024) == "2.00 MB");

  assert(!HitRate(0, 0).has_value());
  assert(*HitRate(3, 1) == 0.75);
  assert(FormatHitRate(std::nullopt) == "n/a");
  assert(FormatHitRate(HitRate(0, 0)) == "n/a");
  assert(FormatHitRate(HitRate(1, 2)) == "33.3%");
  assert(FormatHitRate(HitRate(0, 4)) == "0.0%");
}

void TestAggregation() {
  auto cache = std::make_shared<CacheStore>(std::make_shared<RamBlobStore>(1 << 20), nullptr);
  cache->Put("skymap-offline-stars-v1", "a", CopyToBuffer("1234"), "image/png");
  cache->Put("skymap-offline-dso-v1", "b", CopyToBuffer("56"), "image/png");
  cache->Put("skymap-hips-x-v1", "t", CopyToBuffer("tile"), "image/png");
  cache->Put("foreign", "f", CopyToBuffer("ignored"), "image/png");

  (void)cache->Match("skymap-offline-stars-v1", "a");
  (void)cache->Match("skymap-offline-stars-v1", "missing");
  (void)cache->Match("skymap-offline-dso-v1", "b");

  StorageUsageReporter reporter(cache);
  reporter.AddSource(std::make_shared<PartitionPrefixStatsSource>("layers", "skymap-offline-", cache));
  reporter.AddSource(std::make_shared<PartitionPrefixStatsSource>("hips", "skymap-hips-", cache));
  reporter.AddSource(std::make_shared<PartitionPrefixStatsSource>("unified", "skymap-unified-", cache));

  auto stats = reporter.CollectCacheStats();
  assert(stats.subsystems.size() == 3);

  const auto& layers = stats.subsystems[0];
  assert(layers.partitions.size() == 2);
  assert(layers.entries == 2);
  assert(layers.bytes == 6);
  assert(layers.hits == 2);
  assert(layers.misses == 1);

  const auto& hips = stats.subsystems[1];
  assert(hips.entries == 1);
  assert(!hips.hit_rate.has_value());

  assert(stats.subsystems[2].partitions.empty());

  assert(stats.total_entries == 3);
  assert(stats.total_bytes == 10);
  assert(stats.storage.has_value());
  assert(stats.storage->quota_bytes == (1u << 20));
  assert(stats.storage->used_bytes == 17);

  auto text = FormatCacheStats(stats);
  assert(text.find("hips: 4 B in 1 entries, hit rate n/a") != std::string::npos);
  assert(text.find("of 1.00 MB") != std::string::npos);

  // reading stats does not count as lookups
  assert(reporter.CollectCacheStats().total_hits == 2);
}

void TestUnavailableStorage() {
  auto                 cache = std::make_shared<CacheStore>(nullptr, nullptr);
  StorageUsageReporter reporter(cache);
  reporter.AddSource(std::make_shared<PartitionPrefixStatsSource>("layers", "skymap-offline-", cache));

  auto stats = reporter.CollectCacheStats();
  assert(stats.total_entries == 0);
  assert(!stats.hit_rate.has_value());
  assert(!stats.storage.has_value());
  assert(FormatCacheStats(stats).find("storage: unavailable") != std::string::npos);
}

void TestOverQuotaPercentIsNotTruncated() {
  skycache::stats::AggregatedCacheStats stats;
  stats.storage = skycache::storage::StorageEstimate{};
  stats.storage->used_bytes  = 5ULL * 1024 * 1024 * 1024 * 1024;
  stats.storage->quota_bytes = 1;

  auto text = FormatCacheStats(stats);
  assert(text.find("(549755813888000.0%)") != std::string::npos);

  stats.storage->used_bytes  = 3 * 1024;
  stats.storage->quota_bytes = 1024;
  assert(FormatCacheStats(stats).find("3.00 KB used of 1.00 KB (300.0%)") != std::string::npos);
}

} // namespace

int main() {
  TestFormatting();
  TestAggregation();
  TestUnavailableStorage();
  TestOverQuotaPercentIsNotTruncated();

  std::cout << "skycache_unit_storage_usage_reporter: pass\n";
  return 0;
}
