#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/storage/cache_store.hpp"

namespace skycache::stats {

struct PartitionStats {
  std::string   name;
  std::uint64_t entries = 0;
  std::uint64_t bytes   = 0;
  std::uint64_t hits    = 0;
  std::uint64_t misses  = 0;
};

struct SubsystemStats {
  std::string                 name;
  std::uint64_t               entries = 0;
  std::uint64_t               bytes   = 0;
  std::uint64_t               hits    = 0;
  std::uint64_t               misses  = 0;
  std::optional<double>       hit_rate;
  std::vector<PartitionStats> partitions;
};

struct AggregatedCacheStats {
  std::uint64_t                           total_bytes   = 0;
  std::uint64_t                           total_entries = 0;
  std::uint64_t                           total_hits    = 0;
  std::uint64_t                           total_misses  = 0;
  std::optional<double>                   hit_rate;
  std::vector<SubsystemStats>             subsystems;
  std::optional<storage::StorageEstimate> storage;
};

/*
  Anything that can report cache partitions.
*/
class StatsSource {
 public:
  virtual ~StatsSource() = default;

  virtual std::string Name() const = 0;

  virtual std::vector<PartitionStats> Collect() = 0;
};

using StatsSourcePtr = std::shared_ptr<StatsSource>;

/*
  Blob-store partitions whose name starts with a prefix.
*/
class PartitionPrefixStatsSource final : public StatsSource {
 public:
  PartitionPrefixStatsSource(std::string name, std::string prefix, storage::CacheStorePtr cache);

  std::string Name() const override {
    return name_;
  }

  std::vector<PartitionStats> Collect() override;

 private:
  std::string            name_;
  std::string            prefix_;
  storage::CacheStorePtr cache_;
};

/*
  Read-only aggregation over registered sources.
*/
class StorageUsageReporter {
 public:
  explicit StorageUsageReporter(storage::CacheStorePtr cache);

  void AddSource(StatsSourcePtr source);

  AggregatedCacheStats CollectCacheStats();

 private:
  storage::CacheStorePtr      cache_;
  std::vector<StatsSourcePtr> sources_;
};

// hits / (hits + misses); absent when there were no lookups
std::optional<double> HitRate(std::uint64_t hits, std::uint64_t misses);

// "512 B", "1.50 KB", "2.00 MB"
std::string FormatBytes(std::uint64_t bytes);

// "n/a" for an absent rate, never "0.0%"
std::string FormatHitRate(const std::optional<double>& rate);

std::string FormatCacheStats(const AggregatedCacheStats& stats);

} // namespace skycache::stats
