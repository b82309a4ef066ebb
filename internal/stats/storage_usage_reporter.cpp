#include "storage_usage_reporter.hpp"

#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace skycache::stats {

namespace {

std::string FormatPercent(double percent) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(1) << percent << "%";
  return out.str();
}

} // namespace

std::optional<double> HitRate(std::uint64_t hits, std::uint64_t misses) {
  if (hits + misses == 0) return std::nullopt;
  return static_cast<double>(hits) / static_cast<double>(hits + misses);
}

std::string FormatBytes(std::uint64_t bytes) {
  static const char* kUnits[] = {"B", "KB", "MB", "GB", "TB"};

  if (bytes < 1024) {
    return std::to_string(bytes) + " B";
  }

  double value = static_cast<double>(bytes);
  int    unit  = 0;
  while (value >= 1024.0 && unit < 4) {
    value /= 1024.0;
    ++unit;
  }

  std::ostringstream out;
  out << std::fixed << std::setprecision(2) << value << " " << kUnits[unit];
  return out.str();
}

std::string FormatHitRate(const std::optional<double>& rate) {
  if (!rate) return "n/a";

  return FormatPercent(*rate * 100.0);
}

// ------------------------------------------------------------------
// Sources
// ------------------------------------------------------------------

PartitionPrefixStatsSource::PartitionPrefixStatsSource(std::string name, std::string prefix, storage::CacheStorePtr cache)
    : name_(std::move(name)), prefix_(std::move(prefix)), cache_(std::move(cache)) {
}

std::vector<PartitionStats> PartitionPrefixStatsSource::Collect() {
  std::vector<PartitionStats> partitions;

  for (const auto& partition : cache_->ListPartitions(prefix_)) {
    auto usage    = cache_->Usage(partition);
    auto counters = cache_->Counters(partition);

    PartitionStats stats;
    stats.name    = partition;
    stats.entries = usage.entries;
    stats.bytes   = usage.bytes;
    stats.hits    = counters.hits;
    stats.misses  = counters.misses;
    partitions.push_back(std::move(stats));
  }
  return partitions;
}

// ------------------------------------------------------------------
// Reporter
// ------------------------------------------------------------------

StorageUsageReporter::StorageUsageReporter(storage::CacheStorePtr cache) : cache_(std::move(cache)) {
}

void StorageUsageReporter::AddSource(StatsSourcePtr source) {
  if (!source) {
    throw std::invalid_argument("stats source must not be null");
  }
  sources_.push_back(std::move(source));
}

AggregatedCacheStats StorageUsageReporter::CollectCacheStats() {
  AggregatedCacheStats aggregated;

  for (const auto& source : sources_) {
    SubsystemStats subsystem;
    subsystem.name       = source->Name();
    subsystem.partitions = source->Collect();

    for (const auto& partition : subsystem.partitions) {
      subsystem.entries += partition.entries;
      subsystem.bytes += partition.bytes;
      subsystem.hits += partition.hits;
      subsystem.misses += partition.misses;
    }
    subsystem.hit_rate = HitRate(subsystem.hits, subsystem.misses);

    aggregated.total_entries += subsystem.entries;
    aggregated.total_bytes += subsystem.bytes;
    aggregated.total_hits += subsystem.hits;
    aggregated.total_misses += subsystem.misses;
    aggregated.subsystems.push_back(std::move(subsystem));
  }

  aggregated.hit_rate = HitRate(aggregated.total_hits, aggregated.total_misses);
  if (cache_) {
    aggregated.storage = cache_->GetStorageInfo();
  }
  return aggregated;
}

std::string FormatCacheStats(const AggregatedCacheStats& stats) {
  std::ostringstream out;

  out << "total: " << FormatBytes(stats.total_bytes) << " in " << stats.total_entries << " entries, hit rate "
      << FormatHitRate(stats.hit_rate) << "\n";

  for (const auto& subsystem : stats.subsystems) {
    out << "  " << subsystem.name << ": " << FormatBytes(subsystem.bytes) << " in " << subsystem.entries << " entries, hit rate "
        << FormatHitRate(subsystem.hit_rate) << "\n";
    for (const auto& partition : subsystem.partitions) {
      out << "    " << partition.name << ": " << FormatBytes(partition.bytes) << ", " << partition.entries << " entries\n";
    }
  }

  if (stats.storage) {
    out << "storage: " << FormatBytes(stats.storage->used_bytes) << " used";
    if (stats.storage->quota_bytes > 0) {
      const double percent = 100.0 * static_cast<double>(stats.storage->used_bytes) / static_cast<double>(stats.storage->quota_bytes);
      out << " of " << FormatBytes(stats.storage->quota_bytes) << " (" << FormatPercent(percent) << ")";
    }
    out << "\n";
  } else {
    out << "storage: unavailable\n";
  }

  return out.str();
}

} // namespace skycache::stats
