#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "blob_store.hpp"
#include "internal/codec/compression_codec.hpp"

namespace skycache::storage {

struct HitCounters {
  std::uint64_t hits   = 0;
  std::uint64_t misses = 0;
};

/*
  Engine-facing view of the blob store.

  - writes go through the compression codec
  - Match() decompresses and counts hits/misses per partition
  - every backend failure is caught, logged and turned into the
    "nothing cached" answer, so a broken store never stops a download
    or a status query

  A CacheStore built with a null BlobStore is permanently unavailable.
*/
class CacheStore {
 public:
  CacheStore(BlobStorePtr blobs, std::shared_ptr<const codec::CompressionCodec> codec);

  bool IsAvailable() const {
    return blobs_ != nullptr;
  }

  // ------------------------------------------------------------------
  // Entries
  // ------------------------------------------------------------------
  bool Put(const std::string& partition, const std::string& key, const std::shared_ptr<arrow::Buffer>& body, const std::string& content_type,
           std::int64_t ttl_ms = 0);

  /*
    Lookup returning decompressed bytes. Counts a hit or a miss.
    An entry past its TTL is deleted and reported as a miss.
  */
  std::optional<StoredBlob> Match(const std::string& partition, const std::string& key);

  /*
    Presence test used by status queries and the tile skip path.
    Does not touch hit/miss counters.
  */
  bool Contains(const std::string& partition, const std::string& key);

  bool Delete(const std::string& partition, const std::string& key);

  std::vector<std::string> ListKeys(const std::string& partition);

  /*
    Delete every expired entry of a partition; returns how many.
  */
  std::size_t PurgeExpired(const std::string& partition);

  static bool IsExpired(const StoredBlob& blob, std::int64_t now_ms);

  // ------------------------------------------------------------------
  // Partitions
  // ------------------------------------------------------------------
  bool OpenPartition(const std::string& partition);

  std::vector<std::string> ListPartitions(const std::string& prefix = "");

  bool DeletePartition(const std::string& partition);

  // ------------------------------------------------------------------
  // Accounting
  // ------------------------------------------------------------------
  PartitionUsage Usage(const std::string& partition);

  std::optional<StorageEstimate> GetStorageInfo();

  HitCounters Counters(const std::string& partition) const;

  void ResetCounters();

 private:
  void RecordLookup(const std::string& partition, bool hit);

  BlobStorePtr                                   blobs_;
  std::shared_ptr<const codec::CompressionCodec> codec_;

  mutable std::mutex                 counters_mutex_;
  std::map<std::string, HitCounters> counters_;
};

using CacheStorePtr = std::shared_ptr<CacheStore>;

} // namespace skycache::storage
