#pragma once

#include <arrow/buffer.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace skycache::storage {

/*
  One stored response body plus the little metadata the cache needs
  to serve it back.

  `data` may carry the in-band compression marker; the blob store never
  looks inside it.
*/
struct StoredBlob {
  std::shared_ptr<arrow::Buffer> data;
  std::string                    content_type;
  std::int64_t                   stored_at_ms = 0;
  // 0 means "never expires"
  std::int64_t ttl_ms = 0;
};

struct PartitionUsage {
  std::uint64_t entries = 0;
  std::uint64_t bytes   = 0;
};

/*
  Host storage estimate. quota_bytes == 0 means the backend cannot tell.
*/
struct StorageEstimate {
  std::uint64_t used_bytes  = 0;
  std::uint64_t quota_bytes = 0;
};

/*
  Partitioned key -> blob store.

  Partitions are named `{prefix}{id}-v{schema}` by the callers; the store
  treats names as opaque. Keys are full resource URLs.

  Implementations:
    RAM      → in-memory Arrow buffers
    SQLITE   → one database file, blobs table

  Implementations are thread-safe. Failures are reported by throwing;
  CacheStore turns those into degraded results.
*/

class BlobStore {
 public:
  virtual ~BlobStore() = default;

  // ------------------------------------------------------------------
  // Partitions
  // ------------------------------------------------------------------
  /*
    Create the partition if it does not exist yet. Idempotent.
  */
  virtual void OpenPartition(const std::string& partition) = 0;

  /*
    All partition names, sorted.
  */
  virtual std::vector<std::string> Partitions() = 0;

  /*
    Delete a partition and every blob in it.

    Returns false if the partition did not exist.
  */
  virtual bool DropPartition(const std::string& partition) = 0;

  // ------------------------------------------------------------------
  // Blobs
  // ------------------------------------------------------------------
  /*
    Insert or replace. Opens the partition implicitly.
  */
  virtual void Put(const std::string& partition, const std::string& key, const StoredBlob& blob) = 0;

  virtual std::optional<StoredBlob> Get(const std::string& partition, const std::string& key) = 0;

  virtual bool Contains(const std::string& partition, const std::string& key) = 0;

  virtual bool Remove(const std::string& partition, const std::string& key) = 0;

  /*
    Keys of a partition, sorted. Unknown partition yields an empty list.
  */
  virtual std::vector<std::string> Keys(const std::string& partition) = 0;

  // ------------------------------------------------------------------
  // Accounting
  // ------------------------------------------------------------------
  virtual PartitionUsage Usage(const std::string& partition) = 0;

  virtual StorageEstimate EstimateStorage() = 0;

  virtual std::string Name() const = 0;
};

using BlobStorePtr = std::shared_ptr<BlobStore>;

} // namespace skycache::storage
