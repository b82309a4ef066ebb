#pragma once

#include <map>
#include <memory>
#include <shared_mutex>

#include "internal/storage/blob_store.hpp"

namespace skycache::storage {

/*
  RAM blob store.

  Backed by Arrow buffers stored in-memory. Reads are zero-copy.
  Nothing survives the process; used for tests and `storage.memory`.

  capacity_bytes > 0 bounds the total stored bytes; a Put that would
  exceed it throws util::StorageUnavailable.

  Thread safety:
    - shared reads
    - exclusive writes
*/

class RamBlobStore final : public BlobStore {
 public:
  explicit RamBlobStore(std::uint64_t capacity_bytes = 0);
  ~RamBlobStore() override = default;

  void                     OpenPartition(const std::string& partition) override;
  std::vector<std::string> Partitions() override;
  bool                     DropPartition(const std::string& partition) override;

  void                      Put(const std::string& partition, const std::string& key, const StoredBlob& blob) override;
  std::optional<StoredBlob> Get(const std::string& partition, const std::string& key) override;
  bool                      Contains(const std::string& partition, const std::string& key) override;
  bool                      Remove(const std::string& partition, const std::string& key) override;
  std::vector<std::string>  Keys(const std::string& partition) override;

  PartitionUsage  Usage(const std::string& partition) override;
  StorageEstimate EstimateStorage() override;

  std::string Name() const override {
    return "ram";
  }

 private:
  using Partition = std::map<std::string, StoredBlob>;

  mutable std::shared_mutex        mutex_;
  std::map<std::string, Partition> partitions_;
  std::uint64_t                    capacity_bytes_ = 0;
  std::uint64_t                    used_bytes_     = 0;
};

} // namespace skycache::storage
