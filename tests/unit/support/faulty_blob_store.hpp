#pragma once

#include <atomic>
#include <string>

#include "internal/storage/ram/ram_blob_store.hpp"
#include "internal/util/errors.hpp"

namespace skycache::testing {

/*
  RAM blob store that can be told to fail.

    fail_all    every call throws StorageUnavailable
    fail_puts   only Put throws
    fail_drops  only DropPartition throws
*/
class FaultyBlobStore final : public storage::BlobStore {
 public:
  std::atomic<bool> fail_all{false};
  std::atomic<bool> fail_puts{false};
  std::atomic<bool> fail_drops{false};

  void OpenPartition(const std::string& partition) override {
    Check();
    inner_.OpenPartition(partition);
  }

  std::vector<std::string> Partitions() override {
    Check();
    return inner_.Partitions();
  }

  bool DropPartition(const std::string& partition) override {
    Check();
    if (fail_drops) throw util::StorageUnavailable("injected drop failure");
    return inner_.DropPartition(partition);
  }

  void Put(const std::string& partition, const std::string& key, const storage::StoredBlob& blob) override {
    Check();
    if (fail_puts) throw util::StorageUnavailable("injected put failure");
    inner_.Put(partition, key, blob);
  }

  std::optional<storage::StoredBlob> Get(const std::string& partition, const std::string& key) override {
    Check();
    return inner_.Get(partition, key);
  }

  bool Contains(const std::string& partition, const std::string& key) override {
    Check();
    return inner_.Contains(partition, key);
  }

  bool Remove(const std::string& partition, const std::string& key) override {
    Check();
    return inner_.Remove(partition, key);
  }

  std::vector<std::string> Keys(const std::string& partition) override {
    Check();
    return inner_.Keys(partition);
  }

  storage::PartitionUsage Usage(const std::string& partition) override {
    Check();
    return inner_.Usage(partition);
  }

  storage::StorageEstimate EstimateStorage() override {
    Check();
    return inner_.EstimateStorage();
  }

  std::string Name() const override {
    return "faulty";
  }

 private:
  void Check() const {
    if (fail_all) throw util::StorageUnavailable("injected failure");
  }

  storage::RamBlobStore inner_;
};

} // namespace skycache::testing
