#pragma once

#include <memory>
#include <mutex>

#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/storage/blob_store.hpp"

namespace skycache::storage {

/*
  SQLite blob store.

  One database file holds every partition:

      partitions(name, created_at_ms)
      blobs(partition, key, data, content_type, stored_at_ms, ttl_ms)

  Blob bytes are copied into Arrow buffers on read.

  Statement sequences are serialized with mutex_; the connection itself
  is shared with SqliteMetadataStore.
*/

class SqliteBlobStore final : public BlobStore {
 public:
  explicit SqliteBlobStore(std::shared_ptr<db::sqlite::SqliteDB> db);
  ~SqliteBlobStore() override = default;

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
    return "sqlite";
  }

 private:
  void BootstrapSchema();
  void OpenPartitionLocked(const std::string& partition);

  std::shared_ptr<db::sqlite::SqliteDB> db_;
  std::mutex                            mutex_;
};

} // namespace skycache::storage
