#include "ram_blob_store.hpp"

#include "internal/storage/common/arrow_utils.hpp"
#include "internal/util/errors.hpp"

namespace skycache::storage {

using common::BufferSize;

RamBlobStore::RamBlobStore(std::uint64_t capacity_bytes) : capacity_bytes_(capacity_bytes) {
}

void RamBlobStore::OpenPartition(const std::string& partition) {
  std::unique_lock lock(mutex_);
  partitions_[partition];
}

std::vector<std::string> RamBlobStore::Partitions() {
  std::shared_lock lock(mutex_);

  std::vector<std::string> names;
  names.reserve(partitions_.size());
  for (const auto& [name, _] : partitions_) {
    names.push_back(name);
  }
  return names;
}

bool RamBlobStore::DropPartition(const std::string& partition) {
  std::unique_lock lock(mutex_);

  auto it = partitions_.find(partition);
  if (it == partitions_.end()) return false;

  for (const auto& [_, blob] : it->second) {
    used_bytes_ -= static_cast<std::uint64_t>(BufferSize(blob.data));
  }
  partitions_.erase(it);
  return true;
}

/*
  Insert or replace. Capacity is checked against the net growth so that
  overwriting a key with a same-sized body always succeeds.
*/
void RamBlobStore::Put(const std::string& partition, const std::string& key, const StoredBlob& blob) {
  std::unique_lock lock(mutex_);

  auto&         entries  = partitions_[partition];
  auto          existing = entries.find(key);
  std::uint64_t replaced = existing == entries.end() ? 0 : static_cast<std::uint64_t>(BufferSize(existing->second.data));
  std::uint64_t incoming = static_cast<std::uint64_t>(BufferSize(blob.data));

  if (capacity_bytes_ > 0 && used_bytes_ - replaced + incoming > capacity_bytes_) {
    throw util::StorageUnavailable("ram blob store capacity exceeded");
  }

  used_bytes_ = used_bytes_ - replaced + incoming;
  entries[key] = blob;
}

std::optional<StoredBlob> RamBlobStore::Get(const std::string& partition, const std::string& key) {
  std::shared_lock lock(mutex_);

  auto p = partitions_.find(partition);
  if (p == partitions_.end()) return std::nullopt;

  auto it = p->second.find(key);
  if (it == p->second.end()) return std::nullopt;

  return it->second;
}

bool RamBlobStore::Contains(const std::string& partition, const std::string& key) {
  std::shared_lock lock(mutex_);

  auto p = partitions_.find(partition);
  return p != partitions_.end() && p->second.count(key) > 0;
}

bool RamBlobStore::Remove(const std::string& partition, const std::string& key) {
  std::unique_lock lock(mutex_);

  auto p = partitions_.find(partition);
  if (p == partitions_.end()) return false;

  auto it = p->second.find(key);
  if (it == p->second.end()) return false;

  used_bytes_ -= static_cast<std::uint64_t>(BufferSize(it->second.data));
  p->second.erase(it);
  return true;
}

std::vector<std::string> RamBlobStore::Keys(const std::string& partition) {
  std::shared_lock lock(mutex_);

  std::vector<std::string> keys;
  auto                     p = partitions_.find(partition);
  if (p == partitions_.end()) return keys;

  keys.reserve(p->second.size());
  for (const auto& [key, _] : p->second) {
    keys.push_back(key);
  }
  return keys;
}

PartitionUsage RamBlobStore::Usage(const std::string& partition) {
  std::shared_lock lock(mutex_);

  PartitionUsage usage;
  auto           p = partitions_.find(partition);
  if (p == partitions_.end()) return usage;

  usage.entries = p->second.size();
  for (const auto& [_, blob] : p->second) {
    usage.bytes += static_cast<std::uint64_t>(BufferSize(blob.data));
  }
  return usage;
}

StorageEstimate RamBlobStore::EstimateStorage() {
  std::shared_lock lock(mutex_);
  return StorageEstimate{used_bytes_, capacity_bytes_};
}

} // namespace skycache::storage
