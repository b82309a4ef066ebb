#include "memory_metadata_store.hpp"

#include <mutex>

namespace skycache::metadata {

std::optional<std::string> MemoryMetadataStore::Get(const std::string& key) {
  std::shared_lock lock(mutex_);

  auto it = values_.find(key);
  if (it == values_.end()) return std::nullopt;
  return it->second;
}

void MemoryMetadataStore::Put(const std::string& key, const std::string& value) {
  std::unique_lock lock(mutex_);
  values_[key] = value;
}

bool MemoryMetadataStore::Remove(const std::string& key) {
  std::unique_lock lock(mutex_);
  return values_.erase(key) > 0;
}

std::vector<std::string> MemoryMetadataStore::Keys(const std::string& prefix) {
  std::shared_lock lock(mutex_);

  std::vector<std::string> keys;
  for (auto it = values_.lower_bound(prefix); it != values_.end(); ++it) {
    if (it->first.compare(0, prefix.size(), prefix) != 0) break;
    keys.push_back(it->first);
  }
  return keys;
}

} // namespace skycache::metadata
