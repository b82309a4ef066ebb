#pragma once

#include <map>
#include <shared_mutex>

#include "metadata_store.hpp"

namespace skycache::metadata {

/*
  In-memory metadata slot.

  Thread-safe via shared_mutex (many readers, single writer).
*/
class MemoryMetadataStore final : public MetadataStore {
 public:
  std::optional<std::string> Get(const std::string& key) override;
  void                       Put(const std::string& key, const std::string& value) override;
  bool                       Remove(const std::string& key) override;
  std::vector<std::string>   Keys(const std::string& prefix = "") override;

 private:
  mutable std::shared_mutex          mutex_;
  std::map<std::string, std::string> values_;
};

} // namespace skycache::metadata
