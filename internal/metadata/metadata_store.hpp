#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace skycache::metadata {

/*
  Small persistent key -> string slot.

  Holds the cache schema version and a handful of bookkeeping values.
  Not meant for bulk data; that goes to the BlobStore.
*/
class MetadataStore {
 public:
  virtual ~MetadataStore() = default;

  virtual std::optional<std::string> Get(const std::string& key) = 0;

  virtual void Put(const std::string& key, const std::string& value) = 0;

  // true if the key existed
  virtual bool Remove(const std::string& key) = 0;

  // all keys starting with prefix, sorted
  virtual std::vector<std::string> Keys(const std::string& prefix = "") = 0;
};

using MetadataStorePtr = std::shared_ptr<MetadataStore>;

} // namespace skycache::metadata
