#pragma once

#include <memory>

#include "blob_store.hpp"
#include "config/config.pb.h"
#include "internal/metadata/metadata_store.hpp"

namespace skycache::storage {

/*
  Backends selected by `storage` config.

  Both pointers are null when storage is disabled or the database cannot
  be opened; callers treat that as "blob store unavailable".
*/
struct StorageBackends {
  BlobStorePtr               blobs;
  metadata::MetadataStorePtr   metadata;
};

/*
  Builds the blob store and metadata slot from configuration.

      auto backends = StorageFactory::Build(config.storage());
      CacheStore cache(backends.blobs, codec);
*/
class StorageFactory {
 public:
  static StorageBackends Build(const skycache::runtime::config::StorageConfig& cfg);
};

} // namespace skycache::storage
