#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/codec/compression_codec.hpp"
#include "internal/hips/hips_tile_manager.hpp"
#include "internal/hips/survey_catalog.hpp"
#include "internal/layers/layer_download_manager.hpp"
#include "internal/layers/layer_registry.hpp"
#include "internal/migration/cache_migrator.hpp"
#include "internal/net/fetcher.hpp"
#include "internal/stats/storage_usage_reporter.hpp"
#include "internal/storage/cache_store.hpp"
#include "internal/storage/partition_naming.hpp"
#include "internal/storage/storage_factory.hpp"
#include "internal/unified/unified_cache.hpp"

namespace skycache::factory {

/*
  CacheSystem

  Owns every long-lived component. Built once per process.
*/
struct CacheSystem {
  skycache::runtime::config::RuntimeConfig config;

  storage::PartitionNaming                       naming;
  storage::StorageBackends                       backends;
  std::shared_ptr<const codec::CompressionCodec> codec;
  storage::CacheStorePtr                         cache;
  net::FetcherPtr                                fetcher;

  std::shared_ptr<migration::CacheMigrator>     migrator;
  std::shared_ptr<const layers::LayerRegistry>  layer_registry;
  std::shared_ptr<layers::LayerDownloadManager> layer_manager;
  std::shared_ptr<const hips::SurveyCatalog>    surveys;
  std::shared_ptr<hips::HiPSTileManager>        hips_manager;
  std::shared_ptr<unified::UnifiedCache>        unified_cache;
  std::shared_ptr<stats::StorageUsageReporter>  reporter;

  migration::MigrationState migration_state = migration::MigrationState::kUnknown;
};

/*
  Composition root.

  Storage comes up first, then the migrator brings stored data to the
  current schema, then the managers are created on top of it. A null
  `fetcher` selects CurlFetcher configured from `network`.
*/
CacheSystem Build(const skycache::runtime::config::RuntimeConfig& config, net::FetcherPtr fetcher = nullptr);

} // namespace skycache::factory
