#include "factory.hpp"

#include <memory>

#include "internal/net/curl_fetcher.hpp"
#include "internal/observability/logging.hpp"

namespace skycache::factory {

using observability::StringField;

/*
    Build full application dependency graph
*/
CacheSystem Build(const skycache::runtime::config::RuntimeConfig& config, net::FetcherPtr fetcher) {
  CacheSystem sys;
  sys.config = config;
  sys.naming = storage::PartitionNaming::FromConfig(config.naming());

  // ------------------------------------------------------------------
  // Storage backends
  // ------------------------------------------------------------------
  sys.backends = storage::StorageFactory::Build(config.storage());
  sys.codec    = std::make_shared<codec::CompressionCodec>(codec::CodecOptions::FromConfig(config.compression()));
  sys.cache    = std::make_shared<storage::CacheStore>(sys.backends.blobs, sys.codec);

  if (!fetcher) {
    fetcher = std::make_shared<net::CurlFetcher>(net::CurlFetcherOptions::FromConfig(config.network()));
  }
  sys.fetcher = std::move(fetcher);

  // ------------------------------------------------------------------
  // Schema
  // ------------------------------------------------------------------
  sys.migrator        = std::make_shared<migration::CacheMigrator>(sys.cache, sys.backends.metadata, sys.naming);
  sys.migration_state = sys.migrator->InitializeCacheSystem();

  // ------------------------------------------------------------------
  // Managers
  // ------------------------------------------------------------------
  sys.layer_registry = std::make_shared<layers::LayerRegistry>(layers::LayerRegistry::BuiltinLayers(), config.network().data_origin());
  sys.layer_manager  = std::make_shared<layers::LayerDownloadManager>(sys.layer_registry, sys.cache, sys.fetcher, sys.naming);

  sys.surveys      = std::make_shared<hips::SurveyCatalog>(hips::SurveyCatalog::FromConfig(config.hips()));
  sys.hips_manager = std::make_shared<hips::HiPSTileManager>(sys.cache, sys.fetcher, sys.naming, hips::HipsOptions::FromConfig(config.hips()));

  sys.unified_cache = std::make_shared<unified::UnifiedCache>(sys.cache, sys.fetcher, sys.naming, unified::UnifiedCacheOptions::FromConfig(config.unified()));

  // ------------------------------------------------------------------
  // Stats
  // ------------------------------------------------------------------
  sys.reporter = std::make_shared<stats::StorageUsageReporter>(sys.cache);
  sys.reporter->AddSource(std::make_shared<stats::PartitionPrefixStatsSource>("layers", sys.naming.layer_prefix, sys.cache));
  sys.reporter->AddSource(std::make_shared<stats::PartitionPrefixStatsSource>("hips", sys.naming.hips_prefix, sys.cache));
  sys.reporter->AddSource(std::make_shared<stats::PartitionPrefixStatsSource>("unified", sys.naming.unified_prefix, sys.cache));

  SKYCACHE_LOG_INFO("cache system ready",
                    {StringField("blob_store", sys.cache->IsAvailable() ? sys.backends.blobs->Name() : "unavailable"),
                     StringField("migration", migration::ToString(sys.migration_state))});
  return sys;
}

} // namespace skycache::factory
