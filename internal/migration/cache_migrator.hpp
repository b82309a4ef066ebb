#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/metadata/metadata_store.hpp"
#include "internal/storage/cache_store.hpp"
#include "internal/storage/partition_naming.hpp"
#include "skycache/cache/v1/schema.pb.h"

namespace skycache::migration {

enum class MigrationState {
  kUnknown,
  kNeedsMigration,
  kUpToDate,
};

const char* ToString(MigrationState state);

struct MigrationContext {
  storage::CacheStore&             cache;
  metadata::MetadataStore&         metadata;
  const storage::PartitionNaming& naming;
};

struct MigrationStepResult {
  std::uint64_t migrated_items = 0;
  std::uint64_t deleted_items  = 0;
};

/*
  One schema step. Must be safe to re-run after a partial failure.
  Failures are reported by throwing.
*/
using MigrationStep = std::function<MigrationStepResult(MigrationContext&)>;

struct MigrationResult {
  int                      from_version   = 0;
  int                      to_version     = 0;
  std::uint64_t            migrated_items = 0;
  std::uint64_t            deleted_items  = 0;
  std::vector<std::string> errors;
  bool                     success = true;
};

/*
  Brings the stored cache layout up to the compiled-in schema version.

  Runs once at startup, before any download manager exists. Steps are
  best effort: a failing step is recorded in MigrationResult::errors and
  the version stamp is still advanced, since every cached byte can be
  fetched again.

  The stamp is a CacheSchemaVersion message stored as JSON in the
  metadata slot under kSchemaVersionKey.
*/
class CacheMigrator {
 public:
  static constexpr const char* kSchemaVersionKey = "skycache.schema_version";

  CacheMigrator(storage::CacheStorePtr cache, metadata::MetadataStorePtr metadata, storage::PartitionNaming naming = {},
                int current_version = storage::kCacheSchemaVersion);

  /*
    Adds a step run when upgrading to `version`. Several steps for the
    same version run in registration order.
  */
  void RegisterMigration(int version, std::string name, MigrationStep step);

  std::optional<skycache::cache::v1::CacheSchemaVersion> GetCacheVersion();

  bool IsMigrationNeeded();

  MigrationResult RunMigrations();

  /*
    Migrate if needed. Returns the resulting state.
  */
  MigrationState InitializeCacheSystem();

  /*
    Destructive: drops every partition and metadata key under the cache
    prefix and forgets the schema version.
  */
  bool ResetAllCaches();

  MigrationState State() const {
    return state_;
  }

  int CurrentVersion() const {
    return current_version_;
  }

 private:
  struct NamedStep {
    std::string   name;
    MigrationStep step;
  };

  bool IsAvailable() const;
  void RegisterBuiltinSteps();
  void WriteVersionStamp(int from_version, std::size_t error_count);

  storage::CacheStorePtr     cache_;
  metadata::MetadataStorePtr metadata_;
  storage::PartitionNaming   naming_;
  int                        current_version_;
  MigrationState             state_ = MigrationState::kUnknown;

  std::map<int, std::vector<NamedStep>> steps_;
};

/*
  v1: delete partitions and metadata keys under the cache prefix that
  carry no -v<N> suffix (layouts from before versioned naming).
*/
MigrationStepResult RemoveUnversionedLegacyEntries(MigrationContext& ctx);

} // namespace skycache::migration
