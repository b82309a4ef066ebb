#include "cache_migrator.hpp"

#include <google/protobuf/util/json_util.h>

#include <exception>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

namespace skycache::migration {

using observability::BoolField;
using observability::IntField;
using observability::StringField;

const char* ToString(MigrationState state) {
  switch (state) {
    case MigrationState::kUnknown:
      return "unknown";
    case MigrationState::kNeedsMigration:
      return "needs_migration";
    case MigrationState::kUpToDate:
      return "up_to_date";
  }
  return "unknown";
}

// ------------------------------------------------------------------
// Built-in steps
// ------------------------------------------------------------------

MigrationStepResult RemoveUnversionedLegacyEntries(MigrationContext& ctx) {
  MigrationStepResult result;

  for (const auto& partition : ctx.cache.ListPartitions(ctx.naming.cache_prefix)) {
    if (storage::PartitionNaming::HasVersionSuffix(partition)) continue;

    if (!ctx.cache.DeletePartition(partition)) {
      throw std::runtime_error("failed to delete legacy partition " + partition);
    }
    ++result.deleted_items;
    SKYCACHE_LOG_INFO("deleted legacy partition", {StringField("partition", partition)});
  }

  for (const auto& key : ctx.metadata.Keys(ctx.naming.cache_prefix)) {
    if (storage::PartitionNaming::HasVersionSuffix(key)) continue;

    if (ctx.metadata.Remove(key)) {
      ++result.deleted_items;
    }
  }

  return result;
}

CacheMigrator::CacheMigrator(storage::CacheStorePtr cache, metadata::MetadataStorePtr metadata, storage::PartitionNaming naming,
                             int current_version)
    : cache_(std::move(cache)), metadata_(std::move(metadata)), naming_(std::move(naming)), current_version_(current_version) {
  if (current_version_ < 1) {
    throw std::invalid_argument("cache schema version must be positive");
  }
  RegisterBuiltinSteps();
}

void CacheMigrator::RegisterBuiltinSteps() {
  RegisterMigration(1, "remove unversioned legacy partitions", &RemoveUnversionedLegacyEntries);
}

void CacheMigrator::RegisterMigration(int version, std::string name, MigrationStep step) {
  if (version < 1 || version > current_version_) {
    throw std::invalid_argument("migration version " + std::to_string(version) + " outside [1, " + std::to_string(current_version_) + "]");
  }
  if (!step) {
    throw std::invalid_argument("migration step must be callable");
  }
  steps_[version].push_back(NamedStep{std::move(name), std::move(step)});
}

bool CacheMigrator::IsAvailable() const {
  return cache_ && cache_->IsAvailable() && metadata_;
}

// ------------------------------------------------------------------
// Version stamp
// ------------------------------------------------------------------

std::optional<skycache::cache::v1::CacheSchemaVersion> CacheMigrator::GetCacheVersion() {
  if (!metadata_) return std::nullopt;

  std::optional<std::string> json;
  try {
    json = metadata_->Get(kSchemaVersionKey);
  } catch (const std::exception& e) {
    SKYCACHE_LOG_ERROR("failed to read cache schema version", {StringField("error", e.what())});
    return std::nullopt;
  }
  if (!json) return std::nullopt;

  skycache::cache::v1::CacheSchemaVersion version;
  auto                                    status = google::protobuf::util::JsonStringToMessage(*json, &version);
  if (!status.ok()) {
    // unreadable stamp: treat as a fresh install
    SKYCACHE_LOG_WARN("ignoring unreadable cache schema version", {StringField("error", std::string(status.message()))});
    return std::nullopt;
  }
  return version;
}

void CacheMigrator::WriteVersionStamp(int from_version, std::size_t error_count) {
  skycache::cache::v1::CacheSchemaVersion version;
  version.set_version(current_version_);
  *version.mutable_migrated_at() = util::ToProto(util::Now());

  std::string description = "migrated from v" + std::to_string(from_version) + " to v" + std::to_string(current_version_);
  if (error_count > 0) {
    description += " with " + std::to_string(error_count) + " failed step(s)";
  }
  version.set_description(description);

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(version, &json);
  if (!status.ok()) {
    throw std::runtime_error("failed to serialize schema version: " + std::string(status.message()));
  }
  metadata_->Put(kSchemaVersionKey, json);
}

// ------------------------------------------------------------------
// Migration
// ------------------------------------------------------------------

bool CacheMigrator::IsMigrationNeeded() {
  if (!IsAvailable()) return false;

  auto stored = GetCacheVersion();
  return !stored || stored->version() < current_version_;
}

MigrationResult CacheMigrator::RunMigrations() {
  MigrationResult result;
  result.to_version = current_version_;

  if (!IsAvailable()) {
    result.success = false;
    result.errors.push_back("cache storage unavailable");
    return result;
  }

  auto stored         = GetCacheVersion();
  result.from_version = stored ? stored->version() : 0;

  if (result.from_version >= current_version_) {
    if (result.from_version > current_version_) {
      SKYCACHE_LOG_WARN("cache schema is newer than this build; leaving it untouched",
                        {IntField("stored", result.from_version), IntField("current", current_version_)});
    }
    result.to_version = result.from_version;
    state_            = MigrationState::kUpToDate;
    return result;
  }

  SKYCACHE_LOG_INFO("migrating cache schema", {IntField("from", result.from_version), IntField("to", current_version_)});

  MigrationContext ctx{*cache_, *metadata_, naming_};
  for (int version = result.from_version + 1; version <= current_version_; ++version) {
    auto it = steps_.find(version);
    if (it == steps_.end()) continue;

    for (const auto& named : it->second) {
      try {
        auto step = named.step(ctx);
        result.migrated_items += step.migrated_items;
        result.deleted_items += step.deleted_items;
      } catch (const std::exception& e) {
        result.errors.push_back("v" + std::to_string(version) + " " + named.name + ": " + e.what());
        SKYCACHE_LOG_ERROR("cache migration step failed", {IntField("version", version), StringField("step", named.name), StringField("error", e.what())});
      }
    }
  }

  try {
    WriteVersionStamp(result.from_version, result.errors.size());
  } catch (const std::exception& e) {
    result.errors.push_back(std::string("version stamp: ") + e.what());
    result.success = false;
    state_         = MigrationState::kNeedsMigration;
    SKYCACHE_LOG_ERROR("failed to record cache schema version", {StringField("error", e.what())});
    return result;
  }

  result.success = result.errors.empty();
  state_         = MigrationState::kUpToDate;

  SKYCACHE_LOG_INFO("cache schema migrated", {IntField("to", current_version_), IntField("migrated", static_cast<std::int64_t>(result.migrated_items)),
                                              IntField("deleted", static_cast<std::int64_t>(result.deleted_items)),
                                              IntField("errors", static_cast<std::int64_t>(result.errors.size()))});
  return result;
}

MigrationState CacheMigrator::InitializeCacheSystem() {
  if (!IsAvailable()) {
    SKYCACHE_LOG_WARN("cache storage unavailable; skipping schema migration");
    state_ = MigrationState::kUnknown;
    return state_;
  }

  if (!IsMigrationNeeded()) {
    state_ = MigrationState::kUpToDate;
    return state_;
  }

  state_ = MigrationState::kNeedsMigration;
  RunMigrations();
  return state_;
}

bool CacheMigrator::ResetAllCaches() {
  if (!IsAvailable()) return false;

  bool ok = true;
  for (const auto& partition : cache_->ListPartitions(naming_.cache_prefix)) {
    ok = cache_->DeletePartition(partition) && ok;
  }

  try {
    for (const auto& key : metadata_->Keys(naming_.cache_prefix)) {
      metadata_->Remove(key);
    }
    metadata_->Remove(kSchemaVersionKey);
  } catch (const std::exception& e) {
    SKYCACHE_LOG_ERROR("failed to clear cache metadata", {StringField("error", e.what())});
    ok = false;
  }

  cache_->ResetCounters();
  state_ = MigrationState::kNeedsMigration;

  SKYCACHE_LOG_WARN("all caches reset", {BoolField("ok", ok)});
  return ok;
}

} // namespace skycache::migration
