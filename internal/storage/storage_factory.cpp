#include "storage_factory.hpp"

#include <filesystem>
#include <stdexcept>
#include <system_error>

#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/metadata/memory_metadata_store.hpp"
#include "internal/metadata/sqlite_metadata_store.hpp"
#include "internal/observability/logging.hpp"
#include "ram/ram_blob_store.hpp"
#include "sqlite/sqlite_blob_store.hpp"

namespace skycache::storage {

namespace {

constexpr const char* kDefaultSqlitePath = "skycache.db";

void EnsureParentDirectory(const std::string& path) {
  std::filesystem::path parent = std::filesystem::path(path).parent_path();
  if (parent.empty()) return;

  std::error_code ec;
  std::filesystem::create_directories(parent, ec);
  if (ec) {
    throw std::runtime_error("Failed to create cache directory " + parent.string() + ": " + ec.message());
  }
}

} // namespace

StorageBackends StorageFactory::Build(const skycache::runtime::config::StorageConfig& cfg) {
  StorageBackends backends;

  if (cfg.disabled()) {
    SKYCACHE_LOG_WARN("storage disabled by configuration; running without a cache");
    return backends;
  }

  if (cfg.has_memory()) {
    backends.blobs    = std::make_shared<RamBlobStore>(cfg.memory().capacity_bytes());
    backends.metadata = std::make_shared<metadata::MemoryMetadataStore>();
    SKYCACHE_LOG_INFO("storage backend ready", {observability::StringField("backend", "ram"),
                                                observability::IntField("capacity_bytes", static_cast<std::int64_t>(cfg.memory().capacity_bytes()))});
    return backends;
  }

  std::string path = cfg.sqlite().path().empty() ? kDefaultSqlitePath : cfg.sqlite().path();

  // an unopenable database leaves both backends null; callers degrade
  try {
    if (path != ":memory:") {
      EnsureParentDirectory(path);
    }

    auto sqlite_db    = std::make_shared<db::sqlite::SqliteDB>(path);
    backends.blobs    = std::make_shared<SqliteBlobStore>(sqlite_db);
    backends.metadata = std::make_shared<metadata::SqliteMetadataStore>(sqlite_db);
  } catch (const std::exception& e) {
    SKYCACHE_LOG_ERROR("failed to open cache storage; running without a cache",
                       {observability::StringField("path", path), observability::StringField("error", e.what())});
    return StorageBackends{};
  }

  SKYCACHE_LOG_INFO("storage backend ready", {observability::StringField("backend", "sqlite"), observability::StringField("path", path)});
  return backends;
}

} // namespace skycache::storage
