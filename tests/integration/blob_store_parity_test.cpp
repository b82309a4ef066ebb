#include <algorithm>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "config/config.pb.h"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_tx.hpp"
#include "internal/factory.hpp"
#include "internal/metadata/memory_metadata_store.hpp"
#include "internal/metadata/sqlite_metadata_store.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/ram/ram_blob_store.hpp"
#include "internal/storage/sqlite/sqlite_blob_store.hpp"
#include "tests/unit/support/scripted_fetcher.hpp"

namespace {

using skycache::metadata::MemoryMetadataStore;
using skycache::metadata::MetadataStore;
using skycache::metadata::SqliteMetadataStore;
using skycache::storage::BlobStore;
using skycache::storage::RamBlobStore;
using skycache::storage::SqliteBlobStore;
using skycache::storage::StoredBlob;
using skycache::storage::common::CopyToBuffer;
using skycache::storage::common::ToString;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct Backends {
  std::shared_ptr<BlobStore>     blobs;
  std::shared_ptr<MetadataStore> metadata;
};

struct BackendFactory {
  std::string                     name;
  std::function<Backends()>       make_backends;
  std::function<bool()>           supports_restart;
  std::function<void(Backends&)>  restart;
  std::function<void()>           cleanup;
};

StoredBlob MakeBlob(const std::string& body, const std::string& content_type, std::int64_t ttl_ms = 0) {
  StoredBlob blob;
  blob.data         = CopyToBuffer(body);
  blob.content_type = content_type;
  blob.stored_at_ms = static_cast<std::int64_t>(NowMs());
  blob.ttl_ms       = ttl_ms;
  return blob;
}

void VerifyPutGetReplaceRemove(BlobStore& store, const std::string& partition) {
  store.Put(partition, "https://x/a", MakeBlob("alpha", "text/plain", 5000));

  auto got = store.Get(partition, "https://x/a");
  assert(got.has_value());
  assert(ToString(got->data) == "alpha");
  assert(got->content_type == "text/plain");
  assert(got->ttl_ms == 5000);
  assert(got->stored_at_ms > 0);

  store.Put(partition, "https://x/a", MakeBlob("alpha-2", "application/json"));
  got = store.Get(partition, "https://x/a");
  assert(ToString(got->data) == "alpha-2");
  assert(got->content_type == "application/json");
  assert(store.Keys(partition).size() == 1);

  assert(store.Contains(partition, "https://x/a"));
  assert(!store.Contains(partition, "https://x/missing"));
  assert(!store.Get(partition, "https://x/missing").has_value());

  assert(store.Remove(partition, "https://x/a"));
  assert(!store.Remove(partition, "https://x/a"));
  assert(store.Keys(partition).empty());
}

void VerifyBinaryBodies(BlobStore& store, const std::string& partition) {
  std::string binary("\0\x01\xff\x00tail", 8);
  store.Put(partition, "bin", MakeBlob(binary, "image/png"));
  store.Put(partition, "empty", MakeBlob("", "text/plain"));

  assert(ToString(store.Get(partition, "bin")->data) == binary);
  assert(store.Get(partition, "empty")->data->size() == 0);
}

void VerifyPartitions(BlobStore& store, const std::string& prefix) {
  const auto first  = prefix + "first-v1";
  const auto second = prefix + "second-v1";

  store.OpenPartition(first);
  store.OpenPartition(first);
  store.Put(second, "k1", MakeBlob("12345", "text/plain"));
  store.Put(second, "k2", MakeBlob("678", "text/plain"));

  auto names = store.Partitions();
  assert(std::find(names.begin(), names.end(), first) != names.end());
  assert(std::find(names.begin(), names.end(), second) != names.end());

  // empty partitions exist until dropped
  assert(store.Keys(first).empty());
  auto usage = store.Usage(second);
  assert(usage.entries == 2);
  assert(usage.bytes == 8);
  assert(store.Keys(second) == (std::vector<std::string>{"k1", "k2"}));

  assert(store.DropPartition(second));
  assert(!store.DropPartition(second));
  assert(store.Keys(second).empty());
  assert(store.Usage(second).entries == 0);
  assert(store.DropPartition(first));
}

void VerifyMetadata(MetadataStore& metadata) {
  assert(!metadata.Get("skymap-a").has_value());
  metadata.Put("skymap-a", "1");
  metadata.Put("skymap-b", "2");
  metadata.Put("other", "3");
  metadata.Put("skymap-a", "one");

  assert(metadata.Get("skymap-a") == std::string("one"));
  assert((metadata.Keys("skymap-") == std::vector<std::string>{"skymap-a", "skymap-b"}));
  assert(metadata.Keys().size() == 3);
  assert(metadata.Remove("skymap-b"));
  assert(!metadata.Remove("skymap-b"));
}

void VerifyConcurrentWriters(BlobStore& store, const std::string& partition) {
  constexpr int kThreads = 4;
  constexpr int kPerThread = 25;

  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&, t]() {
      for (int i = 0; i < kPerThread; ++i) {
        store.Put(partition, "t" + std::to_string(t) + "-" + std::to_string(i), MakeBlob("x", "text/plain"));
      }
    });
  }
  for (auto& thread : threads) thread.join();

  assert(store.Keys(partition).size() == kThreads * kPerThread);
  assert(store.DropPartition(partition));
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& partition) {
  if (!backend.supports_restart()) {
    std::cout << "  skip restart durability for " << backend.name << "\n";
    return;
  }

  auto backends = backend.make_backends();
  backends.blobs->Put(partition, "durable", MakeBlob("kept", "text/plain"));
  backends.metadata->Put("skycache.schema_version", R"({"version":1})");

  backend.restart(backends);

  auto got = backends.blobs->Get(partition, "durable");
  assert(got.has_value());
  assert(ToString(got->data) == "kept");
  assert(backends.metadata->Get("skycache.schema_version") == std::string(R"({"version":1})"));
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_backends    = []() { return Backends{std::make_shared<RamBlobStore>(), std::make_shared<MemoryMetadataStore>()}; },
      .supports_restart = []() { return false; },
      .restart          = [](Backends&) {},
      .cleanup          = []() {},
  };
}

BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("skycache_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_backends = [db_path]() {
    auto db = std::make_shared<skycache::db::sqlite::SqliteDB>(db_path);
    return Backends{std::make_shared<SqliteBlobStore>(db), std::make_shared<SqliteMetadataStore>(db)};
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_backends    = make_backends,
      .supports_restart = []() { return true; },
      .restart          = [make_backends](Backends& backends) { backends = make_backends(); },
      .cleanup =
          [db_path]() {
            std::filesystem::remove(db_path);
            std::filesystem::remove(db_path + "-wal");
            std::filesystem::remove(db_path + "-shm");
          },
  };
}

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto backends = backend.make_backends();

  VerifyPutGetReplaceRemove(*backends.blobs, "skymap-" + backend.name + "-life-v1");
  VerifyBinaryBodies(*backends.blobs, "skymap-" + backend.name + "-binary-v1");
  VerifyPartitions(*backends.blobs, "skymap-" + backend.name + "-");
  VerifyMetadata(*backends.metadata);
  VerifyConcurrentWriters(*backends.blobs, "skymap-" + backend.name + "-concurrent-v1");

  VerifyRestartDurability(backend, "skymap-" + backend.name + "-durable-v1");

  backend.cleanup();
}

void VerifySqliteTransactionRollsBack() {
  auto db_path = (std::filesystem::temp_directory_path() / ("skycache_integration_tx_" + std::to_string(NowMs()) + ".db")).string();
  {
    auto db = std::make_shared<skycache::db::sqlite::SqliteDB>(db_path);
    db->Exec("CREATE TABLE t (v INTEGER);");
    {
      skycache::db::sqlite::SqliteTransaction tx(db);
      db->Exec("INSERT INTO t VALUES (1);");
      // no commit
    }
    auto st = db->Prepare("SELECT COUNT(*) FROM t;");
    assert(sqlite3_step(st.get()) == SQLITE_ROW);
    assert(skycache::db::sqlite::ColI64(st.get(), 0) == 0);
  }
  std::filesystem::remove(db_path);
}

/*
  Whole system over the memory backend with a scripted network.
*/
void VerifyCacheSystemEndToEnd() {
  skycache::runtime::config::RuntimeConfig config;
  config.mutable_storage()->mutable_memory()->set_capacity_bytes(0);
  config.mutable_network()->set_data_origin("https://sky.test");

  auto fetcher = std::make_shared<skycache::testing::ScriptedFetcher>();
  fetcher->Serve("https://sky.test/stellarium-data/dso/info.json", R"({"name":"dso"})", "application/json");
  fetcher->Serve("https://sky.test/stellarium-data/dso/dso.json", "[]", "application/json");

  auto sys = skycache::factory::Build(config, fetcher);
  assert(sys.migration_state == skycache::migration::MigrationState::kUpToDate);
  assert(sys.migrator->GetCacheVersion()->version() == 1);

  assert(sys.layer_manager->DownloadLayer("dso"));
  assert(sys.layer_manager->GetLayerStatus("dso").is_complete);

  auto resource = sys.layer_manager->GetResource("/stellarium-data/dso/info.json");
  assert(resource && resource->from_cache);

  auto response = sys.unified_cache->Fetch("https://sky.test/stellarium-data/dso/dso.json");
  assert(response.ok && !response.from_cache);
  assert(sys.unified_cache->Fetch("https://sky.test/stellarium-data/dso/dso.json").from_cache);

  auto stats = sys.reporter->CollectCacheStats();
  assert(stats.subsystems.size() == 3);
  assert(stats.subsystems[0].name == "layers");
  assert(stats.subsystems[0].entries == 2);
  assert(stats.subsystems[2].entries == 1);
  assert(stats.subsystems[2].hits == 1);
  assert(stats.subsystems[2].misses == 1);
  assert(!stats.subsystems[1].hit_rate.has_value());
  assert(stats.storage.has_value());

  assert(sys.migrator->ResetAllCaches());
  assert(sys.reporter->CollectCacheStats().total_entries == 0);
}

/*
  A database path that cannot be created leaves the system running
  without a cache instead of failing to start.
*/
void VerifyCacheSystemWithUnopenableStore() {
  auto blocker = std::filesystem::temp_directory_path() / ("skycache_blocker_" + std::to_string(NowMs()));
  {
    std::ofstream out(blocker);
    out << "not a directory";
  }

  skycache::runtime::config::RuntimeConfig config;
  config.mutable_storage()->mutable_sqlite()->set_path((blocker / "nested" / "cache.db").string());
  config.mutable_network()->set_data_origin("https://sky.test");

  auto fetcher = std::make_shared<skycache::testing::ScriptedFetcher>();
  fetcher->Serve("https://sky.test/stellarium-data/dso/dso.json", "[]", "application/json");

  auto sys = skycache::factory::Build(config, fetcher);
  assert(!sys.backends.blobs);
  assert(!sys.cache->IsAvailable());
  assert(sys.migration_state == skycache::migration::MigrationState::kUnknown);

  for (const auto& status : sys.layer_manager->GetAllLayerStatus()) {
    assert(status.cached_file_count == 0);
    assert(!status.is_complete);
  }

  auto migration = sys.migrator->RunMigrations();
  assert(!migration.success);
  assert(!migration.errors.empty());

  auto response = sys.unified_cache->Fetch("https://sky.test/stellarium-data/dso/dso.json",
                                           skycache::unified::CacheStrategy::kNetworkOnly);
  assert(response.ok);
  assert(!response.from_cache);

  std::filesystem::remove(blocker);
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());
  backends.push_back(MakeSqliteFactory());

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  VerifySqliteTransactionRollsBack();
  VerifyCacheSystemEndToEnd();
  VerifyCacheSystemWithUnopenableStore();

  std::cout << "skycache_integration_blob_store_parity: pass\n";
  return 0;
}
