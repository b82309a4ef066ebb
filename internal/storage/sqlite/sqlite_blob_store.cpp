#include "sqlite_blob_store.hpp"

#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

#include "internal/db/sqlite/sqlite_tx.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/util/time.hpp"

namespace skycache::storage {

using namespace skycache::db::sqlite;

SqliteBlobStore::SqliteBlobStore(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
  BootstrapSchema();
}

void SqliteBlobStore::BootstrapSchema() {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS partitions (name TEXT PRIMARY KEY, created_at_ms INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS blobs (partition TEXT NOT NULL REFERENCES partitions(name) ON DELETE CASCADE, key TEXT NOT NULL, data BLOB NOT NULL, content_type TEXT NOT NULL DEFAULT '', stored_at_ms INTEGER NOT NULL, ttl_ms INTEGER NOT NULL DEFAULT 0, PRIMARY KEY (partition, key));"};

  std::lock_guard lock(mutex_);
  for (const auto& sql : kBootstrapSql) {
    db_->Exec(sql);
  }
}

// ------------------------------------------------------------------
// Partitions
// ------------------------------------------------------------------

void SqliteBlobStore::OpenPartitionLocked(const std::string& partition) {
  auto st = db_->Prepare("INSERT OR IGNORE INTO partitions(name, created_at_ms) VALUES(?, ?);");
  BindText(st.get(), 1, partition);
  BindI64(st.get(), 2, static_cast<std::int64_t>(util::NowUnixMillis()));
  db_->StepDone(st.get(), "sqlite open partition");
}

void SqliteBlobStore::OpenPartition(const std::string& partition) {
  std::lock_guard lock(mutex_);
  OpenPartitionLocked(partition);
}

std::vector<std::string> SqliteBlobStore::Partitions() {
  std::lock_guard lock(mutex_);

  std::vector<std::string> names;
  auto                     st = db_->Prepare("SELECT name FROM partitions ORDER BY name;");
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    names.push_back(ColText(st.get(), 0));
  }
  return names;
}

/*
  Blobs first, then the partition row, in one IMMEDIATE transaction so a
  concurrent reader never sees a half-dropped partition.
*/
bool SqliteBlobStore::DropPartition(const std::string& partition) {
  std::lock_guard lock(mutex_);

  SqliteTransaction tx(db_);

  auto drop_blobs = db_->Prepare("DELETE FROM blobs WHERE partition=?;");
  BindText(drop_blobs.get(), 1, partition);
  db_->StepDone(drop_blobs.get(), "sqlite drop blobs");

  auto drop_partition = db_->Prepare("DELETE FROM partitions WHERE name=?;");
  BindText(drop_partition.get(), 1, partition);
  db_->StepDone(drop_partition.get(), "sqlite drop partition");

  bool existed = sqlite3_changes(db_->Handle()) > 0;
  tx.Commit();
  return existed;
}

// ------------------------------------------------------------------
// Blobs
// ------------------------------------------------------------------

void SqliteBlobStore::Put(const std::string& partition, const std::string& key, const StoredBlob& blob) {
  std::lock_guard lock(mutex_);

  SqliteTransaction tx(db_);
  OpenPartitionLocked(partition);

  auto st = db_->Prepare(
      "INSERT OR REPLACE INTO blobs(partition, key, data, content_type, stored_at_ms, ttl_ms) VALUES(?, ?, ?, ?, ?, ?);");
  BindText(st.get(), 1, partition);
  BindText(st.get(), 2, key);
  BindBlob(st.get(), 3, blob.data ? blob.data->data() : nullptr, common::BufferSize(blob.data));
  BindText(st.get(), 4, blob.content_type);
  BindI64(st.get(), 5, blob.stored_at_ms);
  BindI64(st.get(), 6, blob.ttl_ms);
  db_->StepDone(st.get(), "sqlite put blob");

  tx.Commit();
}

std::optional<StoredBlob> SqliteBlobStore::Get(const std::string& partition, const std::string& key) {
  std::lock_guard lock(mutex_);

  auto st = db_->Prepare("SELECT data, content_type, stored_at_ms, ttl_ms FROM blobs WHERE partition=? AND key=?;");
  BindText(st.get(), 1, partition);
  BindText(st.get(), 2, key);

  if (sqlite3_step(st.get()) != SQLITE_ROW) {
    return std::nullopt;
  }

  const auto* bytes = static_cast<const std::uint8_t*>(sqlite3_column_blob(st.get(), 0));
  const auto  size  = static_cast<int64_t>(sqlite3_column_bytes(st.get(), 0));

  StoredBlob blob;
  blob.data         = common::CopyToBuffer(bytes, size);
  blob.content_type = ColText(st.get(), 1);
  blob.stored_at_ms = ColI64(st.get(), 2);
  blob.ttl_ms       = ColI64(st.get(), 3);
  return blob;
}

bool SqliteBlobStore::Contains(const std::string& partition, const std::string& key) {
  std::lock_guard lock(mutex_);

  auto st = db_->Prepare("SELECT 1 FROM blobs WHERE partition=? AND key=? LIMIT 1;");
  BindText(st.get(), 1, partition);
  BindText(st.get(), 2, key);
  return sqlite3_step(st.get()) == SQLITE_ROW;
}

bool SqliteBlobStore::Remove(const std::string& partition, const std::string& key) {
  std::lock_guard lock(mutex_);

  auto st = db_->Prepare("DELETE FROM blobs WHERE partition=? AND key=?;");
  BindText(st.get(), 1, partition);
  BindText(st.get(), 2, key);
  db_->StepDone(st.get(), "sqlite remove blob");
  return sqlite3_changes(db_->Handle()) > 0;
}

std::vector<std::string> SqliteBlobStore::Keys(const std::string& partition) {
  std::lock_guard lock(mutex_);

  std::vector<std::string> keys;
  auto                     st = db_->Prepare("SELECT key FROM blobs WHERE partition=? ORDER BY key;");
  BindText(st.get(), 1, partition);
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    keys.push_back(ColText(st.get(), 0));
  }
  return keys;
}

// ------------------------------------------------------------------
// Accounting
// ------------------------------------------------------------------

PartitionUsage SqliteBlobStore::Usage(const std::string& partition) {
  std::lock_guard lock(mutex_);

  auto st = db_->Prepare("SELECT COUNT(*), COALESCE(SUM(LENGTH(data)), 0) FROM blobs WHERE partition=?;");
  BindText(st.get(), 1, partition);

  PartitionUsage usage;
  if (sqlite3_step(st.get()) == SQLITE_ROW) {
    usage.entries = static_cast<std::uint64_t>(ColI64(st.get(), 0));
    usage.bytes   = static_cast<std::uint64_t>(ColI64(st.get(), 1));
  }
  return usage;
}

/*
  used  = bytes held in blobs
  quota = used + free space on the volume holding the database file
*/
StorageEstimate SqliteBlobStore::EstimateStorage() {
  StorageEstimate estimate;
  {
    std::lock_guard lock(mutex_);
    auto            st = db_->Prepare("SELECT COALESCE(SUM(LENGTH(data)), 0) FROM blobs;");
    if (sqlite3_step(st.get()) == SQLITE_ROW) {
      estimate.used_bytes = static_cast<std::uint64_t>(ColI64(st.get(), 0));
    }
  }

  const auto& path = db_->Path();
  if (path.empty() || path == ":memory:") {
    return estimate;
  }

  std::error_code ec;
  auto            directory = std::filesystem::absolute(path, ec).parent_path();
  if (ec) return estimate;

  auto space = std::filesystem::space(directory, ec);
  if (!ec) {
    estimate.quota_bytes = estimate.used_bytes + static_cast<std::uint64_t>(space.available);
  }
  return estimate;
}

} // namespace skycache::storage
