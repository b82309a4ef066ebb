#include "cache_store.hpp"

#include <exception>

#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

namespace skycache::storage {

using observability::IntField;
using observability::StringField;

namespace {

void LogStoreFailure(const char* op, const std::string& partition, const std::exception& e) {
  SKYCACHE_LOG_ERROR("blob store operation failed", {StringField("op", op), StringField("partition", partition), StringField("error", e.what())});
}

} // namespace

CacheStore::CacheStore(BlobStorePtr blobs, std::shared_ptr<const codec::CompressionCodec> codec)
    : blobs_(std::move(blobs)), codec_(std::move(codec)) {
  if (!codec_) {
    codec_ = std::make_shared<codec::CompressionCodec>();
  }
}

// ------------------------------------------------------------------
// Entries
// ------------------------------------------------------------------

bool CacheStore::Put(const std::string& partition, const std::string& key, const std::shared_ptr<arrow::Buffer>& body,
                     const std::string& content_type, std::int64_t ttl_ms) {
  if (!blobs_ || !body) return false;

  StoredBlob blob;
  blob.content_type = content_type;
  blob.stored_at_ms = static_cast<std::int64_t>(util::NowUnixMillis());
  blob.ttl_ms       = ttl_ms;
  blob.data         = body;

  if (codec_->ShouldCompress(*body, content_type)) {
    auto compressed = codec_->Compress(body);
    blob.data       = compressed.data;
    if (compressed.is_compressed) {
      SKYCACHE_LOG_DEBUG("compressed cache entry", {StringField("key", key), IntField("original_bytes", static_cast<std::int64_t>(compressed.original_size_bytes)),
                                                    IntField("stored_bytes", static_cast<std::int64_t>(compressed.compressed_size_bytes))});
    }
  }

  try {
    blobs_->Put(partition, key, blob);
    return true;
  } catch (const std::exception& e) {
    LogStoreFailure("put", partition, e);
    return false;
  }
}

std::optional<StoredBlob> CacheStore::Match(const std::string& partition, const std::string& key) {
  if (!blobs_) return std::nullopt;

  std::optional<StoredBlob> blob;
  try {
    blob = blobs_->Get(partition, key);
  } catch (const std::exception& e) {
    LogStoreFailure("get", partition, e);
    return std::nullopt;
  }

  if (blob && IsExpired(*blob, static_cast<std::int64_t>(util::NowUnixMillis()))) {
    Delete(partition, key);
    blob.reset();
  }

  RecordLookup(partition, blob.has_value());
  if (blob) {
    blob->data = codec_->Decompress(blob->data);
  }
  return blob;
}

bool CacheStore::Contains(const std::string& partition, const std::string& key) {
  if (!blobs_) return false;

  try {
    return blobs_->Contains(partition, key);
  } catch (const std::exception& e) {
    LogStoreFailure("contains", partition, e);
    return false;
  }
}

bool CacheStore::Delete(const std::string& partition, const std::string& key) {
  if (!blobs_) return false;

  try {
    return blobs_->Remove(partition, key);
  } catch (const std::exception& e) {
    LogStoreFailure("delete", partition, e);
    return false;
  }
}

std::vector<std::string> CacheStore::ListKeys(const std::string& partition) {
  if (!blobs_) return {};

  try {
    return blobs_->Keys(partition);
  } catch (const std::exception& e) {
    LogStoreFailure("keys", partition, e);
    return {};
  }
}

bool CacheStore::IsExpired(const StoredBlob& blob, std::int64_t now_ms) {
  return blob.ttl_ms > 0 && now_ms > blob.stored_at_ms + blob.ttl_ms;
}

std::size_t CacheStore::PurgeExpired(const std::string& partition) {
  if (!blobs_) return 0;

  const auto  now    = static_cast<std::int64_t>(util::NowUnixMillis());
  std::size_t purged = 0;
  try {
    for (const auto& key : blobs_->Keys(partition)) {
      auto blob = blobs_->Get(partition, key);
      if (blob && IsExpired(*blob, now) && blobs_->Remove(partition, key)) {
        ++purged;
      }
    }
  } catch (const std::exception& e) {
    LogStoreFailure("purge", partition, e);
  }
  return purged;
}

// ------------------------------------------------------------------
// Partitions
// ------------------------------------------------------------------

bool CacheStore::OpenPartition(const std::string& partition) {
  if (!blobs_) return false;

  try {
    blobs_->OpenPartition(partition);
    return true;
  } catch (const std::exception& e) {
    LogStoreFailure("open", partition, e);
    return false;
  }
}

std::vector<std::string> CacheStore::ListPartitions(const std::string& prefix) {
  if (!blobs_) return {};

  std::vector<std::string> all;
  try {
    all = blobs_->Partitions();
  } catch (const std::exception& e) {
    LogStoreFailure("partitions", prefix, e);
    return {};
  }

  std::vector<std::string> matching;
  for (auto& name : all) {
    if (name.compare(0, prefix.size(), prefix) == 0) {
      matching.push_back(std::move(name));
    }
  }
  return matching;
}

/*
  Deleting a partition that does not exist counts as success; callers
  only care that it is gone afterwards.
*/
bool CacheStore::DeletePartition(const std::string& partition) {
  if (!blobs_) return false;

  try {
    blobs_->DropPartition(partition);
  } catch (const std::exception& e) {
    LogStoreFailure("drop", partition, e);
    return false;
  }

  std::lock_guard lock(counters_mutex_);
  counters_.erase(partition);
  return true;
}

// ------------------------------------------------------------------
// Accounting
// ------------------------------------------------------------------

PartitionUsage CacheStore::Usage(const std::string& partition) {
  if (!blobs_) return {};

  try {
    return blobs_->Usage(partition);
  } catch (const std::exception& e) {
    LogStoreFailure("usage", partition, e);
    return {};
  }
}

std::optional<StorageEstimate> CacheStore::GetStorageInfo() {
  if (!blobs_) return std::nullopt;

  try {
    return blobs_->EstimateStorage();
  } catch (const std::exception& e) {
    LogStoreFailure("estimate", blobs_->Name(), e);
    return std::nullopt;
  }
}

HitCounters CacheStore::Counters(const std::string& partition) const {
  std::lock_guard lock(counters_mutex_);

  auto it = counters_.find(partition);
  return it == counters_.end() ? HitCounters{} : it->second;
}

void CacheStore::ResetCounters() {
  std::lock_guard lock(counters_mutex_);
  counters_.clear();
}

void CacheStore::RecordLookup(const std::string& partition, bool hit) {
  std::lock_guard lock(counters_mutex_);

  auto& counters = counters_[partition];
  if (hit) {
    ++counters.hits;
  } else {
    ++counters.misses;
  }
}

} // namespace skycache::storage
