#include "internal/storage/cache_store.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/ram/ram_blob_store.hpp"
#include "tests/unit/support/faulty_blob_store.hpp"

namespace {

using skycache::codec::CompressionCodec;
using skycache::storage::CacheStore;
using skycache::storage::RamBlobStore;
using skycache::storage::StoredBlob;
using skycache::storage::common::CopyToBuffer;
using skycache::storage::common::ToString;
using skycache::testing::FaultyBlobStore;

std::shared_ptr<CompressionCodec> Codec() {
  return std::make_shared<CompressionCodec>();
}

void TestPutMatchAndCounters() {
  auto       blobs = std::make_shared<RamBlobStore>();
  CacheStore cache(blobs, Codec());

  assert(cache.Put("p-v1", "https://x/a.json", CopyToBuffer("{}"), "application/json"));
  auto hit = cache.Match("p-v1", "https://x/a.json");
  assert(hit.has_value());
  assert(ToString(hit->data) == "{}");
  assert(hit->content_type == "application/json");

  assert(!cache.Match("p-v1", "https://x/missing").has_value());
  assert(cache.Contains("p-v1", "https://x/a.json"));

  auto counters = cache.Counters("p-v1");
  assert(counters.hits == 1);
  assert(counters.misses == 1);

  cache.ResetCounters();
  assert(cache.Counters("p-v1").hits == 0);
}

void TestLargeTextIsStoredCompressed() {
  auto codec = Codec();
  assert(codec->IsAvailable());

  auto       blobs = std::make_shared<RamBlobStore>();
  CacheStore cache(blobs, codec);

  const std::string body(16 * 1024, 'x');
  assert(cache.Put("p-v1", "k", CopyToBuffer(body), "text/plain"));

  auto raw = blobs->Get("p-v1", "k");
  assert(raw.has_value());
  assert(CompressionCodec::HasMarker(*raw->data));
  assert(raw->data->size() < static_cast<int64_t>(body.size()));

  auto served = cache.Match("p-v1", "k");
  assert(ToString(served->data) == body);

  // binary content is never compressed
  assert(cache.Put("p-v1", "img", CopyToBuffer(body), "image/jpeg"));
  assert(!CompressionCodec::HasMarker(*blobs->Get("p-v1", "img")->data));
}

void TestExpiredEntriesAreMisses() {
  auto       blobs = std::make_shared<RamBlobStore>();
  CacheStore cache(blobs, Codec());

  assert(cache.Put("u-v1", "short", CopyToBuffer("a"), "text/plain", 1));
  assert(cache.Put("u-v1", "long", CopyToBuffer("b"), "text/plain", 60 * 60 * 1000));
  assert(cache.Put("u-v1", "forever", CopyToBuffer("c"), "text/plain", 0));

  std::this_thread::sleep_for(std::chrono::milliseconds(20));

  assert(!cache.Match("u-v1", "short").has_value());
  assert(!blobs->Contains("u-v1", "short"));
  assert(cache.Match("u-v1", "long").has_value());

  assert(cache.Put("u-v1", "short2", CopyToBuffer("a"), "text/plain", 1));
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  assert(cache.PurgeExpired("u-v1") == 1);
  assert(cache.ListKeys("u-v1").size() == 2);

  StoredBlob blob;
  blob.stored_at_ms = 1000;
  blob.ttl_ms       = 10;
  assert(!CacheStore::IsExpired(blob, 1010));
  assert(CacheStore::IsExpired(blob, 1011));
  blob.ttl_ms = 0;
  assert(!CacheStore::IsExpired(blob, 1 << 30));
}

void TestPartitions() {
  CacheStore cache(std::make_shared<RamBlobStore>(), Codec());

  assert(cache.OpenPartition("skymap-offline-stars-v1"));
  assert(cache.Put("skymap-hips-x-v1", "k", CopyToBuffer("t"), "image/jpeg"));
  assert(cache.Put("other", "k", CopyToBuffer("t"), "image/jpeg"));

  auto sky = cache.ListPartitions("skymap-");
  assert(sky.size() == 2);
  assert(cache.ListPartitions().size() == 3);

  assert(cache.Usage("skymap-hips-x-v1").entries == 1);
  assert(cache.Usage("skymap-hips-x-v1").bytes == 1);

  (void)cache.Match("skymap-hips-x-v1", "k");
  assert(cache.DeletePartition("skymap-hips-x-v1"));
  assert(cache.Counters("skymap-hips-x-v1").hits == 0);
  // already gone
  assert(cache.DeletePartition("skymap-hips-x-v1"));
  assert(cache.ListPartitions("skymap-").size() == 1);
}

void TestUnavailableStoreDegrades() {
  CacheStore detached(nullptr, Codec());
  assert(!detached.IsAvailable());
  assert(!detached.Put("p", "k", CopyToBuffer("x"), "text/plain"));
  assert(!detached.Match("p", "k").has_value());
  assert(detached.ListPartitions().empty());
  assert(!detached.GetStorageInfo().has_value());

  auto faulty = std::make_shared<FaultyBlobStore>();
  CacheStore cache(faulty, Codec());
  assert(cache.Put("p", "k", CopyToBuffer("x"), "text/plain"));

  faulty->fail_all = true;
  assert(!cache.Put("p", "k2", CopyToBuffer("x"), "text/plain"));
  assert(!cache.Match("p", "k").has_value());
  assert(!cache.Contains("p", "k"));
  assert(cache.ListKeys("p").empty());
  assert(!cache.DeletePartition("p"));
  assert(!cache.GetStorageInfo().has_value());

  faulty->fail_all = false;
  assert(cache.Contains("p", "k"));
}

} // namespace

int main() {
  TestPutMatchAndCounters();
  TestLargeTextIsStoredCompressed();
  TestExpiredEntriesAreMisses();
  TestPartitions();
  TestUnavailableStoreDegrades();

  std::cout << "skycache_unit_cache_store: pass\n";
  return 0;
}
