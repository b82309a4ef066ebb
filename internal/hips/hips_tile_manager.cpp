#include "hips_tile_manager.hpp"

#include <algorithm>
#include <exception>
#include <future>
#include <stdexcept>

#include "config/config.pb.h"
#include "internal/hips/tile_addressing.hpp"
#include "internal/observability/logging.hpp"

namespace skycache::hips {

using model::DownloadProgress;
using model::DownloadStatus;
using observability::IntField;
using observability::StringField;

namespace {

void Emit(const model::ProgressCallback& on_progress, const DownloadProgress& snapshot) {
  if (on_progress) {
    on_progress(snapshot);
  }
}

} // namespace

HipsOptions HipsOptions::FromConfig(const skycache::runtime::config::HipsConfig& cfg) {
  HipsOptions options;
  if (cfg.batch_size() > 0) options.batch_size = cfg.batch_size();
  if (cfg.average_tile_bytes() > 0) options.average_tile_bytes = cfg.average_tile_bytes();
  return options;
}

HiPSTileManager::HiPSTileManager(storage::CacheStorePtr cache, net::FetcherPtr fetcher, storage::PartitionNaming naming, HipsOptions options)
    : cache_(std::move(cache)), fetcher_(std::move(fetcher)), naming_(std::move(naming)), options_(options) {
  if (!cache_ || !fetcher_) {
    throw std::invalid_argument("HiPSTileManager requires cache store and fetcher");
  }
  if (options_.batch_size == 0) {
    throw std::invalid_argument("hips batch_size must be positive");
  }
}

// ------------------------------------------------------------------
// Batch
// ------------------------------------------------------------------

/*
  Fetches run on std::async threads; storing and counting happen here
  on the calling thread once every future of the batch has settled.
*/
HiPSTileManager::BatchResult HiPSTileManager::RunBatch(const model::HiPSSurvey& survey, const std::string& partition, int order,
                                                       std::uint64_t first_pixel, std::uint64_t end_pixel, const util::CancellationToken& token) {
  struct PendingTile {
    std::string                   url;
    std::future<net::FetchResult> fetch;
  };

  BatchResult              batch;
  std::vector<PendingTile> pending;
  pending.reserve(static_cast<std::size_t>(end_pixel - first_pixel));

  for (std::uint64_t pixel = first_pixel; pixel < end_pixel; ++pixel) {
    auto url = TileUrl(survey, MakeTileAddress(order, pixel));
    if (cache_->Contains(partition, url)) {
      ++batch.completed;
      continue;
    }

    auto fetcher = fetcher_;
    auto future  = std::async(std::launch::async, [fetcher, url, token]() {
      try {
        return fetcher->Fetch(url, token);
      } catch (const std::exception& e) {
        net::FetchResult failed;
        failed.outcome = net::FetchOutcome::kNetworkError;
        failed.error   = e.what();
        return failed;
      }
    });
    pending.push_back(PendingTile{std::move(url), std::move(future)});
  }

  for (auto& tile : pending) {
    auto result = tile.fetch.get();

    // a clear may have dropped the partition since this fetch finished
    if (result.outcome == net::FetchOutcome::kCancelled || token.IsCancelled()) {
      batch.cancelled = true;
      continue;
    }

    if (result.ok() && cache_->Put(partition, tile.url, result.body, result.content_type)) {
      ++batch.completed;
      continue;
    }

    ++batch.failed;
    SKYCACHE_LOG_WARN("tile download failed", {StringField("survey", survey.id), StringField("url", tile.url),
                                               StringField("outcome", net::ToString(result.outcome)), StringField("error", result.error)});
  }

  return batch;
}

// ------------------------------------------------------------------
// Download
// ------------------------------------------------------------------

bool HiPSTileManager::DownloadHiPSSurvey(const model::HiPSSurvey& survey, int max_order, const model::ProgressCallback& on_progress) {
  if (max_order < 0) {
    throw std::invalid_argument("max_order must not be negative");
  }

  const int effective_order = std::min({max_order, survey.max_order, kMaxHipsOrder});
  if (effective_order < 0) {
    throw std::invalid_argument("survey '" + survey.id + "' has a negative max_order");
  }
  const std::uint64_t total_tiles = TotalTilesThroughOrder(effective_order);

  // keyed on the partition: ids that sanitize alike share one
  const auto partition = PartitionFor(survey.id);
  auto       task      = tasks_.Begin(partition, total_tiles, total_tiles * options_.average_tile_bytes, survey.id);
  if (!task) {
    SKYCACHE_LOG_INFO("survey already downloading", {StringField("survey", survey.id), StringField("partition", partition)});
    return false;
  }

  if (!cache_->OpenPartition(partition)) {
    auto snapshot = task.Update([](DownloadProgress& progress) {
      progress.status = DownloadStatus::kFailed;
      progress.error  = "blob store unavailable";
    });
    Emit(on_progress, snapshot);
    SKYCACHE_LOG_ERROR("survey download failed", {StringField("survey", survey.id), StringField("error", snapshot.error)});
    return false;
  }

  Emit(on_progress, task.Update([](DownloadProgress& progress) { progress.status = DownloadStatus::kDownloading; }));
  SKYCACHE_LOG_INFO("survey download started", {StringField("survey", survey.id), IntField("max_order", effective_order),
                                                IntField("tiles", static_cast<std::int64_t>(total_tiles))});

  const auto    token     = task.Token();
  std::uint64_t failed    = 0;
  bool          cancelled = false;

  for (int order = 0; order <= effective_order && !cancelled; ++order) {
    const std::uint64_t tiles = TileCountForOrder(order);

    for (std::uint64_t start = 0; start < tiles; start += options_.batch_size) {
      if (token.IsCancelled()) {
        cancelled = true;
        break;
      }

      const std::uint64_t end   = std::min<std::uint64_t>(start + options_.batch_size, tiles);
      auto                batch = RunBatch(survey, partition, order, start, end, token);

      failed += batch.failed;
      cancelled = batch.cancelled;

      Emit(on_progress, task.Update([&](DownloadProgress& progress) {
        progress.completed_units += batch.completed;
        progress.failed_units += batch.failed;
        progress.completed_bytes_estimate =
            model::ProportionalBytes(progress.completed_units, progress.total_units, progress.total_bytes_estimate);
      }));

      if (cancelled) break;
    }
  }

  auto snapshot = task.Update([&](DownloadProgress& progress) {
    if (cancelled) {
      progress.status = DownloadStatus::kCancelled;
      progress.error  = "download cancelled";
    } else if (failed > 0) {
      progress.status = DownloadStatus::kFailed;
      progress.error  = std::to_string(failed) + " tiles failed";
    } else {
      progress.status = DownloadStatus::kCompleted;
    }
  });
  Emit(on_progress, snapshot);

  SKYCACHE_LOG_INFO("survey download finished", {StringField("survey", survey.id), StringField("status", model::ToString(snapshot.status)),
                                                 IntField("completed", static_cast<std::int64_t>(snapshot.completed_units)),
                                                 IntField("failed", static_cast<std::int64_t>(failed))});

  return !cancelled && failed == 0;
}

// ------------------------------------------------------------------
// Status
// ------------------------------------------------------------------

model::HiPSSurveyCacheStatus HiPSTileManager::GetHiPSCacheStatus(const model::HiPSSurvey& survey) {
  model::HiPSSurveyCacheStatus status;
  status.survey_id = survey.id;

  const auto partition = PartitionFor(survey.id);
  for (const auto& key : cache_->ListKeys(partition)) {
    auto order = ParseOrderFromKey(key);
    if (!order) continue;

    ++status.cached_tile_count;
    status.cached_orders.insert(*order);
  }

  if (!status.cached_orders.empty()) {
    status.max_cached_order              = *status.cached_orders.rbegin();
    status.total_tiles_through_max_order = TotalTilesThroughOrder(*status.max_cached_order);
  }

  status.cached_bytes_estimate = status.cached_tile_count * options_.average_tile_bytes;
  status.stored_bytes          = cache_->Usage(partition).bytes;
  return status;
}

// ------------------------------------------------------------------
// Cancel / clear
// ------------------------------------------------------------------

bool HiPSTileManager::CancelHiPSDownload(const std::string& survey_id) {
  if (!tasks_.Cancel(PartitionFor(survey_id))) return false;

  SKYCACHE_LOG_INFO("survey download cancel requested", {StringField("survey", survey_id)});
  return true;
}

void HiPSTileManager::CancelAllHiPSDownloads() {
  tasks_.CancelAll();
}

bool HiPSTileManager::IsDownloading(const std::string& survey_id) const {
  return tasks_.Contains(PartitionFor(survey_id));
}

std::vector<DownloadProgress> HiPSTileManager::ActiveDownloads() const {
  return tasks_.Snapshot();
}

bool HiPSTileManager::ClearHiPSCache(const std::string& survey_id) {
  CancelHiPSDownload(survey_id);

  bool cleared = cache_->DeletePartition(PartitionFor(survey_id));
  if (cleared) {
    SKYCACHE_LOG_INFO("survey cache cleared", {StringField("survey", survey_id)});
  }
  return cleared;
}

bool HiPSTileManager::ClearAllHiPSCaches() {
  if (!cache_->IsAvailable()) return false;

  CancelAllHiPSDownloads();

  bool ok = true;
  for (const auto& partition : cache_->ListPartitions(naming_.hips_prefix)) {
    ok = cache_->DeletePartition(partition) && ok;
  }
  return ok;
}

} // namespace skycache::hips
