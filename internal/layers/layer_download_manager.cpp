#include "layer_download_manager.hpp"

#include <algorithm>
#include <exception>
#include <set>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace skycache::layers {

using model::CacheEntryStatus;
using model::DownloadProgress;
using model::DownloadStatus;
using model::LayerDescriptor;
using observability::IntField;
using observability::StringField;

namespace {

void Emit(const model::ProgressCallback& on_progress, const DownloadProgress& snapshot) {
  if (on_progress) {
    on_progress(snapshot);
  }
}

net::FetchResult SafeFetch(net::Fetcher& fetcher, const std::string& url, const util::CancellationToken& token) {
  try {
    return fetcher.Fetch(url, token);
  } catch (const std::exception& e) {
    net::FetchResult result;
    result.outcome = net::FetchOutcome::kNetworkError;
    result.error   = e.what();
    return result;
  }
}

} // namespace

LayerDownloadManager::LayerDownloadManager(std::shared_ptr<const LayerRegistry> registry, storage::CacheStorePtr cache, net::FetcherPtr fetcher,
                                           storage::PartitionNaming naming)
    : registry_(std::move(registry)), cache_(std::move(cache)), fetcher_(std::move(fetcher)), naming_(std::move(naming)) {
  if (!registry_ || !cache_ || !fetcher_) {
    throw std::invalid_argument("LayerDownloadManager requires registry, cache store and fetcher");
  }
}

// ------------------------------------------------------------------
// Status
// ------------------------------------------------------------------

CacheEntryStatus LayerDownloadManager::GetLayerStatus(const std::string& layer_id) {
  const auto& layer = registry_->Get(layer_id);

  CacheEntryStatus status;
  status.layer_id         = layer.id;
  status.total_file_count = layer.files.size();
  status.total_bytes      = layer.estimated_size_bytes;

  // unavailable store lists nothing, so every file reports missing
  const auto            keys = cache_->ListKeys(PartitionFor(layer.id));
  std::set<std::string> stored(keys.begin(), keys.end());

  for (const auto& file : layer.files) {
    if (stored.count(registry_->ResolveUrl(layer, file)) > 0) {
      ++status.cached_file_count;
    } else {
      status.missing_files.push_back(file);
    }
  }

  status.is_complete           = status.missing_files.empty();
  status.cached_bytes_estimate = model::ProportionalBytes(status.cached_file_count, status.total_file_count, status.total_bytes);
  return status;
}

std::vector<CacheEntryStatus> LayerDownloadManager::GetAllLayerStatus() {
  std::vector<CacheEntryStatus> statuses;
  statuses.reserve(registry_->All().size());
  for (const auto& layer : registry_->All()) {
    statuses.push_back(GetLayerStatus(layer.id));
  }
  return statuses;
}

// ------------------------------------------------------------------
// Task bookkeeping
// ------------------------------------------------------------------

bool LayerDownloadManager::CancelDownload(const std::string& layer_id) {
  if (!tasks_.Cancel(layer_id)) return false;

  SKYCACHE_LOG_INFO("layer download cancel requested", {StringField("layer", layer_id)});
  return true;
}

void LayerDownloadManager::CancelAllDownloads() {
  tasks_.CancelAll();
}

bool LayerDownloadManager::IsDownloading(const std::string& layer_id) const {
  return tasks_.Contains(layer_id);
}

std::vector<DownloadProgress> LayerDownloadManager::ActiveDownloads() const {
  return tasks_.Snapshot();
}

// ------------------------------------------------------------------
// Fetch loop
// ------------------------------------------------------------------

LayerDownloadManager::FileRunResult LayerDownloadManager::FetchFiles(const LayerDescriptor& layer, const std::vector<std::string>& files,
                                                                     model::ActiveTaskRegistry::TaskHandle& task,
                                                                     const model::ProgressCallback& on_progress) {
  FileRunResult run;
  const auto    partition = PartitionFor(layer.id);
  const auto    token     = task.Token();

  for (const auto& file : files) {
    if (token.IsCancelled()) {
      run.cancelled = true;
      break;
    }

    const auto url    = registry_->ResolveUrl(layer, file);
    auto       result = SafeFetch(*fetcher_, url, token);

    // a clear may have dropped the partition since this fetch finished
    if (result.outcome == net::FetchOutcome::kCancelled || token.IsCancelled()) {
      run.cancelled = true;
      break;
    }

    bool stored = false;
    if (result.ok()) {
      stored = cache_->Put(partition, url, result.body, result.content_type);
      if (!stored) {
        SKYCACHE_LOG_WARN("failed to store layer file", {StringField("layer", layer.id), StringField("url", url)});
      }
    } else {
      SKYCACHE_LOG_WARN("failed to fetch layer file", {StringField("layer", layer.id), StringField("url", url),
                                                       StringField("outcome", net::ToString(result.outcome)), IntField("http_status", result.http_status),
                                                       StringField("error", result.error)});
    }

    if (stored) {
      ++run.stored;
    } else {
      ++run.failed;
    }

    auto snapshot = task.Update([&](DownloadProgress& progress) {
      if (stored) {
        ++progress.completed_units;
        progress.completed_bytes_estimate =
            model::ProportionalBytes(progress.completed_units, progress.total_units, progress.total_bytes_estimate);
      } else {
        ++progress.failed_units;
      }
    });
    Emit(on_progress, snapshot);
  }

  return run;
}

// ------------------------------------------------------------------
// Download
// ------------------------------------------------------------------

bool LayerDownloadManager::DownloadLayer(const std::string& layer_id, const model::ProgressCallback& on_progress) {
  const auto& layer = registry_->Get(layer_id);

  auto task = tasks_.Begin(layer.id, layer.files.size(), layer.estimated_size_bytes);
  if (!task) {
    SKYCACHE_LOG_INFO("layer already downloading", {StringField("layer", layer_id)});
    return false;
  }

  if (!cache_->OpenPartition(PartitionFor(layer.id))) {
    auto snapshot = task.Update([](DownloadProgress& progress) {
      progress.status = DownloadStatus::kFailed;
      progress.error  = "blob store unavailable";
    });
    Emit(on_progress, snapshot);
    SKYCACHE_LOG_ERROR("layer download failed", {StringField("layer", layer_id), StringField("error", snapshot.error)});
    return false;
  }

  Emit(on_progress, task.Update([](DownloadProgress& progress) { progress.status = DownloadStatus::kDownloading; }));
  SKYCACHE_LOG_INFO("layer download started", {StringField("layer", layer_id), IntField("files", static_cast<std::int64_t>(layer.files.size()))});

  auto run = FetchFiles(layer, layer.files, task, on_progress);

  auto snapshot = task.Update([&](DownloadProgress& progress) {
    if (run.cancelled) {
      progress.status = DownloadStatus::kCancelled;
      progress.error  = "download cancelled";
    } else if (run.failed > 0) {
      progress.status = DownloadStatus::kFailed;
      progress.error  = std::to_string(run.failed) + " of " + std::to_string(layer.files.size()) + " files failed";
    } else {
      progress.status = DownloadStatus::kCompleted;
    }
  });
  Emit(on_progress, snapshot);

  SKYCACHE_LOG_INFO("layer download finished", {StringField("layer", layer_id), StringField("status", model::ToString(snapshot.status)),
                                                IntField("stored", static_cast<std::int64_t>(run.stored)),
                                                IntField("failed", static_cast<std::int64_t>(run.failed))});

  return !run.cancelled && run.failed == 0 && run.stored == layer.files.size();
}

std::map<std::string, bool> LayerDownloadManager::DownloadLayers(const std::vector<std::string>& layer_ids, const model::ProgressCallback& on_progress) {
  constexpr int kUnknownPriority = 999;

  auto priority_of = [this](const std::string& id) {
    const auto* layer = registry_->Find(id);
    return layer ? layer->priority : kUnknownPriority;
  };

  auto ordered = layer_ids;
  std::stable_sort(ordered.begin(), ordered.end(), [&](const std::string& a, const std::string& b) { return priority_of(a) < priority_of(b); });

  std::map<std::string, bool> results;
  for (const auto& id : ordered) {
    if (!registry_->Find(id)) {
      SKYCACHE_LOG_WARN("skipping unknown layer", {StringField("layer", id)});
      results[id] = false;
      continue;
    }
    results[id] = DownloadLayer(id, on_progress);
  }
  return results;
}

std::map<std::string, bool> LayerDownloadManager::DownloadAllLayers(const model::ProgressCallback& on_progress) {
  std::vector<std::string> ids;
  for (const auto& layer : registry_->All()) {
    ids.push_back(layer.id);
  }
  return DownloadLayers(ids, on_progress);
}

// ------------------------------------------------------------------
// Repair
// ------------------------------------------------------------------

model::RepairResult LayerDownloadManager::VerifyAndRepairLayer(const std::string& layer_id, const model::ProgressCallback& on_progress) {
  model::RepairResult result;

  auto status = GetLayerStatus(layer_id);
  if (status.is_complete) {
    result.verified = true;
    return result;
  }

  const auto& layer   = registry_->Get(layer_id);
  const auto& missing = status.missing_files;

  auto task = tasks_.Begin(layer.id, missing.size(), model::ProportionalBytes(missing.size(), layer.files.size(), layer.estimated_size_bytes));
  if (!task) {
    SKYCACHE_LOG_INFO("layer already downloading; repair skipped", {StringField("layer", layer_id)});
    result.failed = missing.size();
    return result;
  }

  if (!cache_->OpenPartition(PartitionFor(layer.id))) {
    auto snapshot = task.Update([](DownloadProgress& progress) {
      progress.status = DownloadStatus::kFailed;
      progress.error  = "blob store unavailable";
    });
    Emit(on_progress, snapshot);
    result.failed = missing.size();
    return result;
  }

  SKYCACHE_LOG_INFO("repairing layer", {StringField("layer", layer_id), IntField("missing", static_cast<std::int64_t>(missing.size()))});
  Emit(on_progress, task.Update([](DownloadProgress& progress) { progress.status = DownloadStatus::kDownloading; }));

  auto run = FetchFiles(layer, missing, task, on_progress);

  result.repaired  = run.stored;
  result.failed    = run.failed;
  result.cancelled = run.cancelled;
  result.verified  = !run.cancelled && run.failed == 0 && run.stored == missing.size();

  auto snapshot = task.Update([&](DownloadProgress& progress) {
    if (run.cancelled) {
      progress.status = DownloadStatus::kCancelled;
      progress.error  = "repair cancelled";
    } else if (!result.verified) {
      progress.status = DownloadStatus::kFailed;
      progress.error  = std::to_string(run.failed) + " of " + std::to_string(missing.size()) + " files failed";
    } else {
      progress.status = DownloadStatus::kCompleted;
    }
  });
  Emit(on_progress, snapshot);

  return result;
}

// ------------------------------------------------------------------
// Clear
// ------------------------------------------------------------------

bool LayerDownloadManager::ClearLayer(const std::string& layer_id) {
  const auto& layer = registry_->Get(layer_id);

  CancelDownload(layer.id);
  bool cleared = cache_->DeletePartition(PartitionFor(layer.id));
  if (cleared) {
    SKYCACHE_LOG_INFO("layer cache cleared", {StringField("layer", layer_id)});
  }
  return cleared;
}

bool LayerDownloadManager::ClearAllCache() {
  if (!cache_->IsAvailable()) return false;

  CancelAllDownloads();

  bool ok = true;
  for (const auto& partition : cache_->ListPartitions(naming_.layer_prefix)) {
    ok = cache_->DeletePartition(partition) && ok;
  }
  return ok;
}

// ------------------------------------------------------------------
// Lookup
// ------------------------------------------------------------------

std::optional<Resource> LayerDownloadManager::GetResource(const std::string& url) {
  const auto resolved = registry_->ResolveUrl(url);

  for (const auto& partition : cache_->ListPartitions(naming_.layer_prefix)) {
    if (!cache_->Contains(partition, resolved)) continue;

    auto blob = cache_->Match(partition, resolved);
    if (blob) {
      return Resource{blob->data, blob->content_type, true};
    }
  }

  if (!fetcher_->IsOnline()) {
    return std::nullopt;
  }

  auto result = SafeFetch(*fetcher_, resolved, util::CancellationToken{});
  if (!result.ok()) {
    SKYCACHE_LOG_WARN("resource fetch failed", {StringField("url", resolved), StringField("error", result.error)});
    return std::nullopt;
  }
  return Resource{result.body, result.content_type, false};
}

} // namespace skycache::layers
