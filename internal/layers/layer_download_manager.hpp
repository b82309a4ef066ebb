#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/layers/layer_registry.hpp"
#include "internal/model/active_task_registry.hpp"
#include "internal/model/download_task.hpp"
#include "internal/model/layer.hpp"
#include "internal/net/fetcher.hpp"
#include "internal/storage/cache_store.hpp"
#include "internal/storage/partition_naming.hpp"

namespace skycache::layers {

/*
  A resource served by GetResource().
*/
struct Resource {
  std::shared_ptr<arrow::Buffer> body;
  std::string                    content_type;
  bool                           from_cache = false;
};

/*
  Downloads layers into per-layer partitions and answers status,
  repair and clear requests.

  Downloads run on the caller's thread, files strictly in declared
  order. The active-task map makes a second request for an in-flight
  layer a no-op and lets other threads cancel or observe it.

  Status is always recomputed from partition keys; nothing is persisted
  about a download besides the blobs themselves.
*/
class LayerDownloadManager {
 public:
  LayerDownloadManager(std::shared_ptr<const LayerRegistry> registry, storage::CacheStorePtr cache, net::FetcherPtr fetcher,
                       storage::PartitionNaming naming = {});

  // ------------------------------------------------------------------
  // Status
  // ------------------------------------------------------------------
  /*
    Declared files vs. stored keys. Side-effect free.
    Throws util::NotFound for unknown ids.
  */
  model::CacheEntryStatus GetLayerStatus(const std::string& layer_id);

  // one entry per registered layer, registry order
  std::vector<model::CacheEntryStatus> GetAllLayerStatus();

  // ------------------------------------------------------------------
  // Download
  // ------------------------------------------------------------------
  /*
    Fetch every declared file of a layer.

    Returns true only when every file is stored. Never throws for
    network or storage faults; those end the task as Failed or leave it
    Completed with failed_units > 0. Throws util::NotFound for unknown ids.
  */
  bool DownloadLayer(const std::string& layer_id, const model::ProgressCallback& on_progress = {});

  /*
    Ascending priority, sequential. Unknown ids are reported false and
    run last.
  */
  std::map<std::string, bool> DownloadLayers(const std::vector<std::string>& layer_ids, const model::ProgressCallback& on_progress = {});

  std::map<std::string, bool> DownloadAllLayers(const model::ProgressCallback& on_progress = {});

  bool CancelDownload(const std::string& layer_id);

  void CancelAllDownloads();

  bool IsDownloading(const std::string& layer_id) const;

  std::vector<model::DownloadProgress> ActiveDownloads() const;

  // ------------------------------------------------------------------
  // Repair
  // ------------------------------------------------------------------
  /*
    Re-fetch only the missing files. A complete layer returns
    {verified=true} without touching the network.
  */
  model::RepairResult VerifyAndRepairLayer(const std::string& layer_id, const model::ProgressCallback& on_progress = {});

  // ------------------------------------------------------------------
  // Clear
  // ------------------------------------------------------------------
  bool ClearLayer(const std::string& layer_id);

  bool ClearAllCache();

  // ------------------------------------------------------------------
  // Lookup
  // ------------------------------------------------------------------
  /*
    Any layer partition first, then the network while online.
    Network responses are returned but not stored.
  */
  std::optional<Resource> GetResource(const std::string& url);

  std::string PartitionFor(const std::string& layer_id) const {
    return naming_.LayerPartition(layer_id);
  }

  const LayerRegistry& Registry() const {
    return *registry_;
  }

 private:
  struct FileRunResult {
    std::uint64_t stored    = 0;
    std::uint64_t failed    = 0;
    bool          cancelled = false;
  };

  FileRunResult FetchFiles(const model::LayerDescriptor& layer, const std::vector<std::string>& files, model::ActiveTaskRegistry::TaskHandle& task,
                           const model::ProgressCallback& on_progress);

  std::shared_ptr<const LayerRegistry> registry_;
  storage::CacheStorePtr               cache_;
  net::FetcherPtr                      fetcher_;
  storage::PartitionNaming             naming_;

  model::ActiveTaskRegistry tasks_;
};

} // namespace skycache::layers
