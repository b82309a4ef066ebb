#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "internal/model/active_task_registry.hpp"
#include "internal/model/download_task.hpp"
#include "internal/model/hips.hpp"
#include "internal/net/fetcher.hpp"
#include "internal/storage/cache_store.hpp"
#include "internal/storage/partition_naming.hpp"

namespace skycache::runtime::config {
class HipsConfig;
}

namespace skycache::hips {

struct HipsOptions {
  std::size_t   batch_size         = 10;
  std::uint64_t average_tile_bytes = 50 * 1024;

  static HipsOptions FromConfig(const skycache::runtime::config::HipsConfig& cfg);
};

/*
  Bulk download of HiPS survey tiles into one partition per survey.

  Orders are walked 0..max_order. Within an order, tiles are fetched in
  batches of batch_size concurrent requests; a batch fully settles
  before the next one starts. Tiles already in the partition are
  skipped without a request, so re-running a survey resumes it.

  Cache status is rebuilt from the stored keys on every query.
*/
class HiPSTileManager {
 public:
  HiPSTileManager(storage::CacheStorePtr cache, net::FetcherPtr fetcher, storage::PartitionNaming naming = {}, HipsOptions options = {});

  /*
    True when every tile through min(max_order, survey.max_order) is
    cached and the download was not cancelled. Throws
    std::invalid_argument for a negative max_order.
  */
  bool DownloadHiPSSurvey(const model::HiPSSurvey& survey, int max_order, const model::ProgressCallback& on_progress = {});

  model::HiPSSurveyCacheStatus GetHiPSCacheStatus(const model::HiPSSurvey& survey);

  bool CancelHiPSDownload(const std::string& survey_id);

  void CancelAllHiPSDownloads();

  bool IsDownloading(const std::string& survey_id) const;

  std::vector<model::DownloadProgress> ActiveDownloads() const;

  bool ClearHiPSCache(const std::string& survey_id);

  bool ClearAllHiPSCaches();

  std::string PartitionFor(const std::string& survey_id) const {
    return naming_.HipsPartition(survey_id);
  }

  const HipsOptions& Options() const {
    return options_;
  }

 private:
  struct BatchResult {
    std::uint64_t completed = 0;
    std::uint64_t failed    = 0;
    bool          cancelled = false;
  };

  BatchResult RunBatch(const model::HiPSSurvey& survey, const std::string& partition, int order, std::uint64_t first_pixel,
                       std::uint64_t end_pixel, const util::CancellationToken& token);

  storage::CacheStorePtr    cache_;
  net::FetcherPtr           fetcher_;
  storage::PartitionNaming  naming_;
  HipsOptions               options_;
  model::ActiveTaskRegistry tasks_;
};

} // namespace skycache::hips
