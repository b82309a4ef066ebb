#pragma once

#include <cstdint>
#include <functional>
#include <string>

#include "internal/util/cancellation.hpp"

namespace skycache::model {

enum class DownloadStatus : std::uint8_t {
  kPending     = 0,
  kDownloading = 1,
  kCompleted   = 2,
  kFailed      = 3,
  kCancelled   = 4,
};

constexpr bool IsTerminal(DownloadStatus status) {
  return status == DownloadStatus::kCompleted || status == DownloadStatus::kFailed || status == DownloadStatus::kCancelled;
}

constexpr bool CanTransition(DownloadStatus from, DownloadStatus to) {
  if (IsTerminal(from)) {
    return false;
  }
  if (from == DownloadStatus::kPending) {
    return to != DownloadStatus::kPending;
  }
  // kDownloading
  return IsTerminal(to);
}

inline const char* ToString(DownloadStatus status) {
  switch (status) {
    case DownloadStatus::kPending:
      return "pending";
    case DownloadStatus::kDownloading:
      return "downloading";
    case DownloadStatus::kCompleted:
      return "completed";
    case DownloadStatus::kFailed:
      return "failed";
    case DownloadStatus::kCancelled:
      return "cancelled";
  }
  return "unknown";
}

/*
  Snapshot handed to progress callbacks and ActiveDownloads().

  Units are files for layers, tiles for HiPS surveys. completed_units
  counts units now present in the cache (stored, or skipped because
  already cached); failed fetches go to failed_units instead.
*/
struct DownloadProgress {
  std::string    target_id;
  std::uint64_t  total_units              = 0;
  std::uint64_t  completed_units          = 0;
  std::uint64_t  failed_units             = 0;
  std::uint64_t  total_bytes_estimate     = 0;
  std::uint64_t  completed_bytes_estimate = 0;
  DownloadStatus status                   = DownloadStatus::kPending;
  std::string    error;
};

using ProgressCallback = std::function<void(const DownloadProgress&)>;

/*
  In-flight task record owned by a manager's active-task map.
*/
struct DownloadTask {
  // registry key; progress.target_id unless the caller keys differently
  std::string              key;
  DownloadProgress         progress;
  util::CancellationSource cancellation;
};

/*
  round(done / total * estimate), 0 when total is 0.
*/
inline std::uint64_t ProportionalBytes(std::uint64_t done, std::uint64_t total, std::uint64_t estimate) {
  if (total == 0) return 0;
  return static_cast<std::uint64_t>(static_cast<double>(done) / static_cast<double>(total) * static_cast<double>(estimate) + 0.5);
}

} // namespace skycache::model
