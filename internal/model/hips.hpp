#pragma once

#include <cstdint>
#include <optional>
#include <set>
#include <string>

namespace skycache::model {

struct HiPSSurvey {
  std::string id;
  std::string name;
  // base URL, always ends with '/'
  std::string url;
  int         max_order = 0;
  // "jpeg", "png", "webp" or a space-separated list of them
  std::string tile_format;
  std::string category;
  std::string description;
};

struct HiPSTileAddress {
  int           order            = 0;
  std::uint64_t pixel_index      = 0;
  std::uint64_t directory_bucket = 0;
};

struct HiPSSurveyCacheStatus {
  std::string        survey_id;
  std::uint64_t      cached_tile_count = 0;
  std::set<int>      cached_orders;
  std::optional<int> max_cached_order;
  // cached_tile_count * average tile size
  std::uint64_t cached_bytes_estimate = 0;
  // bytes actually held by the partition (after compression)
  std::uint64_t stored_bytes                 = 0;
  std::uint64_t total_tiles_through_max_order = 0;
};

} // namespace skycache::model
