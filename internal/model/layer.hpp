#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace skycache::model {

/*
  A named bundle of static engine data files.

  Compiled in and immutable. File names are relative to base_url and
  never renamed within a released layer; doing so requires a schema bump.
*/
struct LayerDescriptor {
  std::string              id;
  std::string              display_name;
  std::string              description;
  std::string              base_url;
  std::vector<std::string> files;
  std::uint64_t            estimated_size_bytes = 0;
  // lower downloads first
  int priority = 0;
};

/*
  Derived from the blob store on every query; never persisted.
*/
struct CacheEntryStatus {
  std::string              layer_id;
  std::uint64_t            cached_file_count = 0;
  std::uint64_t            total_file_count  = 0;
  std::vector<std::string> missing_files;
  bool                     is_complete           = false;
  std::uint64_t            cached_bytes_estimate = 0;
  std::uint64_t            total_bytes           = 0;
};

struct RepairResult {
  bool          verified  = false;
  std::uint64_t repaired  = 0;
  std::uint64_t failed    = 0;
  bool          cancelled = false;
};

} // namespace skycache::model
