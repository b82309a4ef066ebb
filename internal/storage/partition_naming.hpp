#pragma once

#include <string>
#include <string_view>

namespace skycache::runtime::config {
class NamingConfig;
}

namespace skycache::storage {

// Bumped whenever a stored layout changes; partitions embed it as -v<N>.
inline constexpr int kCacheSchemaVersion = 1;

/*
  Partition names: {prefix}{id}-v{schema_version}

      skymap-offline-stars-v1
      skymap-hips-CDS_P_DSS2_color-v1
      skymap-unified-cache-v1

  All prefixes live under cache_prefix so reset and legacy cleanup can
  find every partition this system ever created.
*/
struct PartitionNaming {
  std::string cache_prefix   = "skymap-";
  std::string layer_prefix   = "skymap-offline-";
  std::string hips_prefix    = "skymap-hips-";
  std::string unified_prefix = "skymap-unified-";
  int         schema_version = kCacheSchemaVersion;

  static PartitionNaming FromConfig(const skycache::runtime::config::NamingConfig& cfg);

  std::string LayerPartition(std::string_view layer_id) const;
  std::string HipsPartition(std::string_view survey_id) const;
  std::string UnifiedPartition(std::string_view name = "cache") const;

  // survey ids contain '/' ("CDS/P/DSS2/color")
  static std::string SanitizeId(std::string_view id);

  // true if name ends with -v<digits>
  static bool HasVersionSuffix(std::string_view name);
};

} // namespace skycache::storage
