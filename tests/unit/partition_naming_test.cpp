#include "internal/storage/partition_naming.hpp"

#include <cassert>
#include <iostream>
#include <stdexcept>

#include "config/config.pb.h"

namespace {

using skycache::storage::PartitionNaming;

void TestDefaultNames() {
  PartitionNaming naming;
  assert(naming.LayerPartition("stars") == "skymap-offline-stars-v1");
  assert(naming.HipsPartition("CDS/P/DSS2/color") == "skymap-hips-CDS_P_DSS2_color-v1");
  assert(naming.UnifiedPartition() == "skymap-unified-cache-v1");

  naming.schema_version = 2;
  assert(naming.LayerPartition("dso") == "skymap-offline-dso-v2");
}

void TestVersionSuffix() {
  assert(PartitionNaming::HasVersionSuffix("skymap-offline-stars-v1"));
  assert(PartitionNaming::HasVersionSuffix("skymap-hips-CDS_P_DSS2_color-v12"));
  assert(!PartitionNaming::HasVersionSuffix("skymap-offline-stars"));
  assert(!PartitionNaming::HasVersionSuffix("skymap-offline-stars-v"));
  assert(!PartitionNaming::HasVersionSuffix("skymap-offline-stars-vx"));
}

void TestFromConfig() {
  skycache::runtime::config::NamingConfig cfg;
  cfg.set_cache_prefix("sky-");
  cfg.set_layer_prefix("sky-layer-");
  cfg.set_hips_prefix("sky-hips-");
  cfg.set_unified_prefix("sky-url-");

  auto naming = PartitionNaming::FromConfig(cfg);
  assert(naming.LayerPartition("stars") == "sky-layer-stars-v1");

  cfg.set_hips_prefix("other-hips-");
  bool threw = false;
  try {
    (void)PartitionNaming::FromConfig(cfg);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw && "prefixes outside the cache prefix must be rejected");
}

} // namespace

int main() {
  TestDefaultNames();
  TestVersionSuffix();
  TestFromConfig();

  std::cout << "skycache_unit_partition_naming: pass\n";
  return 0;
}
