#include "partition_naming.hpp"

#include <cctype>
#include <initializer_list>
#include <stdexcept>

#include "config/config.pb.h"

namespace skycache::storage {

namespace {

bool StartsWith(std::string_view text, std::string_view prefix) {
  return text.substr(0, prefix.size()) == prefix;
}

std::string Compose(const std::string& prefix, std::string_view id, int version) {
  std::string name = prefix;
  name.append(id);
  name.append("-v");
  name.append(std::to_string(version));
  return name;
}

} // namespace

PartitionNaming PartitionNaming::FromConfig(const skycache::runtime::config::NamingConfig& cfg) {
  PartitionNaming naming;
  if (!cfg.cache_prefix().empty()) naming.cache_prefix = cfg.cache_prefix();
  if (!cfg.layer_prefix().empty()) naming.layer_prefix = cfg.layer_prefix();
  if (!cfg.hips_prefix().empty()) naming.hips_prefix = cfg.hips_prefix();
  if (!cfg.unified_prefix().empty()) naming.unified_prefix = cfg.unified_prefix();

  for (const auto* prefix : {&naming.layer_prefix, &naming.hips_prefix, &naming.unified_prefix}) {
    if (!StartsWith(*prefix, naming.cache_prefix)) {
      throw std::invalid_argument("partition prefix '" + *prefix + "' is not under cache prefix '" + naming.cache_prefix + "'");
    }
  }
  return naming;
}

std::string PartitionNaming::LayerPartition(std::string_view layer_id) const {
  return Compose(layer_prefix, layer_id, schema_version);
}

std::string PartitionNaming::HipsPartition(std::string_view survey_id) const {
  return Compose(hips_prefix, SanitizeId(survey_id), schema_version);
}

std::string PartitionNaming::UnifiedPartition(std::string_view name) const {
  return Compose(unified_prefix, name, schema_version);
}

std::string PartitionNaming::SanitizeId(std::string_view id) {
  std::string out(id);
  for (auto& c : out) {
    if (c == '/' || std::isspace(static_cast<unsigned char>(c))) {
      c = '_';
    }
  }
  return out;
}

bool PartitionNaming::HasVersionSuffix(std::string_view name) {
  auto pos = name.rfind("-v");
  if (pos == std::string_view::npos || pos + 2 == name.size()) return false;

  for (auto c : name.substr(pos + 2)) {
    if (!std::isdigit(static_cast<unsigned char>(c))) return false;
  }
  return true;
}

} // namespace skycache::storage
