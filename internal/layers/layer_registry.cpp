#include "layer_registry.hpp"

#include <algorithm>
#include <set>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace skycache::layers {

using model::LayerDescriptor;

namespace {

constexpr std::uint64_t kKiB = 1024;
constexpr std::uint64_t kMiB = 1024 * kKiB;

bool IsAbsoluteUrl(const std::string& url) {
  return url.find("://") != std::string::npos;
}

} // namespace

std::vector<LayerDescriptor> LayerRegistry::BuiltinLayers() {
  return {
      {"core", "Core Engine", "WebAssembly engine and core scripts", "/stellarium-js/",
       {"stellarium-web-engine.js", "stellarium-web-engine.wasm"}, 15 * kMiB, 0},
      {"stars", "Star Catalog", "Basic star catalog data", "/stellarium-data/stars/",
       {"info.json", "stars_0.json", "stars_1.json", "stars_2.json"}, 5 * kMiB, 1},
      {"dso", "Deep Sky Objects", "Galaxies, nebulae, and clusters", "/stellarium-data/dso/", {"info.json", "dso.json"}, 2 * kMiB, 2},
      {"skycultures", "Sky Cultures", "Constellation lines and names", "/stellarium-data/skycultures/western/",
       {"info.json", "constellations.json", "star_names.json"}, 500 * kKiB, 3},
      {"planets", "Solar System", "Planet textures and orbital data", "/stellarium-data/surveys/sso/",
       {"info.json", "moon/info.json", "sun/info.json", "mercury/info.json", "venus/info.json", "mars/info.json", "jupiter/info.json",
        "saturn/info.json"},
       10 * kMiB, 4},
      {"dss", "DSS Survey", "Digital Sky Survey images (basic tiles)", "/stellarium-data/surveys/dss/", {"info.json", "properties"}, 1 * kMiB, 5},
      {"milkyway", "Milky Way", "Milky Way panorama", "/stellarium-data/surveys/milkyway/", {"info.json", "properties"}, 5 * kMiB, 6},
      {"comets", "Comets & Asteroids", "Minor body orbital elements", "/stellarium-data/", {"CometEls.txt", "mpcorb.dat"}, 20 * kMiB, 7},
  };
}

LayerRegistry::LayerRegistry(std::vector<LayerDescriptor> layers, std::string data_origin)
    : layers_(std::move(layers)), data_origin_(std::move(data_origin)) {
  while (!data_origin_.empty() && data_origin_.back() == '/') {
    data_origin_.pop_back();
  }

  std::set<std::string> ids;
  for (const auto& layer : layers_) {
    if (layer.id.empty()) {
      throw std::invalid_argument("layer id must not be empty");
    }
    if (layer.files.empty()) {
      throw std::invalid_argument("layer '" + layer.id + "' declares no files");
    }
    if (!ids.insert(layer.id).second) {
      throw std::invalid_argument("duplicate layer id '" + layer.id + "'");
    }
  }
}

const LayerDescriptor* LayerRegistry::Find(const std::string& id) const {
  auto it = std::find_if(layers_.begin(), layers_.end(), [&](const LayerDescriptor& layer) { return layer.id == id; });
  return it == layers_.end() ? nullptr : &*it;
}

const LayerDescriptor& LayerRegistry::Get(const std::string& id) const {
  const auto* layer = Find(id);
  if (!layer) {
    throw util::NotFound("unknown layer: " + id);
  }
  return *layer;
}

std::vector<LayerDescriptor> LayerRegistry::SortedByPriority() const {
  auto sorted = layers_;
  std::stable_sort(sorted.begin(), sorted.end(), [](const LayerDescriptor& a, const LayerDescriptor& b) { return a.priority < b.priority; });
  return sorted;
}

std::string LayerRegistry::ResolveUrl(const LayerDescriptor& layer, const std::string& file) const {
  return ResolveUrl(layer.base_url + file);
}

/*
  "/path" → "{origin}/path" when an origin is configured.
  Absolute URLs, and everything when no origin is set, pass through.
*/
std::string LayerRegistry::ResolveUrl(const std::string& url) const {
  if (data_origin_.empty() || IsAbsoluteUrl(url)) {
    return url;
  }
  if (url.rfind("//", 0) == 0) {
    return url;
  }
  if (!url.empty() && url.front() == '/') {
    return data_origin_ + url;
  }
  return data_origin_ + "/" + url;
}

} // namespace skycache::layers
