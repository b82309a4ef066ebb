#pragma once

#include <string>
#include <vector>

#include "internal/model/layer.hpp"

namespace skycache::layers {

/*
  Compiled-in catalogue of downloadable data layers.

  Layer base URLs are usually origin-relative ("/stellarium-data/...");
  ResolveUrl joins them with the configured data origin. The resolved
  URL is the blob key, so status queries and downloads must resolve the
  same way.
*/
class LayerRegistry {
 public:
  explicit LayerRegistry(std::vector<model::LayerDescriptor> layers = BuiltinLayers(), std::string data_origin = "");

  static std::vector<model::LayerDescriptor> BuiltinLayers();

  const model::LayerDescriptor* Find(const std::string& id) const;

  // throws util::NotFound
  const model::LayerDescriptor& Get(const std::string& id) const;

  // registry order
  const std::vector<model::LayerDescriptor>& All() const {
    return layers_;
  }

  std::vector<model::LayerDescriptor> SortedByPriority() const;

  std::string ResolveUrl(const model::LayerDescriptor& layer, const std::string& file) const;

  std::string ResolveUrl(const std::string& url) const;

  const std::string& DataOrigin() const {
    return data_origin_;
  }

 private:
  std::vector<model::LayerDescriptor> layers_;
  std::string                         data_origin_;
};

} // namespace skycache::layers
