#include "tile_addressing.hpp"

#include <cctype>
#include <stdexcept>

namespace skycache::hips {

namespace {

void CheckOrder(int order) {
  if (order < 0 || order > kMaxHipsOrder) {
    throw std::out_of_range("HiPS order " + std::to_string(order) + " outside [0, " + std::to_string(kMaxHipsOrder) + "]");
  }
}

} // namespace

std::uint64_t TileCountForOrder(int order) {
  CheckOrder(order);
  return 12ULL << (2 * order);
}

std::uint64_t TotalTilesThroughOrder(int order) {
  CheckOrder(order);

  std::uint64_t total = 0;
  for (int o = 0; o <= order; ++o) {
    total += TileCountForOrder(o);
  }
  return total;
}

model::HiPSTileAddress MakeTileAddress(int order, std::uint64_t pixel_index) {
  if (pixel_index >= TileCountForOrder(order)) {
    throw std::out_of_range("pixel " + std::to_string(pixel_index) + " outside order " + std::to_string(order));
  }

  model::HiPSTileAddress address;
  address.order            = order;
  address.pixel_index      = pixel_index;
  address.directory_bucket = (pixel_index / kDirectoryBucketSize) * kDirectoryBucketSize;
  return address;
}

std::string TileExtension(std::string_view tile_format) {
  while (!tile_format.empty() && std::isspace(static_cast<unsigned char>(tile_format.front()))) {
    tile_format.remove_prefix(1);
  }

  auto end = tile_format.find_first_of(" \t");
  auto first = std::string(tile_format.substr(0, end));
  if (first.empty()) {
    return "jpg";
  }
  if (first == "jpeg") {
    return "jpg";
  }
  return first;
}

std::string TileUrl(const model::HiPSSurvey& survey, const model::HiPSTileAddress& address) {
  std::string url = survey.url;
  if (url.empty() || url.back() != '/') {
    url.push_back('/');
  }

  url += "Norder" + std::to_string(address.order);
  url += "/Dir" + std::to_string(address.directory_bucket);
  url += "/Npix" + std::to_string(address.pixel_index);
  url += "." + TileExtension(survey.tile_format);
  return url;
}

std::optional<int> ParseOrderFromKey(std::string_view key) {
  constexpr std::string_view kMarker = "/Norder";

  auto pos = key.rfind(kMarker);
  if (pos == std::string_view::npos) return std::nullopt;

  auto digits = key.substr(pos + kMarker.size());
  int  order  = 0;
  std::size_t n = 0;
  while (n < digits.size() && std::isdigit(static_cast<unsigned char>(digits[n]))) {
    order = order * 10 + (digits[n] - '0');
    if (order > kMaxHipsOrder) return std::nullopt;
    ++n;
  }

  if (n == 0 || (n < digits.size() && digits[n] != '/')) return std::nullopt;
  return order;
}

std::uint64_t EstimateSurveyBytes(int max_order, std::uint64_t average_tile_bytes) {
  return TotalTilesThroughOrder(max_order) * average_tile_bytes;
}

} // namespace skycache::hips
