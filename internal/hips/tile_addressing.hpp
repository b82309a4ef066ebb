#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "internal/model/hips.hpp"

namespace skycache::hips {

// HEALPix nside = 2^order must fit in 29 bits for 64-bit pixel indices.
inline constexpr int kMaxHipsOrder = 29;

inline constexpr std::uint64_t kDirectoryBucketSize = 10000;

// 12 * 4^order
std::uint64_t TileCountForOrder(int order);

// sum of TileCountForOrder(0..order)
std::uint64_t TotalTilesThroughOrder(int order);

/*
  Throws std::out_of_range for order outside [0, kMaxHipsOrder] or a
  pixel outside [0, TileCountForOrder(order)).
*/
model::HiPSTileAddress MakeTileAddress(int order, std::uint64_t pixel_index);

/*
  "jpeg" → "jpg"; other formats verbatim. For a space-separated list
  the first entry wins.
*/
std::string TileExtension(std::string_view tile_format);

/*
  {url}Norder{o}/Dir{bucket}/Npix{pix}.{ext}
*/
std::string TileUrl(const model::HiPSSurvey& survey, const model::HiPSTileAddress& address);

/*
  Order embedded in a tile key ("/Norder3/..." → 3); nullopt when the
  key has no Norder segment.
*/
std::optional<int> ParseOrderFromKey(std::string_view key);

std::uint64_t EstimateSurveyBytes(int max_order, std::uint64_t average_tile_bytes);

} // namespace skycache::hips
