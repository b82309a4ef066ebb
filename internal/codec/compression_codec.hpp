#pragma once

#include <arrow/buffer.h>
#include <arrow/util/compression.h>

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace skycache::runtime::config {
class CompressionConfig;
}

namespace skycache::codec {

/*
  In-band marker written in front of every compressed blob:

      "SKZ" 0x01 | original length (uint64, little endian) | gzip stream

  Blobs without the marker are stored verbatim.
*/
inline constexpr std::uint8_t kMarkerMagic[4]  = {'S', 'K', 'Z', 0x01};
inline constexpr std::size_t  kMarkerSize      = 12;
inline constexpr std::uint64_t kDefaultMinSize = 1024;
// deflate cannot expand input by more than this factor
inline constexpr std::uint64_t kMaxDeflateRatio = 1032;

struct CodecOptions {
  bool          enabled        = true;
  std::uint64_t min_size_bytes = kDefaultMinSize;

  static CodecOptions FromConfig(const skycache::runtime::config::CompressionConfig& cfg);
};

struct CompressedPayload {
  bool                           is_compressed = false;
  std::shared_ptr<arrow::Buffer> data;
  std::uint64_t                  original_size_bytes   = 0;
  std::uint64_t                  compressed_size_bytes = 0;
};

/*
  Conditional GZIP compression for cached payloads.

  Never throws from Compress/Decompress: codec faults are logged and
  the input passes through unchanged.
*/
class CompressionCodec {
 public:
  explicit CompressionCodec(CodecOptions options = {});

  bool IsAvailable() const {
    return codec_ != nullptr && options_.enabled;
  }

  const CodecOptions& Options() const {
    return options_;
  }

  bool ShouldCompress(const arrow::Buffer& payload, std::string_view content_type) const;

  CompressedPayload Compress(const std::shared_ptr<arrow::Buffer>& payload) const;

  std::shared_ptr<arrow::Buffer> Decompress(const std::shared_ptr<arrow::Buffer>& stored) const;

  static bool HasMarker(const arrow::Buffer& bytes);

  /*
    Largest original length a marker may claim for a blob of
    `stored_bytes`; larger claims are rejected before allocating.
  */
  static std::uint64_t MaxDecodedSize(std::uint64_t stored_bytes);

  static bool IsCompressibleContentType(std::string_view content_type);

 private:
  std::shared_ptr<arrow::Buffer> CompressOrThrow(const arrow::Buffer& payload) const;
  std::shared_ptr<arrow::Buffer> DecompressOrThrow(const arrow::Buffer& stored) const;

  CodecOptions                        options_;
  std::shared_ptr<arrow::util::Codec> codec_;
};

} // namespace skycache::codec
