#include "compression_codec.hpp"

#include <arrow/io/compressed.h>
#include <arrow/io/memory.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cstring>
#include <stdexcept>
#include <string>

#include "config/config.pb.h"
#include "internal/observability/logging.hpp"
#include "internal/storage/common/arrow_utils.hpp"

namespace skycache::codec {

using storage::common::Unwrap;

namespace {

constexpr std::array<std::string_view, 7> kCompressibleTypes = {"text/", "json", "javascript", "xml", "csv", "yaml", "x-ndjson"};

void EncodeLength(std::uint64_t value, std::uint8_t* out) {
  for (int i = 0; i < 8; ++i) {
    out[i] = static_cast<std::uint8_t>((value >> (8 * i)) & 0xff);
  }
}

std::uint64_t DecodeLength(const std::uint8_t* in) {
  std::uint64_t value = 0;
  for (int i = 0; i < 8; ++i) {
    value |= static_cast<std::uint64_t>(in[i]) << (8 * i);
  }
  return value;
}

std::string Lowercase(std::string_view text) {
  std::string out(text);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

} // namespace

CodecOptions CodecOptions::FromConfig(const skycache::runtime::config::CompressionConfig& cfg) {
  CodecOptions options;
  options.enabled = !cfg.disabled();
  if (cfg.min_size_bytes() > 0) {
    options.min_size_bytes = cfg.min_size_bytes();
  }
  return options;
}

CompressionCodec::CompressionCodec(CodecOptions options) : options_(options) {
  if (!arrow::util::Codec::IsAvailable(arrow::Compression::GZIP)) {
    SKYCACHE_LOG_WARN("gzip codec not built into arrow; cached payloads stay uncompressed");
    return;
  }

  auto codec = arrow::util::Codec::Create(arrow::Compression::GZIP);
  if (!codec.ok()) {
    SKYCACHE_LOG_WARN("gzip codec unavailable", {observability::StringField("error", codec.status().ToString())});
    return;
  }
  codec_ = std::shared_ptr<arrow::util::Codec>(std::move(codec).ValueOrDie());
}

bool CompressionCodec::IsCompressibleContentType(std::string_view content_type) {
  const std::string lowered = Lowercase(content_type);
  for (auto needle : kCompressibleTypes) {
    if (lowered.find(needle) != std::string::npos) return true;
  }
  return false;
}

bool CompressionCodec::HasMarker(const arrow::Buffer& bytes) {
  return static_cast<std::size_t>(bytes.size()) >= kMarkerSize && std::memcmp(bytes.data(), kMarkerMagic, sizeof(kMarkerMagic)) == 0;
}

std::uint64_t CompressionCodec::MaxDecodedSize(std::uint64_t stored_bytes) {
  if (stored_bytes <= kMarkerSize) return 0;
  return (stored_bytes - kMarkerSize) * kMaxDeflateRatio;
}

bool CompressionCodec::ShouldCompress(const arrow::Buffer& payload, std::string_view content_type) const {
  if (!IsAvailable()) return false;
  if (static_cast<std::uint64_t>(payload.size()) <= options_.min_size_bytes) return false;
  return IsCompressibleContentType(content_type);
}

// ------------------------------------------------------------------
// Compress
// ------------------------------------------------------------------

std::shared_ptr<arrow::Buffer> CompressionCodec::CompressOrThrow(const arrow::Buffer& payload) const {
  auto sink = Unwrap(arrow::io::BufferOutputStream::Create(payload.size() / 2 + static_cast<int64_t>(kMarkerSize)));

  std::uint8_t header[kMarkerSize];
  std::memcpy(header, kMarkerMagic, sizeof(kMarkerMagic));
  EncodeLength(static_cast<std::uint64_t>(payload.size()), header + sizeof(kMarkerMagic));
  Unwrap(sink->Write(header, sizeof(header)));

  // closing the compressed stream flushes the gzip trailer and closes sink
  auto compressed = Unwrap(arrow::io::CompressedOutputStream::Make(codec_.get(), sink));
  Unwrap(compressed->Write(payload.data(), payload.size()));
  Unwrap(compressed->Close());

  return Unwrap(sink->Finish());
}

CompressedPayload CompressionCodec::Compress(const std::shared_ptr<arrow::Buffer>& payload) const {
  CompressedPayload result;
  result.data                  = payload;
  result.original_size_bytes   = static_cast<std::uint64_t>(storage::common::BufferSize(payload));
  result.compressed_size_bytes = result.original_size_bytes;

  if (!payload || !IsAvailable()) return result;

  try {
    auto compressed = CompressOrThrow(*payload);
    if (compressed->size() < payload->size()) {
      result.is_compressed         = true;
      result.data                  = std::move(compressed);
      result.compressed_size_bytes = static_cast<std::uint64_t>(result.data->size());
    }
  } catch (const std::exception& e) {
    SKYCACHE_LOG_WARN("compression failed; storing uncompressed", {observability::StringField("error", e.what())});
  }
  return result;
}

// ------------------------------------------------------------------
// Decompress
// ------------------------------------------------------------------

std::shared_ptr<arrow::Buffer> CompressionCodec::DecompressOrThrow(const arrow::Buffer& stored) const {
  if (!codec_) {
    throw std::runtime_error("gzip codec unavailable");
  }

  const std::uint64_t original_size = DecodeLength(stored.data() + sizeof(kMarkerMagic));
  if (original_size > MaxDecodedSize(static_cast<std::uint64_t>(stored.size()))) {
    throw std::runtime_error("marker claims " + std::to_string(original_size) + " bytes from a " + std::to_string(stored.size()) +
                             " byte blob");
  }

  auto body = std::make_shared<arrow::Buffer>(stored.data() + kMarkerSize, stored.size() - static_cast<int64_t>(kMarkerSize));
  auto raw  = std::make_shared<arrow::io::BufferReader>(body);
  auto in   = Unwrap(arrow::io::CompressedInputStream::Make(codec_.get(), raw));

  auto out = Unwrap(arrow::AllocateBuffer(static_cast<int64_t>(original_size)));

  int64_t filled = 0;
  while (filled < static_cast<int64_t>(original_size)) {
    int64_t n = Unwrap(in->Read(static_cast<int64_t>(original_size) - filled, out->mutable_data() + filled));
    if (n == 0) break;
    filled += n;
  }

  std::uint8_t trailing = 0;
  if (filled != static_cast<int64_t>(original_size) || Unwrap(in->Read(1, &trailing)) != 0) {
    throw std::runtime_error("decompressed length does not match marker");
  }

  return std::shared_ptr<arrow::Buffer>(std::move(out));
}

/*
  Works whether or not compression is currently enabled: blobs written
  while it was on must stay readable after it is switched off.
*/
std::shared_ptr<arrow::Buffer> CompressionCodec::Decompress(const std::shared_ptr<arrow::Buffer>& stored) const {
  if (!stored || !HasMarker(*stored)) return stored;

  try {
    return DecompressOrThrow(*stored);
  } catch (const std::exception& e) {
    SKYCACHE_LOG_ERROR("decompression failed; returning stored bytes", {observability::StringField("error", e.what())});
    return stored;
  }
}

} // namespace skycache::codec
