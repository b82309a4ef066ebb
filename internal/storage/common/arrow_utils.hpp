#pragma once

#include <arrow/buffer.h>
#include <arrow/result.h>
#include <arrow/status.h>

#include <cstdint>
#include <cstring>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace skycache::storage::common {

/*
  Helper: unwrap Arrow Result<T> or throw std::runtime_error
*/
template <typename T>
T Unwrap(const arrow::Result<T>& result) {
  if (!result.ok()) throw std::runtime_error(result.status().ToString());
  return *result;
}

template <typename T>
T Unwrap(arrow::Result<T>&& result) {
  if (!result.ok()) throw std::runtime_error(result.status().ToString());
  return std::move(result).ValueOrDie();
}

inline void Unwrap(const arrow::Status& status) {
  if (!status.ok()) throw std::runtime_error(status.ToString());
}

/*
  Owning copy of `bytes` in a fresh Arrow buffer.
*/
inline std::shared_ptr<arrow::Buffer> CopyToBuffer(std::string_view bytes) {
  auto buffer = Unwrap(arrow::AllocateBuffer(static_cast<int64_t>(bytes.size())));
  if (!bytes.empty()) {
    std::memcpy(buffer->mutable_data(), bytes.data(), bytes.size());
  }
  return std::shared_ptr<arrow::Buffer>(std::move(buffer));
}

inline std::shared_ptr<arrow::Buffer> CopyToBuffer(const std::uint8_t* data, int64_t size) {
  return CopyToBuffer(std::string_view(reinterpret_cast<const char*>(data), static_cast<size_t>(size)));
}

/*
  Zero-copy wrap of a string; the buffer owns the string.
*/
inline std::shared_ptr<arrow::Buffer> WrapString(std::string bytes) {
  return arrow::Buffer::FromString(std::move(bytes));
}

inline std::string ToString(const std::shared_ptr<arrow::Buffer>& buffer) {
  if (!buffer) return {};
  return buffer->ToString();
}

inline int64_t BufferSize(const std::shared_ptr<arrow::Buffer>& buffer) {
  return buffer ? buffer->size() : 0;
}

} // namespace skycache::storage::common
