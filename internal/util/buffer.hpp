#pragma once

#include <arrow/buffer.h>

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>

namespace draft::util {

/*
  Buffer helpers.

  Every buffer that crosses a tier boundary (caller <-> engine, cache,
  record store, filesystem) is copied through these. A holder may mutate or
  reuse its buffer at any time, so no two holders ever share the same
  mutable memory.
*/

// Allocates a new mutable buffer holding a copy of `size` bytes at `data`.
std::shared_ptr<arrow::Buffer> CopyBytes(const void* data, std::size_t size);

// Deep copy; the result never aliases `source`.
std::shared_ptr<arrow::Buffer> CopyBuffer(const arrow::Buffer& source);

std::shared_ptr<arrow::Buffer> BufferFromString(std::string_view bytes);

inline bool IsEmpty(const std::shared_ptr<arrow::Buffer>& buffer) {
  return !buffer || buffer->size() == 0;
}

// FNV-1a 64, lowercase hex. Integrity marker, not a security digest.
std::string Checksum(const arrow::Buffer& buffer);

// %PDF- signature on a buffer of plausible minimum size.
bool IsValidPdfBuffer(const std::shared_ptr<arrow::Buffer>& buffer);

} // namespace draft::util
