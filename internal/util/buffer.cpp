#include "buffer.hpp"

#include <arrow/memory_pool.h>

#include <cstdint>
#include <cstring>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace draft::util {

namespace {

constexpr std::size_t kMinPdfBytes = 32;
constexpr char        kPdfMagic[]  = "%PDF-";

} // namespace

std::shared_ptr<arrow::Buffer> CopyBytes(const void* data, std::size_t size) {
  auto maybe_buffer = arrow::AllocateBuffer(static_cast<int64_t>(size));
  if (!maybe_buffer.ok()) {
    throw std::runtime_error("buffer copy allocate failed: " + maybe_buffer.status().ToString());
  }

  std::shared_ptr<arrow::Buffer> buffer(std::move(*maybe_buffer));
  if (size > 0) {
    std::memcpy(buffer->mutable_data(), data, size);
  }
  return buffer;
}

std::shared_ptr<arrow::Buffer> CopyBuffer(const arrow::Buffer& source) {
  return CopyBytes(source.data(), static_cast<std::size_t>(source.size()));
}

std::shared_ptr<arrow::Buffer> BufferFromString(std::string_view bytes) {
  return CopyBytes(bytes.data(), bytes.size());
}

std::string Checksum(const arrow::Buffer& buffer) {
  uint64_t hash = 0xcbf29ce484222325ULL;
  for (int64_t i = 0; i < buffer.size(); ++i) {
    hash ^= buffer.data()[i];
    hash *= 0x100000001b3ULL;
  }

  std::ostringstream out;
  out << std::hex << std::setw(16) << std::setfill('0') << hash;
  return out.str();
}

bool IsValidPdfBuffer(const std::shared_ptr<arrow::Buffer>& buffer) {
  if (!buffer || static_cast<std::size_t>(buffer->size()) < kMinPdfBytes) {
    return false;
  }
  return std::memcmp(buffer->data(), kPdfMagic, sizeof(kPdfMagic) - 1) == 0;
}

} // namespace draft::util
