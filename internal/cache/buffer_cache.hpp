#pragma once

#include <arrow/buffer.h>

#include <cstddef>
#include <cstdint>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace draft::cache {

/*
  In-memory tier for draft payloads.

  - Put stores a private copy, Get hands out a fresh copy. No caller ever
    shares memory with the cache.
  - FIFO eviction by insertion order once the byte budget would be
    exceeded. Get does not refresh an entry; re-putting an id moves it to
    the back.
  - Entries larger than the whole budget are not cached.

  Thread safety:
    - single mutex around the index
*/

class BufferCache {
 public:
  static constexpr uint64_t kDefaultMaxBytes = 50ULL * 1024 * 1024;

  explicit BufferCache(uint64_t max_bytes = kDefaultMaxBytes);

  void Put(const std::string& id, const arrow::Buffer& buffer);

  // nullptr on miss.
  std::shared_ptr<arrow::Buffer> Get(const std::string& id) const;

  void Evict(const std::string& id);
  void Clear();

  uint64_t CurrentBytes() const;
  std::size_t Size() const;

  uint64_t MaxBytes() const {
    return max_bytes_;
  }

 private:
  struct Entry {
    std::shared_ptr<arrow::Buffer>   buffer;
    std::list<std::string>::iterator order;
  };

  void EraseLocked(std::unordered_map<std::string, Entry>::iterator it);

  const uint64_t max_bytes_;

  mutable std::mutex                     mutex_;
  std::list<std::string>                 order_; // front = oldest insert
  std::unordered_map<std::string, Entry> entries_;
  uint64_t                               current_bytes_ = 0;
};

} // namespace draft::cache
