#include "buffer_cache.hpp"

#include <iterator>

#include "internal/observability/logging.hpp"
#include "internal/util/buffer.hpp"

namespace draft::cache {

using observability::StringField;
using observability::UintField;

BufferCache::BufferCache(uint64_t max_bytes) : max_bytes_(max_bytes) {
}

// ------------------------------------------------------------
// Put
// ------------------------------------------------------------

void BufferCache::Put(const std::string& id, const arrow::Buffer& buffer) {
  const auto size = static_cast<uint64_t>(buffer.size());

  std::scoped_lock lock(mutex_);

  if (auto it = entries_.find(id); it != entries_.end()) {
    EraseLocked(it);
  }

  if (size > max_bytes_) {
    DRAFT_LOG_DEBUG("cache skip oversize entry", {StringField("document_id", id), UintField("size_bytes", size)});
    return;
  }

  while (!order_.empty() && current_bytes_ + size > max_bytes_) {
    auto victim = entries_.find(order_.front());
    DRAFT_LOG_DEBUG("cache evict", {StringField("document_id", victim->first)});
    EraseLocked(victim);
  }

  order_.push_back(id);
  entries_.emplace(id, Entry{util::CopyBuffer(buffer), std::prev(order_.end())});
  current_bytes_ += size;
}

// ------------------------------------------------------------
// Get
// ------------------------------------------------------------

std::shared_ptr<arrow::Buffer> BufferCache::Get(const std::string& id) const {
  std::scoped_lock lock(mutex_);

  auto it = entries_.find(id);
  if (it == entries_.end()) return nullptr;
  return util::CopyBuffer(*it->second.buffer);
}

// ------------------------------------------------------------
// Evict / Clear
// ------------------------------------------------------------

void BufferCache::Evict(const std::string& id) {
  std::scoped_lock lock(mutex_);

  if (auto it = entries_.find(id); it != entries_.end()) {
    EraseLocked(it);
  }
}

void BufferCache::Clear() {
  std::scoped_lock lock(mutex_);
  entries_.clear();
  order_.clear();
  current_bytes_ = 0;
}

uint64_t BufferCache::CurrentBytes() const {
  std::scoped_lock lock(mutex_);
  return current_bytes_;
}

std::size_t BufferCache::Size() const {
  std::scoped_lock lock(mutex_);
  return entries_.size();
}

void BufferCache::EraseLocked(std::unordered_map<std::string, Entry>::iterator it) {
  current_bytes_ -= static_cast<uint64_t>(it->second.buffer->size());
  order_.erase(it->second.order);
  entries_.erase(it);
}

} // namespace draft::cache
