#pragma once

#include <cstdint>
#include <optional>

#include "internal/db/api/repository.hpp"

namespace draft::quota {

/*
  Aggregate footprint of the record store.

  Always derived from the drafts and versions collections; orphaned
  versions count until pruned.
*/
struct StorageUsage {
  uint64_t total_bytes   = 0;
  uint64_t draft_bytes   = 0;
  uint64_t version_bytes = 0;
  uint64_t draft_count   = 0;
  uint64_t version_count = 0;

  bool OverLimit(uint64_t limit_bytes) const {
    return total_bytes > limit_bytes;
  }
};

StorageUsage MeasureUsage(db::Repository& repository, db::Transaction& tx);

/*
  Recomputes usage and writes the storage_metadata row. last_cleanup_ms
  replaces the stored value when provided, otherwise it is carried over.
*/
StorageUsage RecordUsage(db::Repository& repository, db::Transaction& tx, std::optional<uint64_t> last_cleanup_ms = std::nullopt);

} // namespace draft::quota
