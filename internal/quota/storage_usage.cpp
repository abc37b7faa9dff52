#include "storage_usage.hpp"

namespace draft::quota {

StorageUsage MeasureUsage(db::Repository& repository, db::Transaction& tx) {
  StorageUsage usage;

  for (const auto& draft : repository.ListDrafts(tx)) {
    usage.draft_bytes += draft.size_bytes;
    usage.draft_count++;
  }
  for (const auto& version : repository.ListVersions(tx)) {
    usage.version_bytes += version.size_bytes;
    usage.version_count++;
  }

  usage.total_bytes = usage.draft_bytes + usage.version_bytes;
  return usage;
}

StorageUsage RecordUsage(db::Repository& repository, db::Transaction& tx, std::optional<uint64_t> last_cleanup_ms) {
  const auto usage = MeasureUsage(repository, tx);

  db::model::StorageMetadataRecord record;
  record.total_size_bytes = usage.total_bytes;
  record.draft_count      = usage.draft_count;

  if (last_cleanup_ms) {
    record.last_cleanup_ms = *last_cleanup_ms;
  } else if (auto existing = repository.GetStorageMetadata(tx)) {
    record.last_cleanup_ms = existing->last_cleanup_ms;
  }

  db::ThrowIfError(repository.PutStorageMetadata(tx, record), "record storage usage");
  return usage;
}

} // namespace draft::quota
