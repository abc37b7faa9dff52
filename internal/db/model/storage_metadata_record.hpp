#pragma once

#include <cstdint>
#include <string>

namespace draft::db::model {

/*
  Singleton aggregate row (collection "storage_metadata", id "storage").

  A cached readout only. Totals are always derived from drafts + versions.
*/
struct StorageMetadataRecord {
  static constexpr const char* kSingletonId = "storage";

  std::string id = kSingletonId;

  uint64_t total_size_bytes = 0;
  uint64_t draft_count      = 0;
  uint64_t last_cleanup_ms  = 0;
};

} // namespace draft::db::model
