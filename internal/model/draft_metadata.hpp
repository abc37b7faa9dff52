#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/draft_status.hpp"
#include "internal/model/field_values.hpp"

namespace draft::model {

/*
  Payload-free views handed to callers (listings, history, upload sync).
*/

struct DraftMetadata {
  std::string id;
  uint64_t    version = 0;
  FieldValues field_values;
  uint64_t    last_modified_ms = 0;
  uint64_t    created_at_ms    = 0;
  DraftStatus status           = DraftStatus::kDraft;
  uint64_t    size_bytes       = 0;

  std::optional<std::string> checksum;
};

struct VersionMetadata {
  std::string id; // "{document_id}_v{version}"
  std::string document_id;
  uint64_t    version = 0;
  FieldValues field_values;
  uint64_t    created_at_ms = 0;
  uint64_t    size_bytes    = 0;
};

} // namespace draft::model
