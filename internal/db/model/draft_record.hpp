#pragma once

#include <arrow/buffer.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "internal/model/draft_metadata.hpp"
#include "internal/model/draft_status.hpp"
#include "internal/model/field_values.hpp"

namespace draft::db::model {

using draft::model::DraftStatus;
using draft::model::FieldValues;

/*
  Persistent draft row (collection "drafts").

  IMPORTANT:
  - This is the authoritative record; cache and filesystem hold copies.
  - Version strictly increases per id.
  - Records are immutable snapshots: updates build a new record through
    the With* helpers and put it back.
  - Listing calls leave `payload` null.
*/
struct DraftRecord {
  std::string id;

  std::shared_ptr<arrow::Buffer> payload;

  uint64_t    version = 0;
  FieldValues field_values;

  uint64_t last_modified_ms = 0;
  uint64_t created_at_ms    = 0;

  DraftStatus status = DraftStatus::kDraft;

  uint64_t size_bytes = 0;

  std::optional<std::string> checksum;
};

inline DraftRecord WithFieldValues(const DraftRecord& base, FieldValues field_values, uint64_t now_ms) {
  DraftRecord next      = base;
  next.field_values     = std::move(field_values);
  next.last_modified_ms = now_ms;
  return next;
}

inline DraftRecord WithStatus(const DraftRecord& base, DraftStatus status, uint64_t now_ms) {
  DraftRecord next      = base;
  next.status           = status;
  next.last_modified_ms = now_ms;
  return next;
}

inline draft::model::DraftMetadata ToMetadata(const DraftRecord& record) {
  draft::model::DraftMetadata metadata;
  metadata.id               = record.id;
  metadata.version          = record.version;
  metadata.field_values     = record.field_values;
  metadata.last_modified_ms = record.last_modified_ms;
  metadata.created_at_ms    = record.created_at_ms;
  metadata.status           = record.status;
  metadata.size_bytes       = record.size_bytes;
  metadata.checksum         = record.checksum;
  return metadata;
}

} // namespace draft::db::model
