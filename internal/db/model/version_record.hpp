#pragma once

#include <arrow/buffer.h>

#include <cstdint>
#include <memory>
#include <string>

#include "internal/model/draft_metadata.hpp"
#include "internal/model/field_values.hpp"

namespace draft::db::model {

/*
  Immutable snapshot of a draft taken right before it was overwritten
  (collection "versions").

  created_at_ms is the snapshotted draft's last_modified_ms.
*/
struct VersionRecord {
  std::string id; // "{document_id}_v{version}"
  std::string document_id;

  uint64_t version = 0;

  std::shared_ptr<arrow::Buffer> payload;
  draft::model::FieldValues      field_values;

  uint64_t created_at_ms = 0;
  uint64_t size_bytes    = 0;
};

inline draft::model::VersionMetadata ToMetadata(const VersionRecord& record) {
  draft::model::VersionMetadata metadata;
  metadata.id            = record.id;
  metadata.document_id   = record.document_id;
  metadata.version       = record.version;
  metadata.field_values  = record.field_values;
  metadata.created_at_ms = record.created_at_ms;
  metadata.size_bytes    = record.size_bytes;
  return metadata;
}

} // namespace draft::db::model
