#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/change_log_record.hpp"
#include "internal/db/model/draft_record.hpp"
#include "internal/db/model/storage_metadata_record.hpp"
#include "internal/db/model/version_record.hpp"

namespace draft::db {

/*
  Record store abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes run inside a Transaction
  - Reads inside a transaction see its writes
  - Put* is an upsert keyed by id
  - Delete* of a missing id is not an error
  - List* calls never load payload bytes

  The DB is the source of truth for:
    drafts
    version snapshots
    field change log
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Schema / transactions
  // ---------------------------------------------------------------------

  // Idempotent. Safe to call on every start.
  virtual void EnsureSchema() = 0;

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Drafts
  // ---------------------------------------------------------------------

  virtual Result PutDraft(Transaction&, const model::DraftRecord&) = 0;

  virtual std::optional<model::DraftRecord> GetDraft(Transaction&, const std::string& id) = 0;

  // Ordered by last_modified_ms ascending.
  virtual std::vector<model::DraftRecord> ListDrafts(Transaction&) = 0;

  // Ordered by last_modified_ms ascending.
  virtual std::vector<model::DraftRecord> ListDraftsByStatus(Transaction&, model::DraftStatus status) = 0;

  virtual Result DeleteDraft(Transaction&, const std::string& id) = 0;

  // ---------------------------------------------------------------------
  // Versions
  // ---------------------------------------------------------------------

  virtual Result PutVersion(Transaction&, const model::VersionRecord&) = 0;

  virtual std::optional<model::VersionRecord> GetVersion(Transaction&, const std::string& id) = 0;

  // Ordered by version descending.
  virtual std::vector<model::VersionRecord> ListVersionsByDocument(Transaction&, const std::string& document_id) = 0;

  // Ordered by created_at_ms ascending.
  virtual std::vector<model::VersionRecord> ListVersions(Transaction&) = 0;

  virtual Result DeleteVersion(Transaction&, const std::string& id) = 0;

  // ---------------------------------------------------------------------
  // Change log
  // ---------------------------------------------------------------------

  // Assigns record.sequence; fills record.id when empty.
  virtual Result InsertChange(Transaction&, model::ChangeLogRecord& record) = 0;

  // Newest first (timestamp_ms, then sequence, descending).
  virtual std::vector<model::ChangeLogRecord> ListChangesByDocument(Transaction&, const std::string& document_id) = 0;

  virtual Result DeleteChange(Transaction&, const std::string& id) = 0;

  // ---------------------------------------------------------------------
  // Storage metadata
  // ---------------------------------------------------------------------

  virtual std::optional<model::StorageMetadataRecord> GetStorageMetadata(Transaction&) = 0;

  virtual Result PutStorageMetadata(Transaction&, const model::StorageMetadataRecord&) = 0;

  // ---------------------------------------------------------------------
  // Maintenance
  // ---------------------------------------------------------------------

  // Empties every collection.
  virtual Result ClearAll(Transaction&) = 0;
};

// change_log ids: "{document_id}_{field}_{timestamp}_{sequence}"
inline std::string ChangeId(const model::ChangeLogRecord& record) {
  return record.document_id + "_" + record.field_name + "_" + std::to_string(record.timestamp_ms) + "_" + std::to_string(record.sequence);
}

} // namespace draft::db
