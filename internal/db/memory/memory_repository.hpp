#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace draft::db::memory {

class MemoryTransaction;

/*
  Process-local record store. Used when no sqlite path is configured and
  as the reference backend in tests. Contents die with the process.
*/
class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  void EnsureSchema() override;
  std::unique_ptr<Transaction> Begin() override;

  Result PutDraft(Transaction&, const model::DraftRecord&) override;
  std::optional<model::DraftRecord> GetDraft(Transaction&, const std::string&) override;
  std::vector<model::DraftRecord> ListDrafts(Transaction&) override;
  std::vector<model::DraftRecord> ListDraftsByStatus(Transaction&, model::DraftStatus) override;
  Result DeleteDraft(Transaction&, const std::string&) override;

  Result PutVersion(Transaction&, const model::VersionRecord&) override;
  std::optional<model::VersionRecord> GetVersion(Transaction&, const std::string&) override;
  std::vector<model::VersionRecord> ListVersionsByDocument(Transaction&, const std::string&) override;
  std::vector<model::VersionRecord> ListVersions(Transaction&) override;
  Result DeleteVersion(Transaction&, const std::string&) override;

  Result InsertChange(Transaction&, model::ChangeLogRecord&) override;
  std::vector<model::ChangeLogRecord> ListChangesByDocument(Transaction&, const std::string&) override;
  Result DeleteChange(Transaction&, const std::string&) override;

  std::optional<model::StorageMetadataRecord> GetStorageMetadata(Transaction&) override;
  Result PutStorageMetadata(Transaction&, const model::StorageMetadataRecord&) override;

  Result ClearAll(Transaction&) override;

private:
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<std::string, model::DraftRecord>     drafts;
    std::unordered_map<std::string, model::VersionRecord>   versions;
    std::unordered_map<std::string, model::ChangeLogRecord> changes;

    std::optional<model::StorageMetadataRecord> storage_metadata;

    uint64_t next_change_sequence = 1;
  };

  // held by a transaction for its whole lifetime (single writer)
  std::mutex writer_mutex_;

  // guards committed_
  std::mutex mutex_;
  State      committed_;
};

}
