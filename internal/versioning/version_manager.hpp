#pragma once

#include <arrow/buffer.h>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/model/draft_metadata.hpp"

namespace draft::versioning {

/*
  Version snapshots of a draft.

  A snapshot is the pre-overwrite state of the draft row. The retained
  history of a document is its current draft plus its snapshots, and
  max_versions counts the current draft: Trim keeps max_versions - 1
  snapshot rows.

  All calls run inside the caller's transaction.
*/
class VersionManager {
 public:
  static constexpr uint32_t kDefaultMaxVersions = 5;

  VersionManager(std::shared_ptr<db::Repository> repository, uint32_t max_versions = kDefaultMaxVersions);

  void Snapshot(db::Transaction& tx, const db::model::DraftRecord& prior);

  // Newest first, snapshots only.
  std::vector<model::VersionMetadata> ListVersions(db::Transaction& tx, const std::string& document_id);

  // nullptr when no snapshot with that version exists.
  std::shared_ptr<arrow::Buffer> LoadVersion(db::Transaction& tx, const std::string& document_id, uint64_t version);

  // Returns the number of snapshots removed.
  std::size_t Trim(db::Transaction& tx, const std::string& document_id);

  std::size_t DeleteAll(db::Transaction& tx, const std::string& document_id);

  uint32_t MaxVersions() const {
    return max_versions_;
  }

  static std::string VersionId(const std::string& document_id, uint64_t version);

 private:
  std::shared_ptr<db::Repository> repository_;
  uint32_t                        max_versions_;
};

} // namespace draft::versioning
