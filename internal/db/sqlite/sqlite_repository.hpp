#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace draft::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

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
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
