#include "version_manager.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/buffer.hpp"

namespace draft::versioning {

using observability::StringField;
using observability::UintField;

VersionManager::VersionManager(std::shared_ptr<db::Repository> repository, uint32_t max_versions)
    : repository_(std::move(repository)), max_versions_(max_versions == 0 ? kDefaultMaxVersions : max_versions) {
}

std::string VersionManager::VersionId(const std::string& document_id, uint64_t version) {
  return document_id + "_v" + std::to_string(version);
}

void VersionManager::Snapshot(db::Transaction& tx, const db::model::DraftRecord& prior) {
  db::model::VersionRecord record;
  record.id            = VersionId(prior.id, prior.version);
  record.document_id   = prior.id;
  record.version       = prior.version;
  record.payload       = prior.payload ? util::CopyBuffer(*prior.payload) : nullptr;
  record.field_values  = prior.field_values;
  record.created_at_ms = prior.last_modified_ms;
  record.size_bytes    = prior.size_bytes;

  db::ThrowIfError(repository_->PutVersion(tx, record), "snapshot version " + record.id);
}

std::vector<model::VersionMetadata> VersionManager::ListVersions(db::Transaction& tx, const std::string& document_id) {
  std::vector<model::VersionMetadata> out;
  for (const auto& record : repository_->ListVersionsByDocument(tx, document_id)) {
    out.push_back(db::model::ToMetadata(record));
  }
  return out;
}

std::shared_ptr<arrow::Buffer> VersionManager::LoadVersion(db::Transaction& tx, const std::string& document_id, uint64_t version) {
  auto record = repository_->GetVersion(tx, VersionId(document_id, version));
  if (!record || util::IsEmpty(record->payload)) return nullptr;
  return util::CopyBuffer(*record->payload);
}

std::size_t VersionManager::Trim(db::Transaction& tx, const std::string& document_id) {
  // ordered newest first
  const auto  versions  = repository_->ListVersionsByDocument(tx, document_id);
  const auto  keep      = static_cast<std::size_t>(max_versions_ - 1);
  std::size_t trimmed   = 0;

  for (std::size_t i = keep; i < versions.size(); ++i) {
    db::ThrowIfError(repository_->DeleteVersion(tx, versions[i].id), "trim version " + versions[i].id);
    ++trimmed;
  }

  if (trimmed > 0) {
    DRAFT_LOG_DEBUG("versions trimmed", {StringField("document_id", document_id), UintField("count", trimmed)});
  }
  return trimmed;
}

std::size_t VersionManager::DeleteAll(db::Transaction& tx, const std::string& document_id) {
  const auto versions = repository_->ListVersionsByDocument(tx, document_id);
  for (const auto& version : versions) {
    db::ThrowIfError(repository_->DeleteVersion(tx, version.id), "delete version " + version.id);
  }
  return versions.size();
}

} // namespace draft::versioning
