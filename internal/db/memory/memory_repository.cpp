#include "memory_repository.hpp"

#include <algorithm>
#include <tuple>

#include "internal/util/buffer.hpp"
#include "memory_tx.hpp"

namespace draft::db::memory {

namespace {

// Stored records own private payload copies, like a real backend would.
std::shared_ptr<arrow::Buffer> Detach(const std::shared_ptr<arrow::Buffer>& payload) {
  if (!payload) return nullptr;
  return util::CopyBuffer(*payload);
}

bool ByLastModified(const model::DraftRecord& lhs, const model::DraftRecord& rhs) {
  return std::tie(lhs.last_modified_ms, lhs.id) < std::tie(rhs.last_modified_ms, rhs.id);
}

} // namespace

MemoryRepository::MemoryRepository() = default;

void MemoryRepository::EnsureSchema() {
}

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Drafts
// ------------------------------------------------------------------

Result MemoryRepository::PutDraft(Transaction& t, const model::DraftRecord& r) {
  if (r.id.empty()) return Result::Err(ErrorCode::ConstraintViolation, "empty draft id");
  auto stored    = r;
  stored.payload = Detach(r.payload);
  TX(t).Mutable().drafts[r.id] = std::move(stored);
  return Result::Ok();
}

std::optional<model::DraftRecord> MemoryRepository::GetDraft(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.drafts.find(id);
  if (it == s.drafts.end()) return std::nullopt;
  auto record    = it->second;
  record.payload = Detach(it->second.payload);
  return record;
}

std::vector<model::DraftRecord> MemoryRepository::ListDrafts(Transaction& t) {
  const auto&                     s = TX(t).View();
  std::vector<model::DraftRecord> records;
  records.reserve(s.drafts.size());
  for (const auto& [_, record] : s.drafts) {
    records.push_back(record);
    records.back().payload.reset();
  }
  std::sort(records.begin(), records.end(), ByLastModified);
  return records;
}

std::vector<model::DraftRecord> MemoryRepository::ListDraftsByStatus(Transaction& t, model::DraftStatus status) {
  std::vector<model::DraftRecord> out;
  for (auto& record : ListDrafts(t)) {
    if (record.status == status) out.push_back(std::move(record));
  }
  return out;
}

Result MemoryRepository::DeleteDraft(Transaction& t, const std::string& id) {
  TX(t).Mutable().drafts.erase(id);
  return Result::Ok();
}

// ------------------------------------------------------------------
// Versions
// ------------------------------------------------------------------

Result MemoryRepository::PutVersion(Transaction& t, const model::VersionRecord& r) {
  if (r.id.empty()) return Result::Err(ErrorCode::ConstraintViolation, "empty version id");
  auto stored    = r;
  stored.payload = Detach(r.payload);
  TX(t).Mutable().versions[r.id] = std::move(stored);
  return Result::Ok();
}

std::optional<model::VersionRecord> MemoryRepository::GetVersion(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.versions.find(id);
  if (it == s.versions.end()) return std::nullopt;
  auto record    = it->second;
  record.payload = Detach(it->second.payload);
  return record;
}

std::vector<model::VersionRecord> MemoryRepository::ListVersionsByDocument(Transaction& t, const std::string& document_id) {
  std::vector<model::VersionRecord> out;
  for (const auto& [_, record] : TX(t).View().versions) {
    if (record.document_id != document_id) continue;
    out.push_back(record);
    out.back().payload.reset();
  }
  std::sort(out.begin(), out.end(), [](const auto& lhs, const auto& rhs) { return lhs.version > rhs.version; });
  return out;
}

std::vector<model::VersionRecord> MemoryRepository::ListVersions(Transaction& t) {
  std::vector<model::VersionRecord> out;
  for (const auto& [_, record] : TX(t).View().versions) {
    out.push_back(record);
    out.back().payload.reset();
  }
  std::sort(out.begin(), out.end(), [](const auto& lhs, const auto& rhs) {
    return std::tie(lhs.created_at_ms, lhs.document_id, lhs.version) < std::tie(rhs.created_at_ms, rhs.document_id, rhs.version);
  });
  return out;
}

Result MemoryRepository::DeleteVersion(Transaction& t, const std::string& id) {
  TX(t).Mutable().versions.erase(id);
  return Result::Ok();
}

// ------------------------------------------------------------------
// Change log
// ------------------------------------------------------------------

Result MemoryRepository::InsertChange(Transaction& t, model::ChangeLogRecord& r) {
  auto& s = TX(t).Mutable();

  const auto sequence = s.next_change_sequence;
  auto       stored   = r;
  stored.sequence     = sequence;
  if (stored.id.empty()) stored.id = ChangeId(stored);

  if (s.changes.contains(stored.id)) return Result::Err(ErrorCode::AlreadyExists, stored.id);

  s.next_change_sequence++;
  s.changes.emplace(stored.id, stored);
  r = std::move(stored);
  return Result::Ok();
}

std::vector<model::ChangeLogRecord> MemoryRepository::ListChangesByDocument(Transaction& t, const std::string& document_id) {
  std::vector<model::ChangeLogRecord> out;
  for (const auto& [_, record] : TX(t).View().changes) {
    if (record.document_id == document_id) out.push_back(record);
  }
  std::sort(out.begin(), out.end(), [](const auto& lhs, const auto& rhs) {
    return std::tie(lhs.timestamp_ms, lhs.sequence) > std::tie(rhs.timestamp_ms, rhs.sequence);
  });
  return out;
}

Result MemoryRepository::DeleteChange(Transaction& t, const std::string& id) {
  TX(t).Mutable().changes.erase(id);
  return Result::Ok();
}

// ------------------------------------------------------------------
// Storage metadata
// ------------------------------------------------------------------

std::optional<model::StorageMetadataRecord> MemoryRepository::GetStorageMetadata(Transaction& t) {
  return TX(t).View().storage_metadata;
}

Result MemoryRepository::PutStorageMetadata(Transaction& t, const model::StorageMetadataRecord& r) {
  auto stored = r;
  stored.id   = model::StorageMetadataRecord::kSingletonId;
  TX(t).Mutable().storage_metadata = std::move(stored);
  return Result::Ok();
}

Result MemoryRepository::ClearAll(Transaction& t) {
  auto& s = TX(t).Mutable();
  s.drafts.clear();
  s.versions.clear();
  s.changes.clear();
  s.storage_metadata.reset();
  return Result::Ok();
}

} // namespace draft::db::memory
