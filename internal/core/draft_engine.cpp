#include "draft_engine.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/quota/storage_usage.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/buffer.hpp"
#include "internal/util/errors.hpp"

namespace draft::core {

using db::ThrowIfError;
using model::DraftStatus;
using observability::StringField;
using observability::UintField;
using storage::common::ValidateDocumentId;

namespace {

std::shared_ptr<storage::FilesystemMirror> OrDisabledMirror(std::shared_ptr<storage::FilesystemMirror> mirror) {
  if (mirror) return mirror;
  return std::make_shared<storage::FilesystemMirror>(nullptr, std::filesystem::path{});
}

} // namespace

DraftEngine::DraftEngine(std::shared_ptr<db::Repository> repository, std::shared_ptr<storage::FilesystemMirror> mirror,
                         std::shared_ptr<cache::BufferCache> cache, DraftEngineOptions options)
    : repository_(std::move(repository)), mirror_(OrDisabledMirror(std::move(mirror))), cache_(std::move(cache)), options_(std::move(options)) {
  if (!repository_) {
    throw std::invalid_argument("draft engine requires a repository");
  }
  if (!cache_) {
    throw std::invalid_argument("draft engine requires a buffer cache");
  }
  if (!options_.clock) {
    options_.clock = util::NowMillis;
  }
  if (options_.cleanup_threshold_days == 0) {
    options_.cleanup_threshold_days = 30;
  }

  versions_ = std::make_shared<versioning::VersionManager>(repository_, options_.max_versions_per_document);
  changes_  = std::make_shared<changelog::ChangeLogger>(repository_, options_.max_change_log_entries);
  quota_    = std::make_shared<quota::QuotaEnforcer>(repository_, versions_, changes_, options_.storage_soft_limit_bytes,
                                                  [cache = cache_](const std::string& id) { cache->Evict(id); });
}

// ------------------------------------------------------------
// Initialization
// ------------------------------------------------------------

void DraftEngine::Initialize() {
  std::promise<void> promise;
  {
    std::unique_lock lock(init_mutex_);
    if (init_state_ == InitState::kReady) {
      return;
    }
    if (init_state_ == InitState::kInitializing) {
      auto in_flight = init_future_;
      lock.unlock();
      in_flight.get();
      return;
    }
    init_state_  = InitState::kInitializing;
    init_future_ = promise.get_future().share();
  }

  try {
    RunInitialization();
  } catch (const std::exception& e) {
    DRAFT_LOG_ERROR("draft engine initialization failed", {StringField("error", e.what())});
    {
      std::scoped_lock lock(init_mutex_);
      init_state_  = InitState::kUninitialized;
      init_future_ = {};
    }
    promise.set_exception(std::current_exception());
    throw;
  }

  {
    std::scoped_lock lock(init_mutex_);
    init_state_ = InitState::kReady;
  }
  promise.set_value();
}

bool DraftEngine::IsReady() const {
  std::scoped_lock lock(init_mutex_);
  return init_state_ == InitState::kReady;
}

void DraftEngine::RunInitialization() {
  repository_->EnsureSchema();
  mirror_->EnsureDirs();

  const auto cleaned = CleanupOldDraftsUnlocked(options_.cleanup_threshold_days);

  DRAFT_LOG_INFO("draft engine ready", {StringField("mirror_root", mirror_->Enabled() ? mirror_->Root().string() : "disabled"),
                                        UintField("cache_max_bytes", cache_->MaxBytes()),
                                        UintField("soft_limit_bytes", quota_->SoftLimitBytes()),
                                        UintField("max_versions", versions_->MaxVersions()), UintField("cleaned", cleaned)});
}

uint64_t DraftEngine::NowMs() const {
  return options_.clock();
}

std::shared_ptr<std::mutex> DraftEngine::AcquireDocumentMutex(const std::string& id) {
  std::lock_guard<std::mutex> lock(document_mutexes_guard_);
  auto&                       document_mutex = document_mutexes_[id];
  if (!document_mutex) {
    document_mutex = std::make_shared<std::mutex>();
  }
  return document_mutex;
}

void DraftEngine::ReleaseDocumentMutex(const std::string& id, std::shared_ptr<std::mutex>& mutex) {
  std::lock_guard<std::mutex> lock(document_mutexes_guard_);
  auto                        it = document_mutexes_.find(id);
  // map + this holder: nobody else holds or waits on it
  if (it != document_mutexes_.end() && it->second == mutex && mutex.use_count() == 2) {
    document_mutexes_.erase(it);
  }
  mutex.reset();
}

std::size_t DraftEngine::LockedDocumentCount() const {
  std::lock_guard<std::mutex> lock(document_mutexes_guard_);
  return document_mutexes_.size();
}

DraftEngine::DocumentLock::DocumentLock(DraftEngine& engine, std::string id)
    : engine_(engine), id_(std::move(id)), mutex_(engine_.AcquireDocumentMutex(id_)), lock_(*mutex_) {
}

DraftEngine::DocumentLock::~DocumentLock() {
  lock_.unlock();
  engine_.ReleaseDocumentMutex(id_, mutex_);
}

// ------------------------------------------------------------
// Drafts
// ------------------------------------------------------------

model::DraftMetadata DraftEngine::SaveDraft(const std::string& id, const std::shared_ptr<arrow::Buffer>& payload,
                                            const model::FieldValues& field_values) {
  ValidateDocumentId(id);
  if (util::IsEmpty(payload)) {
    throw util::InvalidArgument("save draft " + id + ": payload is empty");
  }
  Initialize();

  // the caller may reuse its buffer as soon as we return
  const auto stored = util::CopyBuffer(*payload);

  db::model::DraftRecord record;
  {
    DocumentLock document_lock(*this, id);

    const auto now = NowMs();
    auto       tx  = repository_->Begin();

    auto existing = repository_->GetDraft(*tx, id);
    if (existing && model::IsTerminal(existing->status)) {
      throw util::InvalidState("save draft " + id + ": draft is finalized");
    }

    record.id               = id;
    record.payload          = stored;
    record.version          = existing ? existing->version + 1 : 1;
    record.field_values     = field_values;
    record.last_modified_ms = now;
    record.created_at_ms    = existing ? existing->created_at_ms : now;
    record.status           = existing ? existing->status : DraftStatus::kDraft;
    record.size_bytes       = static_cast<uint64_t>(stored->size());
    record.checksum         = util::Checksum(*stored);

    if (existing) {
      versions_->Snapshot(*tx, *existing);
      versions_->Trim(*tx, id);
    }

    ThrowIfError(repository_->PutDraft(*tx, record), "save draft " + id);
    changes_->LogChanges(*tx, id, existing ? existing->field_values : model::FieldValues{}, field_values, now);
    tx->Commit();

    cache_->Put(id, *stored);
    mirror_->WriteActive(id, *stored);
  }

  DRAFT_LOG_INFO("draft saved", {StringField("document_id", id), UintField("version", record.version), UintField("size_bytes", record.size_bytes)});

  MaintainStorage();
  return db::model::ToMetadata(record);
}

std::shared_ptr<arrow::Buffer> DraftEngine::LoadDraft(const std::string& id) {
  ValidateDocumentId(id);
  Initialize();

  DocumentLock document_lock(*this, id);

  if (auto cached = cache_->Get(id)) {
    if (cached->size() > 0) {
      DRAFT_LOG_DEBUG("draft loaded", {StringField("document_id", id), StringField("tier", "cache")});
      return cached;
    }
    DRAFT_LOG_WARN("empty cache entry evicted", {StringField("document_id", id)});
    cache_->Evict(id);
  }

  std::optional<db::model::DraftRecord> record;
  {
    auto tx = repository_->Begin();
    record  = repository_->GetDraft(*tx, id);
    tx->Rollback();
  }

  if (record && !util::IsEmpty(record->payload)) {
    cache_->Put(id, *record->payload);
    DRAFT_LOG_DEBUG("draft loaded", {StringField("document_id", id), StringField("tier", "store")});
    return record->payload;
  }
  if (record) {
    DRAFT_LOG_WARN("empty payload in record store", {StringField("document_id", id)});
  }

  if (auto active = mirror_->ReadActive(id); !util::IsEmpty(active)) {
    cache_->Put(id, *active);
    DRAFT_LOG_INFO("draft loaded", {StringField("document_id", id), StringField("tier", "mirror_active")});
    return active;
  }

  if (auto finalized = mirror_->ReadFinalized(id); !util::IsEmpty(finalized)) {
    cache_->Put(id, *finalized);
    DRAFT_LOG_INFO("draft loaded", {StringField("document_id", id), StringField("tier", "mirror_finalized")});
    return finalized;
  }

  return nullptr;
}

std::optional<model::DraftMetadata> DraftEngine::GetDraftMetadata(const std::string& id) {
  ValidateDocumentId(id);
  Initialize();

  auto tx     = repository_->Begin();
  auto record = repository_->GetDraft(*tx, id);
  tx->Rollback();

  if (!record) return std::nullopt;
  return db::model::ToMetadata(*record);
}

bool DraftEngine::HasDraft(const std::string& id) {
  return GetDraftMetadata(id).has_value();
}

model::DraftMetadata DraftEngine::UpdateFieldValues(const std::string& id, const model::FieldValues& field_values) {
  ValidateDocumentId(id);
  Initialize();

  DocumentLock document_lock(*this, id);

  const auto now = NowMs();
  auto       tx  = repository_->Begin();

  auto existing = repository_->GetDraft(*tx, id);
  if (!existing) {
    throw util::NotFound("update field values: draft not found: " + id);
  }
  if (model::IsTerminal(existing->status)) {
    throw util::InvalidState("update field values " + id + ": draft is finalized");
  }

  const auto logged = changes_->LogChanges(*tx, id, existing->field_values, field_values, now);

  auto updated = db::model::WithFieldValues(*existing, field_values, now);
  ThrowIfError(repository_->PutDraft(*tx, updated), "update field values " + id);
  tx->Commit();

  DRAFT_LOG_DEBUG("field values updated", {StringField("document_id", id), UintField("changes", logged)});
  return db::model::ToMetadata(updated);
}

std::optional<model::FieldValues> DraftEngine::GetFieldValues(const std::string& id) {
  auto metadata = GetDraftMetadata(id);
  if (!metadata) return std::nullopt;
  return std::move(metadata->field_values);
}

// ------------------------------------------------------------
// History
// ------------------------------------------------------------

std::vector<model::VersionMetadata> DraftEngine::GetVersionHistory(const std::string& id) {
  ValidateDocumentId(id);
  Initialize();

  auto tx       = repository_->Begin();
  auto current  = repository_->GetDraft(*tx, id);
  auto snapshots = versions_->ListVersions(*tx, id);
  tx->Rollback();

  std::vector<model::VersionMetadata> history;
  history.reserve(snapshots.size() + 1);

  if (current) {
    model::VersionMetadata head;
    head.id            = versioning::VersionManager::VersionId(id, current->version);
    head.document_id   = id;
    head.version       = current->version;
    head.field_values  = current->field_values;
    head.created_at_ms = current->last_modified_ms;
    head.size_bytes    = current->size_bytes;
    history.push_back(std::move(head));
  }

  for (auto& snapshot : snapshots) {
    if (current && snapshot.version >= current->version) continue;
    history.push_back(std::move(snapshot));
  }
  return history;
}

std::shared_ptr<arrow::Buffer> DraftEngine::LoadVersion(const std::string& id, uint64_t version) {
  ValidateDocumentId(id);
  Initialize();

  auto tx      = repository_->Begin();
  auto current = repository_->GetDraft(*tx, id);
  if (current && current->version == version) {
    tx->Rollback();
    return util::IsEmpty(current->payload) ? nullptr : current->payload;
  }

  auto payload = versions_->LoadVersion(*tx, id, version);
  tx->Rollback();
  return payload;
}

std::vector<db::model::ChangeLogRecord> DraftEngine::GetChangeHistory(const std::string& id, std::size_t limit) {
  ValidateDocumentId(id);
  Initialize();

  auto tx      = repository_->Begin();
  auto changes = changes_->ListChanges(*tx, id, limit);
  tx->Rollback();
  return changes;
}

// ------------------------------------------------------------
// Lifecycle
// ------------------------------------------------------------

model::DraftMetadata DraftEngine::MarkFinalizing(const std::string& id) {
  return Transition(id, DraftStatus::kFinalizing);
}

model::DraftMetadata DraftEngine::MarkFinalized(const std::string& id) {
  return Transition(id, DraftStatus::kFinalized);
}

model::DraftMetadata DraftEngine::Transition(const std::string& id, DraftStatus target) {
  ValidateDocumentId(id);
  Initialize();

  db::model::DraftRecord updated;
  {
    DocumentLock document_lock(*this, id);

    auto tx       = repository_->Begin();
    auto existing = repository_->GetDraft(*tx, id);
    if (!existing) {
      throw util::NotFound("mark " + std::string(model::ToString(target)) + ": draft not found: " + id);
    }
    if (!model::CanTransition(existing->status, target)) {
      throw util::InvalidState("draft " + id + ": cannot move from " + std::string(model::ToString(existing->status)) + " to " +
                               std::string(model::ToString(target)));
    }

    updated = db::model::WithStatus(*existing, target, NowMs());
    ThrowIfError(repository_->PutDraft(*tx, updated), "update draft status " + id);
    tx->Commit();

    if (target == DraftStatus::kFinalized) {
      cache_->Evict(id);
      if (!util::IsEmpty(updated.payload)) {
        mirror_->WriteFinalized(id, *updated.payload);
      }
    }
  }

  DRAFT_LOG_INFO("draft status changed", {StringField("document_id", id), StringField("status", model::ToString(target))});

  if (target == DraftStatus::kFinalized) {
    MaintainStorage();
  }
  return db::model::ToMetadata(updated);
}

void DraftEngine::DeleteDraft(const std::string& id) {
  ValidateDocumentId(id);
  Initialize();

  {
    DocumentLock document_lock(*this, id);

    auto tx = repository_->Begin();
    DeleteDocumentRows(*tx, id);
    tx->Commit();

    cache_->Evict(id);
  }

  DRAFT_LOG_INFO("draft deleted", {StringField("document_id", id)});
  MaintainStorage();
}

void DraftEngine::DeleteDocumentRows(db::Transaction& tx, const std::string& id) {
  ThrowIfError(repository_->DeleteDraft(tx, id), "delete draft " + id);
  versions_->DeleteAll(tx, id);
  changes_->DeleteAll(tx, id);
}

// ------------------------------------------------------------
// Maintenance
// ------------------------------------------------------------

std::size_t DraftEngine::CleanupOldDrafts(uint32_t days_old) {
  Initialize();
  return CleanupOldDraftsUnlocked(days_old == 0 ? options_.cleanup_threshold_days : days_old);
}

std::size_t DraftEngine::CleanupOldDraftsUnlocked(uint32_t days_old) {
  const auto now    = NowMs();
  const auto window = static_cast<uint64_t>(days_old) * util::kMillisPerDay;
  const auto cutoff = now > window ? now - window : 0;

  std::vector<std::string> deleted;

  auto tx = repository_->Begin();
  for (const auto& draft : repository_->ListDraftsByStatus(*tx, DraftStatus::kFinalized)) {
    if (draft.last_modified_ms >= cutoff) continue;
    DeleteDocumentRows(*tx, draft.id);
    deleted.push_back(draft.id);
  }
  quota::RecordUsage(*repository_, *tx, now);
  tx->Commit();

  for (const auto& id : deleted) {
    cache_->Evict(id);
  }

  DRAFT_LOG_INFO("old drafts cleaned up", {UintField("count", deleted.size()), UintField("days_old", days_old)});
  return deleted.size();
}

void DraftEngine::MaintainStorage() {
  try {
    {
      auto tx = repository_->Begin();
      quota::RecordUsage(*repository_, *tx);
      tx->Commit();
    }
    quota_->Enforce();
  } catch (const std::exception& e) {
    DRAFT_LOG_ERROR("storage maintenance failed", {StringField("error", e.what())});
  }
}

StorageStats DraftEngine::GetStorageStats() {
  Initialize();

  auto tx       = repository_->Begin();
  auto usage    = quota::MeasureUsage(*repository_, *tx);
  auto metadata = repository_->GetStorageMetadata(*tx);
  tx->Rollback();

  StorageStats stats;
  stats.total_size_bytes = usage.total_bytes;
  stats.draft_count      = usage.draft_count;
  stats.version_count    = usage.version_count;
  stats.cache_bytes      = cache_->CurrentBytes();
  stats.last_cleanup_ms  = metadata ? metadata->last_cleanup_ms : 0;
  return stats;
}

std::vector<model::DraftMetadata> DraftEngine::ListAllDrafts() {
  Initialize();

  auto tx      = repository_->Begin();
  auto records = repository_->ListDrafts(*tx);
  tx->Rollback();

  std::vector<model::DraftMetadata> out;
  out.reserve(records.size());
  for (const auto& record : records) {
    out.push_back(db::model::ToMetadata(record));
  }
  return out;
}

void DraftEngine::ClearAll() {
  Initialize();

  auto tx = repository_->Begin();
  ThrowIfError(repository_->ClearAll(*tx), "clear all");
  tx->Commit();

  cache_->Clear();
  DRAFT_LOG_WARN("all drafts cleared");
}

} // namespace draft::core
