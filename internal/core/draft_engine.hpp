#pragma once

#include <arrow/buffer.h>

#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/cache/buffer_cache.hpp"
#include "internal/changelog/change_logger.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/model/draft_metadata.hpp"
#include "internal/quota/quota_enforcer.hpp"
#include "internal/storage/filesystem_mirror.hpp"
#include "internal/util/time.hpp"
#include "internal/versioning/version_manager.hpp"

namespace draft::core {

struct DraftEngineOptions {
  uint64_t storage_soft_limit_bytes  = quota::QuotaEnforcer::kDefaultSoftLimitBytes;
  uint32_t max_versions_per_document = versioning::VersionManager::kDefaultMaxVersions;
  uint32_t max_change_log_entries    = changelog::ChangeLogger::kDefaultMaxEntries;
  uint32_t cleanup_threshold_days    = 30;

  // defaults to util::NowMillis
  util::MillisClock clock;
};

struct StorageStats {
  uint64_t total_size_bytes = 0;
  uint64_t draft_count      = 0;
  uint64_t version_count    = 0;
  uint64_t cache_bytes      = 0;
  uint64_t last_cleanup_ms  = 0;
};

/*
  Draft storage engine.

  Tiers, fastest first:
    BufferCache       in-process copies of recent payloads
    db::Repository    source of truth (drafts, versions, change log)
    FilesystemMirror  best-effort recovery copies

  Every public call initializes the engine on first use. Calls on the same
  document id are serialized; different ids proceed in parallel up to the
  repository's single-writer transaction.

  Payloads are always copied on the way in and on the way out.
*/
class DraftEngine {
 public:
  DraftEngine(std::shared_ptr<db::Repository> repository, std::shared_ptr<storage::FilesystemMirror> mirror,
              std::shared_ptr<cache::BufferCache> cache, DraftEngineOptions options = {});

  // Idempotent. Concurrent callers share one run; a failed run is retried
  // by the next call.
  void Initialize();
  bool IsReady() const;

  // ---------------------------------------------------------------------
  // Drafts
  // ---------------------------------------------------------------------

  model::DraftMetadata SaveDraft(const std::string& id, const std::shared_ptr<arrow::Buffer>& payload,
                                 const model::FieldValues& field_values);

  // nullptr when no tier holds a non-empty payload.
  std::shared_ptr<arrow::Buffer> LoadDraft(const std::string& id);

  std::optional<model::DraftMetadata> GetDraftMetadata(const std::string& id);
  bool                                HasDraft(const std::string& id);

  model::DraftMetadata             UpdateFieldValues(const std::string& id, const model::FieldValues& field_values);
  std::optional<model::FieldValues> GetFieldValues(const std::string& id);

  // ---------------------------------------------------------------------
  // History
  // ---------------------------------------------------------------------

  // Current version first, then snapshots, newest first.
  std::vector<model::VersionMetadata> GetVersionHistory(const std::string& id);
  std::shared_ptr<arrow::Buffer>      LoadVersion(const std::string& id, uint64_t version);

  std::vector<db::model::ChangeLogRecord> GetChangeHistory(const std::string& id, std::size_t limit = 50);

  // ---------------------------------------------------------------------
  // Lifecycle
  // ---------------------------------------------------------------------

  model::DraftMetadata MarkFinalizing(const std::string& id);
  model::DraftMetadata MarkFinalized(const std::string& id);

  void DeleteDraft(const std::string& id);

  // ---------------------------------------------------------------------
  // Maintenance
  // ---------------------------------------------------------------------

  // Deletes finalized drafts untouched for more than days_old days
  // (0: configured threshold). Returns the number deleted.
  std::size_t CleanupOldDrafts(uint32_t days_old = 0);

  StorageStats                      GetStorageStats();
  std::vector<model::DraftMetadata> ListAllDrafts();
  void                              ClearAll();

  // Ids with an operation in flight or waiting; 0 when idle.
  std::size_t LockedDocumentCount() const;

 private:
  enum class InitState { kUninitialized, kInitializing, kReady };

  void RunInitialization();

  uint64_t NowMs() const;

  // Holds the per-document mutex; the map entry is dropped when the last
  // holder or waiter releases it.
  class DocumentLock {
   public:
    DocumentLock(DraftEngine& engine, std::string id);
    ~DocumentLock();

    DocumentLock(const DocumentLock&)            = delete;
    DocumentLock& operator=(const DocumentLock&) = delete;

   private:
    DraftEngine&                 engine_;
    std::string                  id_;
    std::shared_ptr<std::mutex>  mutex_;
    std::unique_lock<std::mutex> lock_;
  };

  std::shared_ptr<std::mutex> AcquireDocumentMutex(const std::string& id);
  void                        ReleaseDocumentMutex(const std::string& id, std::shared_ptr<std::mutex>& mutex);

  model::DraftMetadata Transition(const std::string& id, model::DraftStatus target);

  std::size_t CleanupOldDraftsUnlocked(uint32_t days_old);

  // Removes draft, versions and change log inside tx.
  void DeleteDocumentRows(db::Transaction& tx, const std::string& id);

  // Post-commit bookkeeping: storage metadata + quota. Logs failures.
  void MaintainStorage();

  std::shared_ptr<db::Repository>             repository_;
  std::shared_ptr<storage::FilesystemMirror>  mirror_;
  std::shared_ptr<cache::BufferCache>         cache_;
  DraftEngineOptions                          options_;
  std::shared_ptr<versioning::VersionManager> versions_;
  std::shared_ptr<changelog::ChangeLogger>    changes_;
  std::shared_ptr<quota::QuotaEnforcer>       quota_;

  mutable std::mutex       init_mutex_;
  InitState                init_state_ = InitState::kUninitialized;
  std::shared_future<void> init_future_;

  mutable std::mutex                                           document_mutexes_guard_;
  std::unordered_map<std::string, std::shared_ptr<std::mutex>> document_mutexes_;
};

} // namespace draft::core
