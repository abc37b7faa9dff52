#include "quota_enforcer.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"

namespace draft::quota {

using observability::StringField;
using observability::UintField;

QuotaEnforcer::QuotaEnforcer(std::shared_ptr<db::Repository> repository, std::shared_ptr<versioning::VersionManager> versions,
                             std::shared_ptr<changelog::ChangeLogger> changes, uint64_t soft_limit_bytes, RemovedCallback on_removed)
    : repository_(std::move(repository)),
      versions_(std::move(versions)),
      changes_(std::move(changes)),
      soft_limit_bytes_(soft_limit_bytes == 0 ? kDefaultSoftLimitBytes : soft_limit_bytes),
      on_removed_(std::move(on_removed)) {
}

QuotaReport QuotaEnforcer::Enforce() {
  QuotaReport report;

  auto tx    = repository_->Begin();
  auto usage = MeasureUsage(*repository_, *tx);

  report.bytes_before = usage.total_bytes;
  report.bytes_after  = usage.total_bytes;
  if (!usage.OverLimit(soft_limit_bytes_)) {
    tx->Rollback();
    return report;
  }

  uint64_t total = usage.total_bytes;

  // ------------------------------------------------------------
  // Phase 1: finalized drafts, oldest first
  // ------------------------------------------------------------

  for (const auto& draft : repository_->ListDraftsByStatus(*tx, model::DraftStatus::kFinalized)) {
    if (total <= soft_limit_bytes_) break;

    uint64_t freed = draft.size_bytes;
    for (const auto& version : repository_->ListVersionsByDocument(*tx, draft.id)) {
      freed += version.size_bytes;
    }

    versions_->DeleteAll(*tx, draft.id);
    changes_->DeleteAll(*tx, draft.id);
    db::ThrowIfError(repository_->DeleteDraft(*tx, draft.id), "quota delete draft " + draft.id);

    total -= std::min(total, freed);
    report.deleted_drafts.push_back(draft.id);
  }

  // ------------------------------------------------------------
  // Phase 2: versions of any document, oldest first
  // ------------------------------------------------------------

  if (total > soft_limit_bytes_) {
    for (const auto& version : repository_->ListVersions(*tx)) {
      if (total <= soft_limit_bytes_) break;

      db::ThrowIfError(repository_->DeleteVersion(*tx, version.id), "quota delete version " + version.id);
      total -= std::min(total, version.size_bytes);
      report.deleted_versions++;
    }
  }

  RecordUsage(*repository_, *tx);
  tx->Commit();

  report.bytes_after = total;
  report.over_limit  = total > soft_limit_bytes_;

  DRAFT_LOG_INFO("quota enforced", {UintField("bytes_before", report.bytes_before), UintField("bytes_after", report.bytes_after),
                                    UintField("deleted_drafts", report.deleted_drafts.size()),
                                    UintField("deleted_versions", report.deleted_versions)});

  if (report.over_limit) {
    DRAFT_LOG_WARN("storage still over soft limit; active drafts are never pruned",
                   {UintField("bytes", total), UintField("limit_bytes", soft_limit_bytes_)});
  }

  if (on_removed_) {
    for (const auto& id : report.deleted_drafts) {
      on_removed_(id);
    }
  }
  return report;
}

} // namespace draft::quota
