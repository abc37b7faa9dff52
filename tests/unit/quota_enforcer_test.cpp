#include "internal/quota/quota_enforcer.hpp"

#include <algorithm>
#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/buffer.hpp"

namespace {

using draft::changelog::ChangeLogger;
using draft::db::memory::MemoryRepository;
using draft::db::model::DraftRecord;
using draft::db::model::VersionRecord;
using draft::model::DraftStatus;
using draft::quota::QuotaEnforcer;
using draft::versioning::VersionManager;

struct Fixture {
  std::shared_ptr<MemoryRepository> repo     = std::make_shared<MemoryRepository>();
  std::shared_ptr<VersionManager>   versions = std::make_shared<VersionManager>(repo);
  std::shared_ptr<ChangeLogger>     changes  = std::make_shared<ChangeLogger>(repo);
  std::vector<std::string>          removed;

  QuotaEnforcer Enforcer(uint64_t limit) {
    return QuotaEnforcer(repo, versions, changes, limit, [this](const std::string& id) { removed.push_back(id); });
  }

  void PutDraft(const std::string& id, uint64_t size, DraftStatus status, uint64_t last_modified_ms) {
    DraftRecord record;
    record.id               = id;
    record.version          = 1;
    record.payload          = draft::util::BufferFromString(std::string(size, 'x'));
    record.size_bytes       = size;
    record.status           = status;
    record.last_modified_ms = last_modified_ms;
    record.created_at_ms    = last_modified_ms;

    auto tx = repo->Begin();
    auto put = repo->PutDraft(*tx, record);
    assert(put);
    tx->Commit();
  }

  void PutVersion(const std::string& document_id, uint64_t version, uint64_t size, uint64_t created_at_ms) {
    VersionRecord record;
    record.id            = VersionManager::VersionId(document_id, version);
    record.document_id   = document_id;
    record.version       = version;
    record.payload       = draft::util::BufferFromString(std::string(size, 'v'));
    record.size_bytes    = size;
    record.created_at_ms = created_at_ms;

    auto tx = repo->Begin();
    auto put = repo->PutVersion(*tx, record);
    assert(put);
    tx->Commit();
  }

  bool HasDraft(const std::string& id) {
    auto tx = repo->Begin();
    return repo->GetDraft(*tx, id).has_value();
  }

  std::size_t VersionCount() {
    auto tx = repo->Begin();
    return repo->ListVersions(*tx).size();
  }
};

void TestUnderLimitIsNoop() {
  Fixture f;
  f.PutDraft("a", 10, DraftStatus::kFinalized, 1);

  auto report = f.Enforcer(100).Enforce();
  assert(report.bytes_before == 10);
  assert(report.deleted_drafts.empty());
  assert(f.HasDraft("a"));
  assert(f.removed.empty());
}

void TestFinalizedDeletedBeforeActiveDraft() {
  Fixture f;
  f.PutDraft("finalized-old", 5, DraftStatus::kFinalized, 1);
  f.PutDraft("working", 96, DraftStatus::kDraft, 2);

  auto report = f.Enforcer(100).Enforce();

  assert(report.bytes_before == 101);
  assert(report.bytes_after == 96);
  assert(!report.over_limit);
  assert(report.deleted_drafts == std::vector<std::string>{"finalized-old"});
  assert(!f.HasDraft("finalized-old"));
  assert(f.HasDraft("working"));
  assert(f.removed == std::vector<std::string>{"finalized-old"});

  auto tx       = f.repo->Begin();
  auto metadata = f.repo->GetStorageMetadata(*tx);
  assert(metadata.has_value());
  assert(metadata->total_size_bytes == 96);
  assert(metadata->draft_count == 1);
}

void TestOldestFinalizedGoesFirst() {
  Fixture f;
  f.PutDraft("newer", 40, DraftStatus::kFinalized, 20);
  f.PutDraft("older", 40, DraftStatus::kFinalized, 10);
  f.PutDraft("finalizing", 40, DraftStatus::kFinalizing, 5);

  auto report = f.Enforcer(100).Enforce();
  assert(report.deleted_drafts == std::vector<std::string>{"older"});
  assert(f.HasDraft("newer"));
  assert(f.HasDraft("finalizing"));
}

void TestFinalizedDraftTakesItsVersionsAlong() {
  Fixture f;
  f.PutDraft("done", 10, DraftStatus::kFinalized, 1);
  f.PutVersion("done", 1, 50, 1);
  f.PutDraft("working", 60, DraftStatus::kDraft, 2);

  auto report = f.Enforcer(100).Enforce();
  assert(report.deleted_drafts.size() == 1);
  assert(report.deleted_versions == 0);
  assert(f.VersionCount() == 0);
  assert(report.bytes_after == 60);
}

void TestVersionsPrunedOldestFirstWhenNoFinalizedLeft() {
  Fixture f;
  f.PutDraft("working", 50, DraftStatus::kDraft, 100);
  f.PutVersion("working", 1, 30, 10);
  f.PutVersion("working", 2, 30, 20);
  f.PutVersion("working", 3, 30, 30);

  auto report = f.Enforcer(100).Enforce();
  assert(report.deleted_drafts.empty());
  assert(report.deleted_versions == 2);
  assert(report.bytes_after == 80);

  auto tx        = f.repo->Begin();
  auto remaining = f.repo->ListVersions(*tx);
  assert(remaining.size() == 1);
  assert(remaining[0].version == 3);
}

void TestActiveDraftsAloneOverLimitAreKept() {
  Fixture f;
  f.PutDraft("big", 150, DraftStatus::kDraft, 1);
  f.PutDraft("finalizing", 20, DraftStatus::kFinalizing, 2);

  auto enforcer = f.Enforcer(100);
  auto report   = enforcer.Enforce();
  assert(report.over_limit);
  assert(f.HasDraft("big"));
  assert(f.HasDraft("finalizing"));

  // idempotent
  auto again = enforcer.Enforce();
  assert(again.over_limit);
  assert(again.deleted_drafts.empty());
}

} // namespace

int main() {
  TestUnderLimitIsNoop();
  TestFinalizedDeletedBeforeActiveDraft();
  TestOldestFinalizedGoesFirst();
  TestFinalizedDraftTakesItsVersionsAlong();
  TestVersionsPrunedOldestFirstWhenNoFinalizedLeft();
  TestActiveDraftsAloneOverLimitAreKept();

  std::cout << "draft_manager_unit_quota_enforcer: pass\n";
  return 0;
}
