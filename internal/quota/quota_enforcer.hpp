#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "internal/changelog/change_logger.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/quota/storage_usage.hpp"
#include "internal/versioning/version_manager.hpp"

namespace draft::quota {

struct QuotaReport {
  uint64_t bytes_before = 0;
  uint64_t bytes_after  = 0;

  std::vector<std::string> deleted_drafts;
  std::size_t              deleted_versions = 0;

  bool over_limit = false; // still over after pruning
};

/*
  Keeps the record store under a soft byte limit.

    1. finalized drafts, oldest last_modified first (with their versions
       and change log)
    2. version snapshots of any document, oldest created_at first

  Active (draft / finalizing) rows are never touched; if they alone exceed
  the limit the enforcer logs and gives up. Never throws for quota reasons.
*/
class QuotaEnforcer {
 public:
  static constexpr uint64_t kDefaultSoftLimitBytes = 100ULL * 1024 * 1024;

  // Invoked after commit with the id of every deleted draft.
  using RemovedCallback = std::function<void(const std::string& document_id)>;

  QuotaEnforcer(std::shared_ptr<db::Repository> repository, std::shared_ptr<versioning::VersionManager> versions,
                std::shared_ptr<changelog::ChangeLogger> changes, uint64_t soft_limit_bytes = kDefaultSoftLimitBytes,
                RemovedCallback on_removed = {});

  QuotaReport Enforce();

  uint64_t SoftLimitBytes() const {
    return soft_limit_bytes_;
  }

 private:
  std::shared_ptr<db::Repository>            repository_;
  std::shared_ptr<versioning::VersionManager> versions_;
  std::shared_ptr<changelog::ChangeLogger>   changes_;
  uint64_t                                   soft_limit_bytes_;
  RemovedCallback                            on_removed_;
};

} // namespace draft::quota
