#include "internal/factory.hpp"

#include <arrow/filesystem/localfs.h>

#include <stdexcept>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/observability/logging.hpp"

#if DRAFT_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

namespace draft::factory {

using observability::BoolField;
using observability::StringField;
using observability::UintField;

namespace {

std::shared_ptr<db::Repository> BuildRepository(const draft::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if DRAFT_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path());
    DRAFT_LOG_INFO("record store", {StringField("backend", "sqlite"), StringField("path", sqlite_db->Path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  DRAFT_LOG_INFO("record store", {StringField("backend", "memory")});
  return std::make_shared<db::memory::MemoryRepository>();
}

std::shared_ptr<storage::FilesystemMirror> BuildMirror(const draft::runtime::config::RuntimeConfig& config) {
  const auto& mirror = config.mirror();
  if (mirror.disabled()) {
    return std::make_shared<storage::FilesystemMirror>(nullptr, std::filesystem::path{});
  }

  auto root = storage::FilesystemMirror::ResolveRoot(mirror.root_path(), mirror.app_name());
  return std::make_shared<storage::FilesystemMirror>(std::make_shared<arrow::fs::LocalFileSystem>(), std::move(root));
}

} // namespace

core::DraftEngineOptions OptionsFromConfig(const draft::runtime::config::RuntimeConfig& config) {
  const auto& limits = config.limits();

  core::DraftEngineOptions options;
  if (limits.storage_soft_limit_bytes() > 0) options.storage_soft_limit_bytes = limits.storage_soft_limit_bytes();
  if (limits.max_versions_per_document() > 0) options.max_versions_per_document = limits.max_versions_per_document();
  if (limits.max_change_log_entries() > 0) options.max_change_log_entries = limits.max_change_log_entries();
  if (limits.cleanup_threshold_days() > 0) options.cleanup_threshold_days = limits.cleanup_threshold_days();
  return options;
}

/*
    Build full application dependency graph
*/
Application Build(const draft::runtime::config::RuntimeConfig& config) {
  Application app;

  const auto cache_max_bytes = config.limits().cache_max_bytes() > 0 ? config.limits().cache_max_bytes() : cache::BufferCache::kDefaultMaxBytes;

  app.repository = BuildRepository(config);
  app.mirror     = BuildMirror(config);
  app.cache      = std::make_shared<cache::BufferCache>(cache_max_bytes);
  app.engine     = std::make_shared<core::DraftEngine>(app.repository, app.mirror, app.cache, OptionsFromConfig(config));

  if (config.updates().debounce_ms() > 0) {
    app.update_debounce = std::chrono::milliseconds(config.updates().debounce_ms());
  }

  DRAFT_LOG_INFO("application built", {BoolField("mirror_enabled", app.mirror->Enabled()), UintField("cache_max_bytes", cache_max_bytes),
                                        UintField("debounce_ms", static_cast<uint64_t>(app.update_debounce.count()))});

  return app;
}

} // namespace draft::factory
