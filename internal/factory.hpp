#pragma once

#include <chrono>
#include <memory>

#include "config/config.pb.h"
#include "internal/cache/buffer_cache.hpp"
#include "internal/core/draft_engine.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/storage/filesystem_mirror.hpp"

namespace draft::factory {

/*
  Application

  Owns all long-lived objects of one draft store.
*/
struct Application {
  std::shared_ptr<db::Repository>            repository;
  std::shared_ptr<storage::FilesystemMirror> mirror;
  std::shared_ptr<cache::BufferCache>        cache;
  std::shared_ptr<core::DraftEngine>         engine;

  std::chrono::milliseconds update_debounce{300};
};

core::DraftEngineOptions OptionsFromConfig(const draft::runtime::config::RuntimeConfig& config);

/*
  Build

  Constructs the whole store from runtime config. The engine is returned
  uninitialized; the first call on it (or Initialize()) opens the store.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB types.
*/
Application Build(const draft::runtime::config::RuntimeConfig& config);

} // namespace draft::factory
