#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/cache/change_sink.hpp"
#include "internal/cache/favorite_id_cache.hpp"
#include "internal/cache/favorite_manager.hpp"
#include "internal/db/api/saved_item_repository.hpp"
#include "internal/export/export_orchestrator.hpp"
#include "internal/export/progress_notifier.hpp"
#include "internal/runtime/event_loop.hpp"
#include "internal/runtime/worker_pool.hpp"

namespace favorites::factory {

/*
  RuntimeDependencies

  Owns all long-lived objects of the process. The worker pool is
  started; the event loop must be drained by the caller's thread.
*/
struct RuntimeDependencies {
  std::shared_ptr<db::SavedItemRepository> repository;
  std::shared_ptr<cache::FavoriteIdCache>  id_cache;

  std::shared_ptr<runtime::WorkerPool> io;
  std::shared_ptr<runtime::EventLoop>  main;

  std::shared_ptr<cache::FavoriteManager>        manager;
  std::shared_ptr<exporter::ExportOrchestrator> orchestrator;
};

/*
  BuildRuntime

  Composition root. The only place that knows concrete store,
  delivery and share types.

  sync may be null (no background content refresh).
*/
RuntimeDependencies BuildRuntime(const favorites::runtime::config::RuntimeConfig& config,
                                 std::shared_ptr<cache::ChangeSink> change_sink,
                                 std::shared_ptr<exporter::ProgressPresenter> presenter,
                                 std::shared_ptr<cache::SyncScheduler> sync = nullptr);

} // namespace favorites::factory
