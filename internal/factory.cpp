#include "factory.hpp"

#include <chrono>
#include <stdexcept>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/export/downloads_promoter.hpp"
#include "internal/export/export_file_store.hpp"
#include "internal/export/share_launcher.hpp"
#include "internal/observability/logging.hpp"
#if FAVORITES_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

namespace favorites::factory {

using RuntimeConfig = favorites::runtime::config::RuntimeConfig;

namespace {

std::shared_ptr<db::SavedItemRepository> BuildRepository(const RuntimeConfig& config) {
  const auto& store = config.store();
  if (store.has_sqlite()) {
#if FAVORITES_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(store.sqlite().path(), store.sqlite().wal_mode());
    db::sqlite::SqliteRepository::BootstrapSchema(*sqlite_db);
    FAVORITES_LOG_INFO("Opened sqlite store", {observability::StringField("path", store.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  FAVORITES_LOG_INFO("Using in-memory store");
  return std::make_shared<db::memory::MemoryRepository>();
}

std::shared_ptr<exporter::DownloadsPromoter> BuildPromoter(const RuntimeConfig& config) {
  const auto& downloads = config.downloads();

  exporter::DownloadsPromoter::Options options;
  options.relative_path = downloads.relative_path();
  options.file_basename = config.exporter().file_basename();

  switch (downloads.mode()) {
    case favorites::runtime::config::DOWNLOADS_MODE_DISABLED:
      return nullptr;

    case favorites::runtime::config::DOWNLOADS_MODE_LEGACY:
      options.era = exporter::StorageEra::kLegacy;
      return std::make_shared<exporter::DownloadsPromoter>(
          std::move(options), nullptr, std::make_shared<exporter::XdgDownloadsResolver>(downloads.legacy_directory()));

    default:
      options.era = exporter::StorageEra::kScoped;
      return std::make_shared<exporter::DownloadsPromoter>(
          std::move(options), std::make_shared<exporter::DirectoryMediaIndex>(downloads.media_root()), nullptr);
  }
}

exporter::ExportSettings BuildExportSettings(const RuntimeConfig& config) {
  const auto& exporter_config = config.exporter();

  exporter::ExportSettings settings;
  settings.serialize.document_title          = exporter_config.document_title();
  settings.serialize.discussion_url_template = exporter_config.discussion_url_template();
  settings.share_delay                       = std::chrono::milliseconds(exporter_config.share_delay_ms());
  return settings;
}

} // namespace

/*
    Build full application dependency graph
*/
RuntimeDependencies BuildRuntime(const RuntimeConfig& config, std::shared_ptr<cache::ChangeSink> change_sink,
                                 std::shared_ptr<exporter::ProgressPresenter> presenter,
                                 std::shared_ptr<cache::SyncScheduler> sync) {
  RuntimeDependencies deps;

  // ------------------------------------------------------------------
  // Execution contexts
  // ------------------------------------------------------------------
  deps.io   = std::make_shared<runtime::WorkerPool>(config.workers().threads());
  deps.main = std::make_shared<runtime::EventLoop>();

  // ------------------------------------------------------------------
  // Store + cache
  // ------------------------------------------------------------------
  deps.repository = BuildRepository(config);
  deps.id_cache   = std::make_shared<cache::FavoriteIdCache>();

  deps.manager = std::make_shared<cache::FavoriteManager>(deps.repository, deps.id_cache, std::move(change_sink), std::move(sync),
                                                          deps.io, deps.main);
  deps.manager->HydrateIdCache();

  // ------------------------------------------------------------------
  // Export
  // ------------------------------------------------------------------
  auto files = std::make_shared<exporter::ExportFileStore>(config.exporter().directory(), config.exporter().file_basename());

  std::shared_ptr<exporter::ShareLauncher> share_launcher;
  if (!config.share().command().empty()) {
    share_launcher = std::make_shared<exporter::CommandShareLauncher>(config.share().command());
  }

  deps.orchestrator = std::make_shared<exporter::ExportOrchestrator>(deps.repository, std::move(files), BuildPromoter(config),
                                                                     std::move(share_launcher), std::move(presenter), deps.io,
                                                                     deps.main, BuildExportSettings(config));

  deps.io->Start();
  return deps;
}

} // namespace favorites::factory
