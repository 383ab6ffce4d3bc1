#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "internal/cache/result_cursor.hpp"
#include "internal/db/api/saved_item_repository.hpp"
#include "internal/export/destination.hpp"
#include "internal/export/document_serializer.hpp"
#include "internal/export/downloads_promoter.hpp"
#include "internal/export/export_file_store.hpp"
#include "internal/export/progress_notifier.hpp"
#include "internal/export/share_launcher.hpp"
#include "internal/runtime/executor.hpp"

namespace favorites::exporter {

struct ExportSettings {
  SerializeOptions          serialize;
  std::string               notification_title = "Export saved stories";
  std::chrono::milliseconds share_delay{1500};
};

/*
  Export pipelines:

      acquire -> serialize -> deliver -> notify

  Acquire, serialize and deliver run on the io executor; every progress
  update and completion callback runs on the main executor. Each invocation owns
  its format, its progress notifier and its channel id. An empty result
  and any stage failure both end as "export failed".

  Must be owned by a std::shared_ptr. Pipelines keep it alive until they
  finish; there is no cancellation.
*/
class ExportOrchestrator : public std::enable_shared_from_this<ExportOrchestrator> {
 public:
  using ShareCallback       = std::function<void(const std::optional<ExportFileRef>& file)>;
  using DestinationCallback = std::function<void(bool success)>;

  // promoter and share_launcher may be null (feature disabled).
  ExportOrchestrator(std::shared_ptr<db::SavedItemRepository> repository, std::shared_ptr<ExportFileStore> files,
                     std::shared_ptr<DownloadsPromoter> promoter, std::shared_ptr<ShareLauncher> share_launcher,
                     std::shared_ptr<ProgressPresenter> presenter, std::shared_ptr<runtime::Executor> io,
                     std::shared_ptr<runtime::Executor> main, ExportSettings settings);

  /*
    Writes the ephemeral share file. On success this run's document is
    promoted into Downloads (best effort) and the share launcher runs
    after the share delay, unless a later export of the same format has
    replaced the file by then. done receives the file or nullopt.
  */
  void ExportToShare(std::optional<std::string> filter, model::ExportFormat format, ShareCallback done = {});

  // Writes straight into a user-chosen destination. done receives the outcome.
  void ExportToDestination(std::optional<std::string> filter, model::ExportFormat format,
                           std::shared_ptr<Destination> destination, DestinationCallback done = {});

 private:
  std::shared_ptr<ProgressNotifier> NewNotifier();

  // acquire + serialize; nullopt when there is nothing to deliver
  std::optional<std::string> Produce(const std::optional<std::string>& filter, model::ExportFormat format) const;

  std::optional<cache::ResultCursor> Acquire(const std::optional<std::string>& filter) const;

  void FinishShare(const std::shared_ptr<ProgressNotifier>& notifier, const std::optional<StagedExport>& staged,
                   const ShareCallback& done);
  void Promote(const std::shared_ptr<ProgressNotifier>& notifier, const StagedExport& staged);
  void LaunchShare(const StagedExport& staged);

  std::shared_ptr<db::SavedItemRepository> repository_;
  std::shared_ptr<ExportFileStore>         files_;
  std::shared_ptr<DownloadsPromoter>       promoter_;
  std::shared_ptr<ShareLauncher>           share_launcher_;
  std::shared_ptr<ProgressPresenter>       presenter_;
  std::shared_ptr<runtime::Executor>       io_;
  std::shared_ptr<runtime::Executor>       main_;
  ExportSettings                           settings_;

  std::atomic<int> next_channel_{1};
};

} // namespace favorites::exporter
