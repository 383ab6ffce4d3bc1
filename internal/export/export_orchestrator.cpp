#include "export_orchestrator.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace favorites::exporter {

using observability::BoolField;
using observability::IntField;
using observability::StringField;

namespace {

void LogStageFailure(std::string_view stage, model::ExportFormat format, const std::exception& e) {
  FAVORITES_LOG_ERROR("Export failed",
                      {StringField("stage", stage), StringField("format", model::Name(format)), StringField("error", e.what())});
}

} // namespace

ExportOrchestrator::ExportOrchestrator(std::shared_ptr<db::SavedItemRepository> repository, std::shared_ptr<ExportFileStore> files,
                                       std::shared_ptr<DownloadsPromoter> promoter, std::shared_ptr<ShareLauncher> share_launcher,
                                       std::shared_ptr<ProgressPresenter> presenter, std::shared_ptr<runtime::Executor> io,
                                       std::shared_ptr<runtime::Executor> main, ExportSettings settings)
    : repository_(std::move(repository)),
      files_(std::move(files)),
      promoter_(std::move(promoter)),
      share_launcher_(std::move(share_launcher)),
      presenter_(std::move(presenter)),
      io_(std::move(io)),
      main_(std::move(main)),
      settings_(std::move(settings)) {
  if (!repository_ || !files_ || !presenter_ || !io_ || !main_) {
    throw std::invalid_argument("export orchestrator dependencies must be non-null");
  }
}

std::shared_ptr<ProgressNotifier> ExportOrchestrator::NewNotifier() {
  return std::make_shared<ProgressNotifier>(presenter_, next_channel_++, settings_.notification_title);
}

// ------------------------------------------------------------
// Acquire / serialize
// ------------------------------------------------------------

std::optional<cache::ResultCursor> ExportOrchestrator::Acquire(const std::optional<std::string>& filter) const {
  auto results = (filter && !filter->empty()) ? repository_->QueryByTitle(*filter) : repository_->QueryAll();
  if (!results) {
    throw util::StoreError("query returned no result set");
  }

  cache::ResultCursor cursor(std::move(results));
  if (!cursor.MoveToFirst()) {
    return std::nullopt;
  }
  return cursor;
}

std::optional<std::string> ExportOrchestrator::Produce(const std::optional<std::string>& filter, model::ExportFormat format) const {
  std::optional<cache::ResultCursor> cursor;
  try {
    cursor = Acquire(filter);
  } catch (const std::exception& e) {
    LogStageFailure("acquire", format, e);
    return std::nullopt;
  }

  if (!cursor) {
    FAVORITES_LOG_WARN("Nothing to export", {StringField("format", model::Name(format)), StringField("filter", filter.value_or(""))});
    return std::nullopt;
  }

  try {
    auto items = cursor->ReadAll();
    cursor->Close();

    auto options        = settings_.serialize;
    options.exported_at = util::Now();

    FAVORITES_LOG_DEBUG("Serializing export", {StringField("format", model::Name(format)), IntField("count", static_cast<std::int64_t>(items.size()))});
    return Serialize(format, items, options);
  } catch (const std::exception& e) {
    LogStageFailure("serialize", format, e);
    return std::nullopt;
  }
}

// ------------------------------------------------------------
// Export to share
// ------------------------------------------------------------

void ExportOrchestrator::ExportToShare(std::optional<std::string> filter, model::ExportFormat format, ShareCallback done) {
  FAVORITES_LOG_INFO("Starting export", {StringField("format", model::Name(format)), StringField("target", "share")});

  auto notifier = NewNotifier();
  main_->Post([notifier] { notifier->Started(); });

  auto self = shared_from_this();
  io_->Post([self, filter = std::move(filter), format, notifier, done = std::move(done)] {
    std::optional<StagedExport> staged;

    if (auto content = self->Produce(filter, format)) {
      try {
        staged = self->files_->Stage(format, *content);
      } catch (const std::exception& e) {
        LogStageFailure("deliver", format, e);
      }
    }

    self->main_->Post([self, notifier, staged, done] { self->FinishShare(notifier, staged, done); });
  });
}

void ExportOrchestrator::FinishShare(const std::shared_ptr<ProgressNotifier>& notifier, const std::optional<StagedExport>& staged,
                                     const ShareCallback& done) {
  std::optional<ExportFileRef> file;
  if (staged) {
    file = staged->file;
  }
  FAVORITES_LOG_INFO("Export done", {BoolField("success", file.has_value()), StringField("file", file ? file->Uri() : std::string())});

  if (file) {
    notifier->Succeeded(file);
  } else {
    notifier->Failed();
  }
  if (done) {
    done(file);
  }
  if (!staged) {
    return;
  }

  // Promotion reads this run's snapshot and then releases it.
  auto self = shared_from_this();
  io_->Post([self, notifier, staged = *staged] { self->Promote(notifier, staged); });

  if (share_launcher_) {
    main_->PostDelayed([self, staged = *staged] { self->LaunchShare(staged); }, settings_.share_delay);
  }
}

void ExportOrchestrator::Promote(const std::shared_ptr<ProgressNotifier>& notifier, const StagedExport& staged) {
  if (!promoter_) {
    files_->Release(staged);
    return;
  }

  auto saved = promoter_->Promote(staged.snapshot);
  files_->Release(staged);

  main_->Post([notifier, saved] {
    if (saved) {
      notifier->Message(MessageSeverity::kInfo, "Saved to Downloads folder: " + *saved);
    } else {
      notifier->Message(MessageSeverity::kWarning, "Could not save to Downloads. Use share option.");
    }
  });
}

void ExportOrchestrator::LaunchShare(const StagedExport& staged) {
  if (!files_->IsCurrent(staged)) {
    FAVORITES_LOG_INFO("Skipping share of a replaced export", {StringField("file", staged.file.Uri())});
    return;
  }

  try {
    share_launcher_->Share(staged.file);
  } catch (const std::exception& e) {
    FAVORITES_LOG_ERROR("Failed to open share flow", {StringField("file", staged.file.Uri()), StringField("error", e.what())});
  }
}

// ------------------------------------------------------------
// Export to destination
// ------------------------------------------------------------

void ExportOrchestrator::ExportToDestination(std::optional<std::string> filter, model::ExportFormat format,
                                             std::shared_ptr<Destination> destination, DestinationCallback done) {
  FAVORITES_LOG_INFO("Starting export",
                     {StringField("format", model::Name(format)), StringField("target", destination ? destination->Describe() : "<none>")});

  auto notifier = NewNotifier();
  main_->Post([notifier] { notifier->Started(); });

  auto self = shared_from_this();
  io_->Post([self, filter = std::move(filter), format, destination = std::move(destination), notifier, done = std::move(done)] {
    bool success = false;

    if (auto content = self->Produce(filter, format)) {
      try {
        if (!destination) {
          throw util::DeliveryError("no destination");
        }
        auto sink = destination->Open();
        if (!sink) {
          throw util::DeliveryError("cannot open destination " + destination->Describe());
        }
        sink->Write(*content);
        sink->Flush();
        sink->Close();
        success = true;
      } catch (const std::exception& e) {
        LogStageFailure("deliver", format, e);
      }
    }

    self->main_->Post([notifier, success, done] {
      FAVORITES_LOG_INFO("Export to destination done", {BoolField("success", success)});
      if (success) {
        notifier->Succeeded(std::nullopt);
      } else {
        notifier->Failed();
      }
      if (done) {
        done(success);
      }
    });
  });
}

} // namespace favorites::exporter
