#include "progress_notifier.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace favorites::exporter {

using observability::IntField;
using observability::StringField;

std::string_view ToString(ProgressState state) {
  switch (state) {
    case ProgressState::kIdle:
      return "idle";
    case ProgressState::kStarted:
      return "started";
    case ProgressState::kSucceeded:
      return "succeeded";
    case ProgressState::kFailed:
      return "failed";
  }
  return "unknown";
}

// ------------------------------------------------------------
// LogProgressPresenter
// ------------------------------------------------------------

void LogProgressPresenter::Show(int channel_id, const ProgressPresentation& presentation) {
  const auto level = presentation.state == ProgressState::kFailed ? spdlog::level::err : spdlog::level::info;
  observability::Log(level, presentation.text,
                     {IntField("channel", channel_id), StringField("state", ToString(presentation.state)),
                      StringField("file", presentation.action ? presentation.action->Uri() : std::string())});
}

void LogProgressPresenter::Cancel(int channel_id) {
  FAVORITES_LOG_DEBUG("Progress cancelled", {IntField("channel", channel_id)});
}

void LogProgressPresenter::ShowMessage(MessageSeverity severity, const std::string& text) {
  if (severity == MessageSeverity::kWarning) {
    FAVORITES_LOG_WARN(text);
  } else {
    FAVORITES_LOG_INFO(text);
  }
}

// ------------------------------------------------------------
// ProgressNotifier
// ------------------------------------------------------------

ProgressNotifier::ProgressNotifier(std::shared_ptr<ProgressPresenter> presenter, int channel_id, std::string title)
    : presenter_(std::move(presenter)), channel_id_(channel_id), title_(std::move(title)) {
  if (!presenter_) {
    throw std::invalid_argument("progress notifier requires a presenter");
  }
}

void ProgressNotifier::Transition(ProgressState from, ProgressState to) {
  std::lock_guard lock(mutex_);
  if (state_ != from) {
    throw util::InvalidState("progress cannot move from " + std::string(ToString(state_)) + " to " + std::string(ToString(to)));
  }
  state_ = to;
}

void ProgressNotifier::Started() {
  Transition(ProgressState::kIdle, ProgressState::kStarted);

  ProgressPresentation presentation;
  presentation.state         = ProgressState::kStarted;
  presentation.title         = title_;
  presentation.text          = "Exporting...";
  presentation.indeterminate = true;
  presenter_->Show(channel_id_, presentation);
}

void ProgressNotifier::Succeeded(std::optional<ExportFileRef> file) {
  Transition(ProgressState::kStarted, ProgressState::kSucceeded);
  presenter_->Cancel(channel_id_);

  ProgressPresentation presentation;
  presentation.state  = ProgressState::kSucceeded;
  presentation.title  = title_;
  presentation.text   = file ? "Export ready, select to share" : "Export saved successfully";
  presentation.action = std::move(file);
  presenter_->Show(channel_id_, presentation);
}

void ProgressNotifier::Failed() {
  Transition(ProgressState::kStarted, ProgressState::kFailed);
  presenter_->Cancel(channel_id_);

  ProgressPresentation presentation;
  presentation.state = ProgressState::kFailed;
  presentation.title = title_;
  presentation.text  = "Export failed - no saved stories or error occurred";
  presenter_->Show(channel_id_, presentation);
}

void ProgressNotifier::Message(MessageSeverity severity, const std::string& text) {
  presenter_->ShowMessage(severity, text);
}

ProgressState ProgressNotifier::State() const {
  std::lock_guard lock(mutex_);
  return state_;
}

} // namespace favorites::exporter
