#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include "internal/export/export_file_ref.hpp"

namespace favorites::exporter {

enum class ProgressState {
  kIdle,
  kStarted,
  kSucceeded,
  kFailed,
};

enum class MessageSeverity {
  kInfo,
  kWarning,
};

std::string_view ToString(ProgressState state);

struct ProgressPresentation {
  ProgressState state = ProgressState::kIdle;
  std::string   title;
  std::string   text;
  bool          indeterminate = false;

  // Actionable result (open / share the file).
  std::optional<ExportFileRef> action;
};

/*
  Status presentation side channel (notification area, console, ...).

  Presentations are addressed by channel id; Show() on an id replaces
  what is shown there.
*/
class ProgressPresenter {
 public:
  virtual ~ProgressPresenter() = default;

  virtual void Show(int channel_id, const ProgressPresentation& presentation) = 0;
  virtual void Cancel(int channel_id)                                         = 0;

  // Secondary, lower-severity signal. Not tied to a channel.
  virtual void ShowMessage(MessageSeverity severity, const std::string& text) = 0;
};

// Presents everything through the process logger.
class LogProgressPresenter final : public ProgressPresenter {
 public:
  void Show(int channel_id, const ProgressPresentation& presentation) override;
  void Cancel(int channel_id) override;
  void ShowMessage(MessageSeverity severity, const std::string& text) override;
};

/*
  Per-export progress state machine.

      kIdle -> kStarted -> kSucceeded
                        -> kFailed

  Any other transition throws util::InvalidState. A terminal state
  cancels the started presentation before showing itself.
*/
class ProgressNotifier {
 public:
  ProgressNotifier(std::shared_ptr<ProgressPresenter> presenter, int channel_id, std::string title);

  void Started();
  void Succeeded(std::optional<ExportFileRef> file);
  void Failed();

  void Message(MessageSeverity severity, const std::string& text);

  ProgressState State() const;

  int ChannelId() const {
    return channel_id_;
  }

 private:
  void Transition(ProgressState from, ProgressState to);

  std::shared_ptr<ProgressPresenter> presenter_;
  int                                channel_id_;
  std::string                        title_;

  mutable std::mutex mutex_;
  ProgressState      state_ = ProgressState::kIdle;
};

} // namespace favorites::exporter
