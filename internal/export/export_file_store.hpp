#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <string_view>

#include "internal/export/export_file_ref.hpp"
#include "internal/model/export_format.hpp"

namespace favorites::exporter {

/*
  One export run's document.

  file is the shared fixed-name file and may be replaced by a later run
  of the same format. snapshot is private to this run until Release().
*/
struct StagedExport {
  ExportFileRef file;
  ExportFileRef snapshot;
  std::uint64_t generation = 0;
};

/*
  App-private directory holding the ephemeral share file.

  One file per format, named <basename>.<ext>. Each Write() replaces the
  previous file of that name:
      write tmp -> flush -> rename
  so readers never see a partial document.
*/
class ExportFileStore {
 public:
  ExportFileStore(std::filesystem::path directory, std::string basename);

  ExportFileRef Write(model::ExportFormat format, std::string_view content);

  // Write() plus a per-run snapshot under <directory>/.snapshots.
  StagedExport Stage(model::ExportFormat format, std::string_view content);

  // True while the fixed-name file still holds this run's document.
  bool IsCurrent(const StagedExport& staged) const;

  void Release(const StagedExport& staged);

  std::filesystem::path PathFor(model::ExportFormat format) const;

  const std::filesystem::path& Directory() const {
    return directory_;
  }

  const std::string& Basename() const {
    return basename_;
  }

 private:
  void Commit(model::ExportFormat format, std::string_view content, std::uint64_t generation, const std::filesystem::path& snapshot);

  std::filesystem::path directory_;
  std::string           basename_;

  std::atomic<std::uint64_t> next_generation_{0};

  mutable std::mutex                          mutex_;
  std::map<model::ExportFormat, std::uint64_t> current_;
};

} // namespace favorites::exporter
