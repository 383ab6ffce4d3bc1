#include "export_file_store.hpp"

#include <stdexcept>

#include "internal/export/writable_sink.hpp"
#include "internal/observability/logging.hpp"

namespace favorites::exporter {

using observability::StringField;

ExportFileStore::ExportFileStore(std::filesystem::path directory, std::string basename)
    : directory_(std::move(directory)), basename_(std::move(basename)) {
  if (basename_.empty()) {
    throw std::invalid_argument("export file basename must not be empty");
  }
}

std::filesystem::path ExportFileStore::PathFor(model::ExportFormat format) const {
  return directory_ / (basename_ + "." + std::string(model::Extension(format)));
}

ExportFileRef ExportFileStore::Write(model::ExportFormat format, std::string_view content) {
  Commit(format, content, ++next_generation_, {});
  return ExportFileRef{PathFor(format), format};
}

StagedExport ExportFileStore::Stage(model::ExportFormat format, std::string_view content) {
  const auto generation = ++next_generation_;
  const auto snapshot   = directory_ / ".snapshots" /
                        (basename_ + "-" + std::to_string(generation) + "." + std::string(model::Extension(format)));
  Commit(format, content, generation, snapshot);

  StagedExport staged;
  staged.generation = generation;
  staged.file       = ExportFileRef{PathFor(format), format};
  staged.snapshot   = ExportFileRef{snapshot, format};
  return staged;
}

void ExportFileStore::Commit(model::ExportFormat format, std::string_view content, std::uint64_t generation,
                             const std::filesystem::path& snapshot) {
  std::filesystem::create_directories(directory_);

  const auto final_path = PathFor(format);
  const auto tmp_path   = std::filesystem::path(final_path.string() + ".tmp." + std::to_string(generation));

  try {
    FileSink sink(tmp_path);
    sink.Write(content);
    sink.Flush();
    sink.Close();

    if (!snapshot.empty()) {
      std::filesystem::create_directories(snapshot.parent_path());
      std::filesystem::copy_file(tmp_path, snapshot, std::filesystem::copy_options::overwrite_existing);
    }

    std::scoped_lock lock(mutex_);
    std::filesystem::rename(tmp_path, final_path);
    current_[format] = generation;
  } catch (...) {
    std::error_code ignored;
    std::filesystem::remove(tmp_path, ignored);
    if (!snapshot.empty()) {
      std::filesystem::remove(snapshot, ignored);
    }
    throw;
  }
}

bool ExportFileStore::IsCurrent(const StagedExport& staged) const {
  std::scoped_lock lock(mutex_);
  auto             it = current_.find(staged.file.format);
  return it != current_.end() && it->second == staged.generation;
}

void ExportFileStore::Release(const StagedExport& staged) {
  std::error_code ec;
  std::filesystem::remove(staged.snapshot.path, ec);
  if (ec) {
    FAVORITES_LOG_WARN("Failed to remove export snapshot", {StringField("path", staged.snapshot.path.string()), StringField("error", ec.message())});
  }
}

} // namespace favorites::exporter
