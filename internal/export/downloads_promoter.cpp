#include "downloads_promoter.hpp"

#include <cstdlib>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace favorites::exporter {

using observability::StringField;

// ------------------------------------------------------------
// DirectoryMediaIndex
// ------------------------------------------------------------

DirectoryMediaIndex::DirectoryMediaIndex(std::filesystem::path root) : root_(std::move(root)) {
}

std::optional<MediaEntry> DirectoryMediaIndex::Register(const std::string& display_name, const std::string& /*mime_type*/,
                                                        const std::string& relative_path) {
  if (display_name.empty()) {
    return std::nullopt;
  }

  std::lock_guard lock(mutex_);

  const auto directory = root_ / relative_path;
  std::filesystem::create_directories(directory);

  const std::filesystem::path requested(display_name);
  const auto                  stem      = requested.stem().string();
  const auto                  extension = requested.extension().string();

  std::string candidate = display_name;
  for (int n = 1; std::filesystem::exists(directory / candidate); ++n) {
    candidate = stem + " (" + std::to_string(n) + ")" + extension;
  }

  // Reserve the name before releasing the lock.
  FileSink(directory / candidate).Close();

  return MediaEntry{candidate, directory / candidate};
}

std::unique_ptr<WritableSink> DirectoryMediaIndex::OpenWrite(const MediaEntry& entry) {
  return std::make_unique<FileSink>(entry.location);
}

void DirectoryMediaIndex::Discard(const MediaEntry& entry) {
  std::error_code ec;
  std::filesystem::remove(entry.location, ec);
  if (ec) {
    FAVORITES_LOG_WARN("Failed to discard media entry", {StringField("location", entry.location.string()), StringField("error", ec.message())});
  }
}

// ------------------------------------------------------------
// XdgDownloadsResolver
// ------------------------------------------------------------

XdgDownloadsResolver::XdgDownloadsResolver(std::filesystem::path override_directory) : override_(std::move(override_directory)) {
}

std::optional<std::filesystem::path> XdgDownloadsResolver::DownloadsDirectory() const {
  if (!override_.empty()) {
    return override_;
  }
  if (const char* xdg = std::getenv("XDG_DOWNLOAD_DIR"); xdg && *xdg) {
    return std::filesystem::path(xdg);
  }
  if (const char* home = std::getenv("HOME"); home && *home) {
    return std::filesystem::path(home) / "Downloads";
  }
  return std::nullopt;
}

// ------------------------------------------------------------
// DownloadsPromoter
// ------------------------------------------------------------

DownloadsPromoter::DownloadsPromoter(Options options, std::shared_ptr<SharedMediaIndex> media_index,
                                     std::shared_ptr<PublicDirectoryResolver> directory_resolver)
    : options_(std::move(options)), media_index_(std::move(media_index)), directory_resolver_(std::move(directory_resolver)) {
}

std::string DownloadsPromoter::DisplayName(const std::string& basename, model::ExportFormat format, util::TimePoint now) {
  return basename + "-" + util::FormatLocal(now, util::kFileStampPattern) + "." + std::string(model::Extension(format));
}

std::optional<std::string> DownloadsPromoter::Promote(const ExportFileRef& file, util::TimePoint now) {
  const auto display_name = DisplayName(options_.file_basename, file.format, now);

  try {
    auto saved = options_.era == StorageEra::kScoped ? PromoteScoped(file, display_name) : PromoteLegacy(file, display_name);
    FAVORITES_LOG_INFO("Saved export to Downloads", {StringField("saved", saved)});
    return saved;
  } catch (const std::exception& e) {
    FAVORITES_LOG_ERROR("Failed to save export to Downloads",
                        {StringField("file", file.path.string()), StringField("display_name", display_name), StringField("error", e.what())});
    return std::nullopt;
  }
}

std::string DownloadsPromoter::PromoteScoped(const ExportFileRef& file, const std::string& display_name) {
  if (!media_index_) {
    throw util::DeliveryError("no shared media index configured");
  }

  auto entry = media_index_->Register(display_name, std::string(model::MimeType(file.format)), options_.relative_path);
  if (!entry) {
    throw util::DeliveryError("media index refused entry " + display_name);
  }

  try {
    auto sink = media_index_->OpenWrite(*entry);
    if (!sink) {
      throw util::DeliveryError("cannot open media entry " + entry->display_name);
    }
    CopyFile(file.path, *sink);
    sink->Close();
  } catch (const std::exception&) {
    media_index_->Discard(*entry);
    throw;
  }
  return entry->display_name;
}

std::string DownloadsPromoter::PromoteLegacy(const ExportFileRef& file, const std::string& display_name) {
  if (!directory_resolver_) {
    throw util::DeliveryError("no downloads directory resolver configured");
  }

  auto directory = directory_resolver_->DownloadsDirectory();
  if (!directory) {
    throw util::DeliveryError("downloads directory unavailable");
  }
  std::filesystem::create_directories(*directory);

  const auto target = std::filesystem::absolute(*directory / display_name);
  FileSink   sink(target);
  CopyFile(file.path, sink);
  sink.Close();
  return target.string();
}

} // namespace favorites::exporter
