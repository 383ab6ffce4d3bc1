#pragma once

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "internal/export/export_file_ref.hpp"
#include "internal/export/writable_sink.hpp"
#include "internal/util/time.hpp"

namespace favorites::exporter {

/*
  Storage API generation of the platform.

    kScoped  - files are published through a shared media index that
               owns the Downloads collection
    kLegacy  - the public Downloads directory is written directly
*/
enum class StorageEra {
  kScoped,
  kLegacy,
};

struct MediaEntry {
  std::string           display_name;
  std::filesystem::path location;
};

// Shared media collection (scoped era).
class SharedMediaIndex {
 public:
  virtual ~SharedMediaIndex() = default;

  // Reserves an entry. The index may adjust the display name to avoid
  // collisions. nullopt when the entry cannot be created.
  virtual std::optional<MediaEntry> Register(const std::string& display_name, const std::string& mime_type,
                                             const std::string& relative_path) = 0;

  virtual std::unique_ptr<WritableSink> OpenWrite(const MediaEntry& entry) = 0;

  // Drops a registered entry whose content could not be written.
  virtual void Discard(const MediaEntry& entry) = 0;
};

// Public Downloads directory lookup (legacy era).
class PublicDirectoryResolver {
 public:
  virtual ~PublicDirectoryResolver() = default;

  virtual std::optional<std::filesystem::path> DownloadsDirectory() const = 0;
};

/*
  Directory-backed shared media index.

  Entries live under <root>/<relative_path>. A taken name gets a
  " (n)" suffix before the extension.
*/
class DirectoryMediaIndex final : public SharedMediaIndex {
 public:
  explicit DirectoryMediaIndex(std::filesystem::path root);

  std::optional<MediaEntry> Register(const std::string& display_name, const std::string& mime_type,
                                     const std::string& relative_path) override;

  std::unique_ptr<WritableSink> OpenWrite(const MediaEntry& entry) override;

  void Discard(const MediaEntry& entry) override;

 private:
  std::filesystem::path root_;
  std::mutex            mutex_;
};

/*
  Resolves the Downloads directory from, in order: an explicit override,
  $XDG_DOWNLOAD_DIR, $HOME/Downloads.
*/
class XdgDownloadsResolver final : public PublicDirectoryResolver {
 public:
  explicit XdgDownloadsResolver(std::filesystem::path override_directory = {});

  std::optional<std::filesystem::path> DownloadsDirectory() const override;

 private:
  std::filesystem::path override_;
};

/*
  Best-effort copy of an export file into Downloads.

  Never throws and never blocks the primary export outcome: every failure
  is logged and reported as nullopt.
*/
class DownloadsPromoter {
 public:
  struct Options {
    StorageEra  era           = StorageEra::kScoped;
    std::string relative_path = "Downloads";
    std::string file_basename = "favorites-export";
  };

  DownloadsPromoter(Options options, std::shared_ptr<SharedMediaIndex> media_index,
                    std::shared_ptr<PublicDirectoryResolver> directory_resolver);

  // Display name (scoped) or absolute path (legacy) of the saved copy.
  std::optional<std::string> Promote(const ExportFileRef& file, util::TimePoint now = util::Now());

  // <basename>-<yyyy-MM-dd_HHmm>.<ext>
  static std::string DisplayName(const std::string& basename, model::ExportFormat format, util::TimePoint now);

 private:
  std::string PromoteScoped(const ExportFileRef& file, const std::string& display_name);
  std::string PromoteLegacy(const ExportFileRef& file, const std::string& display_name);

  Options                                  options_;
  std::shared_ptr<SharedMediaIndex>        media_index_;
  std::shared_ptr<PublicDirectoryResolver> directory_resolver_;
};

} // namespace favorites::exporter
