#include "internal/db/memory/memory_repository.hpp"
#include "internal/export/export_orchestrator.hpp"
#include "internal/runtime/event_loop.hpp"
#include "internal/util/errors.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using favorites::db::ResultSet;
using favorites::db::memory::MemoryRepository;
using favorites::exporter::Destination;
using favorites::exporter::DirectoryMediaIndex;
using favorites::exporter::DownloadsPromoter;
using favorites::exporter::ExportFileRef;
using favorites::exporter::ExportFileStore;
using favorites::exporter::ExportOrchestrator;
using favorites::exporter::ExportSettings;
using favorites::exporter::FileDestination;
using favorites::exporter::MessageSeverity;
using favorites::exporter::ProgressPresentation;
using favorites::exporter::ProgressPresenter;
using favorites::exporter::ProgressState;
using favorites::exporter::PublicDirectoryResolver;
using favorites::exporter::ShareLauncher;
using favorites::exporter::StorageEra;
using favorites::exporter::WritableSink;
using favorites::model::ExportFormat;
using favorites::model::SavedItem;
using favorites::runtime::EventLoop;

std::filesystem::path FreshDir(const std::string& name) {
  const auto dir = std::filesystem::temp_directory_path() / "favorites_export_tests" / name;
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  return dir;
}

std::string ReadFile(const std::filesystem::path& path) {
  std::ifstream      in(path, std::ios::binary);
  std::ostringstream out;
  out << in.rdbuf();
  return out.str();
}

class RecordingPresenter final : public ProgressPresenter {
 public:
  void Show(int channel_id, const ProgressPresentation& presentation) override {
    shows.push_back({channel_id, presentation});
  }

  void Cancel(int channel_id) override {
    cancels.push_back(channel_id);
  }

  void ShowMessage(MessageSeverity severity, const std::string& text) override {
    messages.push_back({severity, text});
  }

  std::vector<std::pair<int, ProgressPresentation>>    shows;
  std::vector<int>                                     cancels;
  std::vector<std::pair<MessageSeverity, std::string>> messages;
};

class RecordingShareLauncher final : public ShareLauncher {
 public:
  void Share(const ExportFileRef& file) override {
    shared.push_back(file);
    if (fail) {
      throw std::runtime_error("no share target");
    }
  }

  std::vector<ExportFileRef> shared;
  bool                       fail = false;
};

class ThrowingRepository final : public favorites::db::SavedItemRepository {
 public:
  std::unique_ptr<ResultSet> QueryAll() override {
    throw favorites::util::StoreError("database locked");
  }
  std::unique_ptr<ResultSet> QueryByTitle(const std::string&) override {
    throw favorites::util::StoreError("database locked");
  }
  favorites::db::Result Insert(const SavedItem&) override {
    return favorites::db::Result::Ok();
  }
  favorites::db::Result DeleteById(const std::string&, std::size_t&) override {
    return favorites::db::Result::Ok();
  }
  favorites::db::Result DeleteByTitle(const std::string&, std::size_t&) override {
    return favorites::db::Result::Ok();
  }
  favorites::db::Result DeleteAll(std::size_t&) override {
    return favorites::db::Result::Ok();
  }
};

class UnopenableDestination final : public Destination {
 public:
  std::unique_ptr<WritableSink> Open() override {
    return nullptr;
  }
  std::string Describe() const override {
    return "unopenable";
  }
};

class MissingResolver final : public PublicDirectoryResolver {
 public:
  std::optional<std::filesystem::path> DownloadsDirectory() const override {
    return std::nullopt;
  }
};

struct Fixture {
  explicit Fixture(const std::string& name, std::shared_ptr<favorites::db::SavedItemRepository> repo = nullptr)
      : dir(FreshDir(name)), repository(repo ? std::move(repo) : std::make_shared<MemoryRepository>()) {
    files    = std::make_shared<ExportFileStore>(dir / "saved", "favorites-export");
    promoter = std::make_shared<DownloadsPromoter>(DownloadsPromoter::Options{StorageEra::kScoped, "Downloads", "favorites-export"},
                                                   std::make_shared<DirectoryMediaIndex>(dir / "media"), nullptr);

    ExportSettings settings;
    settings.share_delay = std::chrono::milliseconds(0);

    orchestrator = std::make_shared<ExportOrchestrator>(repository, files, promoter, share, presenter, io, main, settings);
  }

  void Seed() {
    assert(repository->Insert(SavedItem{"1", "http://a", "Rust tips", 100}));
    assert(repository->Insert(SavedItem{"2", "http://b", "Go tips", 200}));
  }

  void Pump() {
    while (io->RunUntilIdle() + main->RunUntilIdle() > 0) {
    }
  }

  std::filesystem::path                                dir;
  std::shared_ptr<favorites::db::SavedItemRepository> repository;
  std::shared_ptr<RecordingPresenter>                 presenter = std::make_shared<RecordingPresenter>();
  std::shared_ptr<RecordingShareLauncher>             share     = std::make_shared<RecordingShareLauncher>();
  std::shared_ptr<EventLoop>                          io        = std::make_shared<EventLoop>();
  std::shared_ptr<EventLoop>                          main      = std::make_shared<EventLoop>();
  std::shared_ptr<ExportFileStore>                    files;
  std::shared_ptr<DownloadsPromoter>                  promoter;
  std::shared_ptr<ExportOrchestrator>                 orchestrator;
};

void TestShareExportWritesNotifiesPromotesAndShares() {
  Fixture f("share_success");
  f.Seed();

  std::optional<ExportFileRef> result;
  bool                         called = false;
  f.orchestrator->ExportToShare(std::nullopt, ExportFormat::kCsv, [&](const std::optional<ExportFileRef>& file) {
    called = true;
    result = file;
  });

  // Presentation happens on the main context only.
  assert(f.presenter->shows.empty());
  f.main->RunUntilIdle();
  assert(f.presenter->shows.size() == 1);
  assert(f.presenter->shows[0].second.state == ProgressState::kStarted);

  f.Pump();

  assert(called);
  assert(result.has_value());
  assert(result->path == f.dir / "saved" / "favorites-export.csv");
  assert(result->format == ExportFormat::kCsv);

  const auto content = ReadFile(result->path);
  assert(content.rfind("Title,URL,Hacker News Link,Saved Date\n\"Go tips\"", 0) == 0);
  assert(content.find("\"Rust tips\"") != std::string::npos);

  assert(f.presenter->cancels.size() == 1);
  assert(f.presenter->shows.size() == 2);
  assert(f.presenter->shows[1].second.state == ProgressState::kSucceeded);
  assert(f.presenter->shows[1].second.action == result);

  assert(f.presenter->messages.size() == 1);
  assert(f.presenter->messages[0].first == MessageSeverity::kInfo);
  assert(f.presenter->messages[0].second.rfind("Saved to Downloads folder: favorites-export-", 0) == 0);

  assert(f.share->shared.size() == 1);
  assert(f.share->shared[0] == *result);

  assert(std::filesystem::is_empty(f.dir / "saved" / ".snapshots"));
}

void TestOverlappingSameFormatExportsPromoteTheirOwnDocument() {
  Fixture f("share_overlapping");
  f.Seed();

  std::vector<ExportFileRef> results;
  auto collect = [&](const std::optional<ExportFileRef>& file) {
    assert(file.has_value());
    results.push_back(*file);
  };

  f.orchestrator->ExportToShare(std::nullopt, ExportFormat::kCsv, collect);
  f.io->RunUntilIdle();

  // The second run replaces the shared file before the first one finishes.
  assert(f.repository->Insert(SavedItem{"3", "http://c", "Zig tips", 300}));
  f.orchestrator->ExportToShare(std::nullopt, ExportFormat::kCsv, collect);
  f.io->RunUntilIdle();

  f.Pump();

  assert(results.size() == 2);
  assert(results[0] == results[1]);
  assert(ReadFile(results[1].path).find("Zig tips") != std::string::npos);

  const std::string prefix = "Saved to Downloads folder: ";
  assert(f.presenter->messages.size() == 2);
  assert(f.presenter->messages[0].first == MessageSeverity::kInfo);
  assert(f.presenter->messages[1].first == MessageSeverity::kInfo);
  const auto first_copy  = f.dir / "media" / "Downloads" / f.presenter->messages[0].second.substr(prefix.size());
  const auto second_copy = f.dir / "media" / "Downloads" / f.presenter->messages[1].second.substr(prefix.size());
  assert(first_copy != second_copy);
  assert(ReadFile(first_copy).find("Zig tips") == std::string::npos);
  assert(ReadFile(first_copy).find("Go tips") != std::string::npos);
  assert(ReadFile(second_copy).find("Zig tips") != std::string::npos);

  // Only the run whose document is still in place is shared.
  assert(f.share->shared.size() == 1);
  assert(f.share->shared[0] == results[1]);

  assert(std::filesystem::is_empty(f.dir / "saved" / ".snapshots"));
}

void TestShareExportOfEmptyResultFails() {
  Fixture f("share_empty");

  std::optional<ExportFileRef> result = ExportFileRef{};
  f.orchestrator->ExportToShare(std::nullopt, ExportFormat::kJson, [&](const std::optional<ExportFileRef>& file) { result = file; });
  f.Pump();

  assert(!result.has_value());
  assert(f.presenter->shows.back().second.state == ProgressState::kFailed);
  assert(!std::filesystem::exists(f.files->PathFor(ExportFormat::kJson)));
  assert(f.presenter->messages.empty());
  assert(f.share->shared.empty());
}

void TestShareExportAppliesFilter() {
  Fixture f("share_filter");
  f.Seed();

  std::optional<ExportFileRef> result;
  f.orchestrator->ExportToShare("rust", ExportFormat::kMarkdown, [&](const std::optional<ExportFileRef>& file) { result = file; });
  f.Pump();

  assert(result.has_value());
  const auto content = ReadFile(result->path);
  assert(content.find("## Rust tips") != std::string::npos);
  assert(content.find("Go tips") == std::string::npos);
}

void TestAcquireFailureFailsExport() {
  Fixture f("share_acquire_failure", std::make_shared<ThrowingRepository>());

  bool                         called = false;
  std::optional<ExportFileRef> result;
  f.orchestrator->ExportToShare(std::nullopt, ExportFormat::kTxt, [&](const std::optional<ExportFileRef>& file) {
    called = true;
    result = file;
  });
  f.Pump();

  assert(called);
  assert(!result.has_value());
  assert(f.presenter->shows.back().second.state == ProgressState::kFailed);
}

void TestConcurrentExportsKeepTheirOwnFormat() {
  Fixture f("share_concurrent");
  f.Seed();

  std::vector<ExportFileRef> results;
  auto collect = [&](const std::optional<ExportFileRef>& file) {
    assert(file.has_value());
    results.push_back(*file);
  };
  f.orchestrator->ExportToShare(std::nullopt, ExportFormat::kCsv, collect);
  f.orchestrator->ExportToShare(std::nullopt, ExportFormat::kJson, collect);
  f.Pump();

  assert(results.size() == 2);
  assert(results[0].format == ExportFormat::kCsv);
  assert(results[1].format == ExportFormat::kJson);
  assert(ReadFile(results[0].path).rfind("Title,URL", 0) == 0);
  assert(ReadFile(results[1].path).rfind("{\n  \"exported\"", 0) == 0);

  // Each invocation owns its channel.
  assert(f.presenter->shows[0].first != f.presenter->shows[1].first);
}

void TestPromotionFailureOnlyWarns() {
  Fixture f("share_promotion_failure");
  f.Seed();
  f.promoter = std::make_shared<DownloadsPromoter>(DownloadsPromoter::Options{StorageEra::kLegacy, "Downloads", "favorites-export"},
                                                   nullptr, std::make_shared<MissingResolver>());
  ExportSettings settings;
  settings.share_delay = std::chrono::milliseconds(0);
  f.orchestrator =
      std::make_shared<ExportOrchestrator>(f.repository, f.files, f.promoter, f.share, f.presenter, f.io, f.main, settings);

  std::optional<ExportFileRef> result;
  f.orchestrator->ExportToShare(std::nullopt, ExportFormat::kHtml, [&](const std::optional<ExportFileRef>& file) { result = file; });
  f.Pump();

  assert(result.has_value());
  assert(f.presenter->shows.back().second.state == ProgressState::kSucceeded);
  assert(f.presenter->messages.size() == 1);
  assert(f.presenter->messages[0].first == MessageSeverity::kWarning);
  assert(f.share->shared.size() == 1);
}

void TestShareLauncherFailureIsContained() {
  Fixture f("share_launcher_failure");
  f.Seed();
  f.share->fail = true;

  std::optional<ExportFileRef> result;
  f.orchestrator->ExportToShare(std::nullopt, ExportFormat::kCsv, [&](const std::optional<ExportFileRef>& file) { result = file; });
  f.Pump();

  assert(result.has_value());
  assert(f.share->shared.size() == 1);
  assert(f.presenter->shows.back().second.state == ProgressState::kSucceeded);
}

void TestDestinationExportWritesDocument() {
  Fixture f("destination_success");
  f.Seed();

  const auto target  = f.dir / "picked" / "stories.txt";
  bool       success = false;
  f.orchestrator->ExportToDestination(std::nullopt, ExportFormat::kTxt, std::make_shared<FileDestination>(target),
                                      [&](bool ok) { success = ok; });
  f.Pump();

  assert(success);
  assert(ReadFile(target).rfind("=== Saved Stories ===\n\n1. Go tips\n", 0) == 0);
  assert(f.presenter->shows.back().second.state == ProgressState::kSucceeded);
  assert(!f.presenter->shows.back().second.action.has_value());
  assert(f.share->shared.empty());
  assert(f.presenter->messages.empty());
}

void TestDestinationExportOfEmptyResultFails() {
  Fixture f("destination_empty");

  const auto target  = f.dir / "picked.csv";
  bool       success = true;
  f.orchestrator->ExportToDestination(std::nullopt, ExportFormat::kCsv, std::make_shared<FileDestination>(target),
                                      [&](bool ok) { success = ok; });
  f.Pump();

  assert(!success);
  assert(!std::filesystem::exists(target));
  assert(f.presenter->shows.back().second.state == ProgressState::kFailed);
}

void TestUnopenableDestinationFails() {
  Fixture f("destination_unopenable");
  f.Seed();

  bool success = true;
  f.orchestrator->ExportToDestination(std::nullopt, ExportFormat::kCsv, std::make_shared<UnopenableDestination>(),
                                      [&](bool ok) { success = ok; });
  f.Pump();

  assert(!success);
  assert(f.presenter->shows.back().second.state == ProgressState::kFailed);
}

} // namespace

int main() {
  TestShareExportWritesNotifiesPromotesAndShares();
  TestOverlappingSameFormatExportsPromoteTheirOwnDocument();
  TestShareExportOfEmptyResultFails();
  TestShareExportAppliesFilter();
  TestAcquireFailureFailsExport();
  TestConcurrentExportsKeepTheirOwnFormat();
  TestPromotionFailureOnlyWarns();
  TestShareLauncherFailureIsContained();
  TestDestinationExportWritesDocument();
  TestDestinationExportOfEmptyResultFails();
  TestUnopenableDestinationFails();

  std::cout << "favorites_unit_export_orchestrator: pass\n";
  return 0;
}
