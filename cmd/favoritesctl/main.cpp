#include <chrono>
#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/cache/change_sink.hpp"
#include "internal/cache/local_item_manager.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/export/destination.hpp"
#include "internal/export/progress_notifier.hpp"
#include "internal/factory.hpp"
#include "internal/model/export_format.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

using favorites::factory::BuildRuntime;
using favorites::factory::RuntimeDependencies;

namespace {

constexpr std::chrono::milliseconds kWaitTimeout{30000};
constexpr std::chrono::milliseconds kSettleSlack{250};

void Usage() {
  std::cout << "Usage:\n"
            << "  favoritesctl [--config <config.yaml>] add <id> <url> <title> [saved_at_epoch_seconds]\n"
            << "  favoritesctl [--config <config.yaml>] remove <id>...\n"
            << "  favoritesctl [--config <config.yaml>] clear [filter]\n"
            << "  favoritesctl [--config <config.yaml>] list [filter]\n"
            << "  favoritesctl [--config <config.yaml>] check <id>\n"
            << "  favoritesctl [--config <config.yaml>] export <csv|txt|html|md|json> [--filter <f>] [--output <path>]\n";
}

class ConsoleChangeSink final : public favorites::cache::ChangeSink {
 public:
  void SetValue(const favorites::model::ChangeToken& token) override {
    std::cout << token.Path();
    if (token.deleted_count) {
      std::cout << " (" << *token.deleted_count << " deleted)";
    }
    std::cout << "\n";
    ++completed;
  }

  void OnMutationFailed(const favorites::cache::MutationFailure& failure) override {
    std::cerr << "mutation failed: " << failure.message << "\n";
    failed = true;
  }

  std::size_t completed = 0;
  bool        failed    = false;
};

class FlagObserver final : public favorites::cache::LocalItemManager::Observer {
 public:
  void OnChanged() override {
    changed = true;
  }

  bool changed = false;
};

int WaitForMutations(RuntimeDependencies& deps, const ConsoleChangeSink& sink, std::size_t expected) {
  const bool finished = deps.main->RunUntil([&] { return sink.failed || sink.completed >= expected; }, kWaitTimeout);
  if (!finished) {
    std::cerr << "timed out waiting for the store\n";
    return 2;
  }
  return sink.failed ? 2 : 0;
}

int RunList(RuntimeDependencies& deps, std::optional<std::string> filter) {
  auto observer = std::make_shared<FlagObserver>();
  deps.manager->Attach(observer, std::move(filter));
  if (!deps.main->RunUntil([&] { return observer->changed; }, kWaitTimeout)) {
    std::cerr << "timed out waiting for the store\n";
    return 2;
  }

  for (std::size_t i = 0; i < deps.manager->Size(); ++i) {
    auto item = deps.manager->ItemAt(i);
    if (!item) {
      break;
    }
    std::cout << item->id << "\t" << favorites::util::FormatLocal(item->saved_at_epoch_seconds, favorites::util::kMinutePattern)
              << "\t" << item->title << "\t" << item->url << "\n";
  }
  deps.manager->Detach();
  return 0;
}

int RunExport(RuntimeDependencies& deps, const favorites::runtime::config::RuntimeConfig& config, int argc, char** argv, int index) {
  if (index >= argc) {
    Usage();
    return 1;
  }
  auto format = favorites::model::ParseExportFormat(argv[index++]);
  if (!format) {
    std::cerr << "unsupported format: " << argv[index - 1] << "\n";
    return 1;
  }

  std::optional<std::string> filter;
  std::optional<std::string> output;
  for (; index < argc; ++index) {
    const std::string arg = argv[index];
    if (arg == "--filter" && index + 1 < argc) {
      filter = argv[++index];
    } else if (arg == "--output" && index + 1 < argc) {
      output = argv[++index];
    } else {
      Usage();
      return 1;
    }
  }

  bool finished = false;
  bool success  = false;

  if (output) {
    auto destination = std::make_shared<favorites::exporter::FileDestination>(*output);
    deps.orchestrator->ExportToDestination(filter, *format, destination, [&](bool ok) {
      finished = true;
      success  = ok;
    });
    deps.main->RunUntil([&] { return finished; }, kWaitTimeout);
    if (success) {
      std::cout << *output << "\n";
    }
    return success ? 0 : 2;
  }

  deps.orchestrator->ExportToShare(filter, *format, [&](const std::optional<favorites::exporter::ExportFileRef>& file) {
    finished = true;
    success  = file.has_value();
    if (file) {
      std::cout << file->path.string() << "\n";
    }
  });
  deps.main->RunUntil([&] { return finished; }, kWaitTimeout);

  // Let promotion and the delayed share launch run before exiting.
  if (success) {
    const auto settle = std::chrono::milliseconds(config.exporter().share_delay_ms()) + kSettleSlack;
    deps.main->RunUntil([] { return false; }, settle);
  }
  return success ? 0 : 2;
}

int Dispatch(RuntimeDependencies& deps, const favorites::runtime::config::RuntimeConfig& config, ConsoleChangeSink& sink,
             int argc, char** argv, int index) {
  const std::string cmd = argv[index++];

  if (cmd == "add") {
    if (argc - index < 3) {
      Usage();
      return 1;
    }
    favorites::model::SavedItem item;
    item.id                     = argv[index];
    item.url                    = argv[index + 1];
    item.title                  = argv[index + 2];
    item.saved_at_epoch_seconds = argc - index >= 4 ? std::stoll(argv[index + 3])
                                                    : favorites::util::ToUnixSeconds(favorites::util::Now());
    deps.manager->Add(item);
    return WaitForMutations(deps, sink, 1);
  }

  if (cmd == "remove") {
    std::vector<std::string> ids(argv + index, argv + argc);
    if (ids.empty()) {
      Usage();
      return 1;
    }
    deps.manager->RemoveMany(ids);
    return WaitForMutations(deps, sink, ids.size());
  }

  if (cmd == "clear") {
    std::optional<std::string> filter;
    if (index < argc) {
      filter = argv[index];
    }
    deps.manager->Clear(filter);
    return WaitForMutations(deps, sink, 1);
  }

  if (cmd == "list") {
    std::optional<std::string> filter;
    if (index < argc) {
      filter = argv[index];
    }
    return RunList(deps, std::move(filter));
  }

  if (cmd == "check") {
    if (index >= argc) {
      Usage();
      return 1;
    }
    const bool favorite = deps.manager->IsFavorite(argv[index]);
    std::cout << (favorite ? "saved" : "not saved") << "\n";
    return favorite ? 0 : 3;
  }

  if (cmd == "export") {
    return RunExport(deps, config, argc, argv, index);
  }

  Usage();
  return 1;
}

} // namespace

int main(int argc, char** argv) {
  int index = 1;

  std::optional<std::string> config_path;
  if (argc >= 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
    index       = 3;
  }
  if (index >= argc) {
    Usage();
    return 1;
  }

  int rc = 0;
  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = config_path ? favorites::config::ConfigLoader::LoadFromYaml(*config_path)
                              : favorites::config::ConfigLoader::Defaults();

    favorites::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build runtime (dependency graph)
    // ------------------------------------------------------------
    auto sink = std::make_shared<ConsoleChangeSink>();
    auto deps = BuildRuntime(config, sink, std::make_shared<favorites::exporter::LogProgressPresenter>());

    rc = Dispatch(deps, config, *sink, argc, argv, index);

    deps.io->Stop();
    deps.main->RunUntilIdle();
    favorites::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    FAVORITES_LOG_ERROR("Fatal error", {favorites::observability::StringField("error", e.what())});
    favorites::observability::ShutdownLogging();
    return 2;
  }

  return rc;
}
