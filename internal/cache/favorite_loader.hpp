#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "internal/cache/local_item_manager.hpp"
#include "internal/db/api/saved_item_repository.hpp"
#include "internal/runtime/executor.hpp"

namespace favorites::cache {

/*
  Queries the store for one (filter, observer) pair and hands each result
  to a publisher on the interactive context.

  Load() may be called from any thread, any number of times. Every call
  gets a sequence number; a result older than the last published one is
  dropped, so the latest request wins even when background queries finish
  out of order. The publisher decides whether this loader is still
  current.
*/
class FavoriteLoader : public std::enable_shared_from_this<FavoriteLoader> {
 public:
  using Publisher = std::function<void(const FavoriteLoader& loader, std::unique_ptr<db::ResultSet> results)>;

  FavoriteLoader(std::optional<std::string> filter, std::shared_ptr<LocalItemManager::Observer> observer,
                 std::shared_ptr<db::SavedItemRepository> repository, std::shared_ptr<runtime::Executor> io,
                 std::shared_ptr<runtime::Executor> main, Publisher publisher);

  void Load();

  void NotifyObserver() const;

  const std::optional<std::string>& Filter() const {
    return filter_;
  }

  std::uint64_t RequestedSequence() const {
    return requested_.load();
  }

 private:
  std::unique_ptr<db::ResultSet> Query() const;
  void                           Deliver(std::uint64_t sequence, std::unique_ptr<db::ResultSet> results);

  std::optional<std::string>                 filter_;
  std::shared_ptr<LocalItemManager::Observer> observer_;
  std::shared_ptr<db::SavedItemRepository>   repository_;
  std::shared_ptr<runtime::Executor>         io_;
  std::shared_ptr<runtime::Executor>         main_;
  Publisher                                  publisher_;

  std::atomic<std::uint64_t> requested_{0};
  // interactive context only
  std::uint64_t published_ = 0;
};

} // namespace favorites::cache
