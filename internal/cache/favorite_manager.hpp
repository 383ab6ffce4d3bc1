#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "internal/cache/change_sink.hpp"
#include "internal/cache/favorite_id_cache.hpp"
#include "internal/cache/favorite_loader.hpp"
#include "internal/cache/local_item_manager.hpp"
#include "internal/cache/result_cursor.hpp"
#include "internal/db/api/saved_item_repository.hpp"
#include "internal/model/change_token.hpp"
#include "internal/runtime/executor.hpp"

namespace favorites::cache {

/*
  Local item cache manager.

  Owns the current cursor and the current loader and performs the
  add/remove/clear mutations. Store access happens on the io executor;
  cursor swaps, reloads and change events happen on the main executor.
  A mutation that fails part way still publishes what it committed and
  reports only the remainder as failed.

  Cursor and loader state are main-context only. IsFavorite() is safe
  from any thread.

  Must be owned by a std::shared_ptr (background tasks hold weak refs).
*/
class FavoriteManager final : public LocalItemManager, public std::enable_shared_from_this<FavoriteManager> {
 public:
  FavoriteManager(std::shared_ptr<db::SavedItemRepository> repository, std::shared_ptr<FavoriteIdCache> ids,
                  std::shared_ptr<ChangeSink> changes, std::shared_ptr<SyncScheduler> sync,
                  std::shared_ptr<runtime::Executor> io, std::shared_ptr<runtime::Executor> main);

  // ------------------------------------------------------------
  // Listing
  // ------------------------------------------------------------

  std::size_t                     Size() const override;
  std::optional<model::SavedItem> ItemAt(std::size_t position) override;

  void Attach(std::shared_ptr<Observer> observer, std::optional<std::string> filter) override;
  void Detach() override;

  bool HasCursor() const {
    return cursor_.has_value();
  }

  // ------------------------------------------------------------
  // Mutations (dispatch and return)
  // ------------------------------------------------------------

  void Add(const model::SavedItem& item);
  void Remove(const std::string& item_id);
  void RemoveMany(const std::vector<std::string>& item_ids);
  void Clear(std::optional<std::string> filter);

  // ------------------------------------------------------------
  // Fast id cache
  // ------------------------------------------------------------

  bool IsFavorite(const std::string& item_id) const;

  // Blocking full query. Call at startup or from the io executor.
  void HydrateIdCache();

 private:
  // Appends a token for each change as soon as it is committed to the store.
  using Mutation = std::function<void(FavoriteManager&, std::vector<model::ChangeToken>& committed)>;

  void Mutate(MutationFailure context, Mutation work);
  void CompleteMutation(const std::vector<model::ChangeToken>& tokens);
  void FailMutation(const MutationFailure& failure);

  void OnLoaded(const FavoriteLoader& loader, std::unique_ptr<db::ResultSet> results);

  std::shared_ptr<db::SavedItemRepository> repository_;
  std::shared_ptr<FavoriteIdCache>         ids_;
  std::shared_ptr<ChangeSink>              changes_;
  std::shared_ptr<SyncScheduler>           sync_;
  std::shared_ptr<runtime::Executor>       io_;
  std::shared_ptr<runtime::Executor>       main_;

  // Store writes and their id cache updates run one mutation at a time.
  std::mutex mutation_mutex_;

  std::optional<ResultCursor>     cursor_;
  std::shared_ptr<FavoriteLoader> loader_;
};

} // namespace favorites::cache
