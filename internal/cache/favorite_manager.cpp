#include "favorite_manager.hpp"

#include <algorithm>
#include <mutex>
#include <stdexcept>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace favorites::cache {

using observability::IntField;
using observability::StringField;

namespace {

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (!result) {
    throw util::StoreError(context + ": " + result.message);
  }
}

std::optional<std::string> NormalizeFilter(std::optional<std::string> filter) {
  if (filter && filter->empty()) {
    return std::nullopt;
  }
  return filter;
}

} // namespace

FavoriteManager::FavoriteManager(std::shared_ptr<db::SavedItemRepository> repository, std::shared_ptr<FavoriteIdCache> ids,
                                 std::shared_ptr<ChangeSink> changes, std::shared_ptr<SyncScheduler> sync,
                                 std::shared_ptr<runtime::Executor> io, std::shared_ptr<runtime::Executor> main)
    : repository_(std::move(repository)),
      ids_(std::move(ids)),
      changes_(std::move(changes)),
      sync_(std::move(sync)),
      io_(std::move(io)),
      main_(std::move(main)) {
  if (!repository_ || !ids_ || !changes_ || !io_ || !main_) {
    throw std::invalid_argument("favorite manager dependencies must be non-null");
  }
}

// ------------------------------------------------------------
// Listing
// ------------------------------------------------------------

std::size_t FavoriteManager::Size() const {
  return cursor_ ? cursor_->Count() : 0;
}

std::optional<model::SavedItem> FavoriteManager::ItemAt(std::size_t position) {
  if (!cursor_) {
    return std::nullopt;
  }
  return cursor_->ItemAt(position);
}

void FavoriteManager::Attach(std::shared_ptr<Observer> observer, std::optional<std::string> filter) {
  std::weak_ptr<FavoriteManager> weak = weak_from_this();

  loader_ = std::make_shared<FavoriteLoader>(
      std::move(filter), std::move(observer), repository_, io_, main_,
      [weak](const FavoriteLoader& loader, std::unique_ptr<db::ResultSet> results) {
        if (auto self = weak.lock()) {
          self->OnLoaded(loader, std::move(results));
        }
      });
  loader_->Load();
}

void FavoriteManager::Detach() {
  cursor_.reset();
  loader_.reset();
}

void FavoriteManager::OnLoaded(const FavoriteLoader& loader, std::unique_ptr<db::ResultSet> results) {
  if (loader_.get() != &loader) {
    FAVORITES_LOG_DEBUG("Discarding result of a detached loader");
    if (results) {
      results->Close();
    }
    return;
  }

  if (results) {
    cursor_.emplace(std::move(results));
  } else {
    cursor_.reset();
  }
  loader.NotifyObserver();
}

// ------------------------------------------------------------
// Mutations
// ------------------------------------------------------------

void FavoriteManager::Add(const model::SavedItem& item) {
  if (item.id.empty()) {
    throw std::invalid_argument("saved item id must not be empty");
  }

  MutationFailure context;
  context.kind     = model::ChangeKind::kAdded;
  context.item_ids = {item.id};

  Mutate(std::move(context), [item](FavoriteManager& self, std::vector<model::ChangeToken>& committed) {
    ThrowIfDbError(self.repository_->Insert(item), "insert saved item");
    self.ids_->Put(item.id);
    committed.push_back(model::ChangeToken::Added(item.id));
  });

  if (!sync_) {
    return;
  }
  try {
    sync_->ScheduleSync(item.id);
  } catch (const std::exception& e) {
    FAVORITES_LOG_WARN("Content refresh scheduling failed", {StringField("item_id", item.id), StringField("error", e.what())});
  }
}

void FavoriteManager::Remove(const std::string& item_id) {
  if (item_id.empty()) {
    return;
  }
  RemoveMany({item_id});
}

void FavoriteManager::RemoveMany(const std::vector<std::string>& item_ids) {
  if (item_ids.empty()) {
    return;
  }

  MutationFailure context;
  context.kind     = model::ChangeKind::kRemoved;
  context.item_ids = item_ids;

  Mutate(std::move(context), [item_ids](FavoriteManager& self, std::vector<model::ChangeToken>& committed) {
    for (const auto& id : item_ids) {
      std::size_t deleted = 0;
      ThrowIfDbError(self.repository_->DeleteById(id, deleted), "delete saved item " + id);
      self.ids_->Remove(id);
      committed.push_back(model::ChangeToken::Removed(id));
    }
  });
}

void FavoriteManager::Clear(std::optional<std::string> filter) {
  filter = NormalizeFilter(std::move(filter));

  MutationFailure context;
  context.kind   = model::ChangeKind::kCleared;
  context.filter = filter;

  Mutate(std::move(context), [filter](FavoriteManager& self, std::vector<model::ChangeToken>& committed) {
    // Ids are collected before the delete; mutations are serialized, so
    // nothing can be saved in between.
    ResultCursor cursor(filter ? self.repository_->QueryByTitle(*filter) : self.repository_->QueryAll());
    const auto   doomed = cursor.ReadAll();
    cursor.Close();

    std::size_t deleted = 0;
    if (filter) {
      ThrowIfDbError(self.repository_->DeleteByTitle(*filter, deleted), "delete saved items by title");
    } else {
      ThrowIfDbError(self.repository_->DeleteAll(deleted), "delete all saved items");
    }
    committed.push_back(model::ChangeToken::Cleared(deleted));

    for (const auto& item : doomed) {
      self.ids_->Remove(item.id);
    }
  });
}

void FavoriteManager::Mutate(MutationFailure context, Mutation work) {
  std::weak_ptr<FavoriteManager> weak = weak_from_this();

  io_->Post([weak, context = std::move(context), work = std::move(work)] {
    auto self = weak.lock();
    if (!self) {
      return;
    }

    std::vector<model::ChangeToken> committed;
    std::optional<MutationFailure>  failure;
    {
      std::scoped_lock lock(self->mutation_mutex_);
      try {
        work(*self, committed);
      } catch (const std::exception& e) {
        failure          = context;
        failure->message = e.what();
        // Only the ids whose change never reached the store.
        std::erase_if(failure->item_ids, [&committed](const std::string& id) {
          return std::any_of(committed.begin(), committed.end(),
                             [&id](const model::ChangeToken& token) { return token.item_id == id; });
        });
        FAVORITES_LOG_ERROR("Saved items mutation failed",
                            {IntField("kind", static_cast<std::int64_t>(failure->kind)),
                             IntField("committed", static_cast<std::int64_t>(committed.size())),
                             IntField("failed", static_cast<std::int64_t>(failure->item_ids.size())),
                             StringField("error", failure->message)});
      }
    }

    if (!committed.empty()) {
      self->main_->Post([weak, committed = std::move(committed)] {
        if (auto manager = weak.lock()) {
          manager->CompleteMutation(committed);
        }
      });
    }
    if (failure) {
      self->main_->Post([weak, failure = std::move(*failure)] {
        if (auto manager = weak.lock()) {
          manager->FailMutation(failure);
        }
      });
    }
  });
}

void FavoriteManager::CompleteMutation(const std::vector<model::ChangeToken>& tokens) {
  // Targets whichever loader is attached now, not the one at call time.
  if (loader_) {
    loader_->Load();
  }
  for (const auto& token : tokens) {
    changes_->SetValue(token);
  }
}

void FavoriteManager::FailMutation(const MutationFailure& failure) {
  changes_->OnMutationFailed(failure);
}

// ------------------------------------------------------------
// Fast id cache
// ------------------------------------------------------------

bool FavoriteManager::IsFavorite(const std::string& item_id) const {
  if (item_id.empty()) {
    return false;
  }
  return ids_->Contains(item_id);
}

void FavoriteManager::HydrateIdCache() {
  ResultCursor             cursor(repository_->QueryAll());
  std::vector<std::string> ids;
  ids.reserve(cursor.Count());
  for (auto& item : cursor.ReadAll()) {
    ids.push_back(std::move(item.id));
  }
  ids_->Replace(std::move(ids));
  FAVORITES_LOG_DEBUG("Hydrated favorite id cache", {IntField("count", static_cast<std::int64_t>(ids_->Size()))});
}

} // namespace favorites::cache
