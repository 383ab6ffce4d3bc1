#include "favorite_loader.hpp"

#include "internal/observability/logging.hpp"

namespace favorites::cache {

using observability::IntField;
using observability::StringField;

FavoriteLoader::FavoriteLoader(std::optional<std::string> filter, std::shared_ptr<LocalItemManager::Observer> observer,
                               std::shared_ptr<db::SavedItemRepository> repository, std::shared_ptr<runtime::Executor> io,
                               std::shared_ptr<runtime::Executor> main, Publisher publisher)
    : filter_(std::move(filter)),
      observer_(std::move(observer)),
      repository_(std::move(repository)),
      io_(std::move(io)),
      main_(std::move(main)),
      publisher_(std::move(publisher)) {
  if (filter_ && filter_->empty()) {
    filter_.reset();
  }
}

std::unique_ptr<db::ResultSet> FavoriteLoader::Query() const {
  return filter_ ? repository_->QueryByTitle(*filter_) : repository_->QueryAll();
}

void FavoriteLoader::Load() {
  const auto sequence = ++requested_;
  auto       self     = shared_from_this();

  io_->Post([self, sequence] {
    std::unique_ptr<db::ResultSet> results;
    try {
      results = self->Query();
    } catch (const std::exception& e) {
      FAVORITES_LOG_ERROR("Saved items query failed", {StringField("error", e.what()), IntField("sequence", static_cast<std::int64_t>(sequence))});
    }

    // std::function needs a copyable callable
    auto holder = std::make_shared<std::unique_ptr<db::ResultSet>>(std::move(results));
    self->main_->Post([self, sequence, holder] { self->Deliver(sequence, std::move(*holder)); });
  });
}

void FavoriteLoader::Deliver(std::uint64_t sequence, std::unique_ptr<db::ResultSet> results) {
  if (sequence <= published_) {
    FAVORITES_LOG_DEBUG("Dropping superseded load result",
                        {IntField("sequence", static_cast<std::int64_t>(sequence)), IntField("published", static_cast<std::int64_t>(published_))});
    return;
  }
  published_ = sequence;
  publisher_(*this, std::move(results));
}

void FavoriteLoader::NotifyObserver() const {
  if (observer_) {
    observer_->OnChanged();
  }
}

} // namespace favorites::cache
