#include "favorite_id_cache.hpp"

#include <mutex>

namespace favorites::cache {

void FavoriteIdCache::Put(const std::string& id) {
  std::unique_lock lock(mutex_);
  ids_.insert(id);
}

void FavoriteIdCache::Remove(const std::string& id) {
  std::unique_lock lock(mutex_);
  ids_.erase(id);
}

void FavoriteIdCache::Replace(std::vector<std::string> ids) {
  std::unordered_set<std::string> fresh(std::make_move_iterator(ids.begin()),
                                        std::make_move_iterator(ids.end()));
  std::unique_lock lock(mutex_);
  ids_.swap(fresh);
}

bool FavoriteIdCache::Contains(const std::string& id) const {
  std::shared_lock lock(mutex_);
  return ids_.contains(id);
}

std::size_t FavoriteIdCache::Size() const {
  std::shared_lock lock(mutex_);
  return ids_.size();
}

} // namespace favorites::cache
