#pragma once

#include <cstddef>
#include <shared_mutex>
#include <string>
#include <unordered_set>
#include <vector>

namespace favorites::cache {

/*
  Fast membership cache of saved item ids.

  Answers IsFavorite() without touching the store. Kept current by the
  manager after each successful mutation; Replace() rebuilds it from a
  full query.
*/
class FavoriteIdCache {
 public:
  void Put(const std::string& id);
  void Remove(const std::string& id);
  void Replace(std::vector<std::string> ids);

  bool        Contains(const std::string& id) const;
  std::size_t Size() const;

 private:
  mutable std::shared_mutex       mutex_;
  std::unordered_set<std::string> ids_;
};

} // namespace favorites::cache
