#pragma once

#include <mutex>
#include <vector>

#include "internal/db/api/saved_item_repository.hpp"

namespace favorites::db::memory {

/*
  In-process store used by tests and the "memory" backend.

  Records are kept in insertion order; queries sort a copy.
*/
class MemoryRepository final : public db::SavedItemRepository {
 public:
  MemoryRepository();

  std::unique_ptr<ResultSet> QueryAll() override;
  std::unique_ptr<ResultSet> QueryByTitle(const std::string& substr) override;

  Result Insert(const model::SavedItem& item) override;
  Result DeleteById(const std::string& id, std::size_t& deleted) override;
  Result DeleteByTitle(const std::string& substr, std::size_t& deleted) override;
  Result DeleteAll(std::size_t& deleted) override;

 private:
  std::unique_ptr<ResultSet> Snapshot(const std::string* title_filter);

  std::mutex                    mutex_;
  std::vector<model::SavedItem> items_;
};

} // namespace favorites::db::memory
