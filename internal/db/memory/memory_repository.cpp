#include "memory_repository.hpp"

#include <algorithm>
#include <cctype>
#include <string>

#include "internal/db/common/snapshot_result_set.hpp"

namespace favorites::db::memory {

namespace {

bool ContainsIgnoreCase(const std::string& haystack, const std::string& needle) {
  auto it = std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end(), [](unsigned char a, unsigned char b) {
    return std::tolower(a) == std::tolower(b);
  });
  return it != haystack.end();
}

SnapshotResultSet::Row ToRow(const model::SavedItem& item) {
  return {item.id, item.url, item.title, std::to_string(item.saved_at_epoch_seconds)};
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<ResultSet> MemoryRepository::Snapshot(const std::string* title_filter) {
  std::vector<model::SavedItem> matched;
  {
    std::scoped_lock lock(mutex_);
    for (const auto& item : items_) {
      if (title_filter && !ContainsIgnoreCase(item.title, *title_filter)) continue;
      matched.push_back(item);
    }
  }

  std::stable_sort(matched.begin(), matched.end(), [](const model::SavedItem& a, const model::SavedItem& b) {
    return a.saved_at_epoch_seconds > b.saved_at_epoch_seconds;
  });

  std::vector<SnapshotResultSet::Row> rows;
  rows.reserve(matched.size());
  for (const auto& item : matched) {
    rows.push_back(ToRow(item));
  }

  std::vector<std::string> columns = {std::string(kColumnItemId), std::string(kColumnUrl), std::string(kColumnTitle),
                                      std::string(kColumnTime)};
  return std::make_unique<SnapshotResultSet>(std::move(columns), std::move(rows));
}

std::unique_ptr<ResultSet> MemoryRepository::QueryAll() {
  return Snapshot(nullptr);
}

std::unique_ptr<ResultSet> MemoryRepository::QueryByTitle(const std::string& substr) {
  return Snapshot(&substr);
}

Result MemoryRepository::Insert(const model::SavedItem& item) {
  if (item.id.empty()) return Result::Err(ErrorCode::ConstraintViolation, "saved item id must not be empty");

  std::scoped_lock lock(mutex_);
  auto it = std::find_if(items_.begin(), items_.end(), [&](const model::SavedItem& existing) { return existing.id == item.id; });
  if (it != items_.end()) {
    *it = item;
    return Result::Ok();
  }
  items_.push_back(item);
  return Result::Ok();
}

Result MemoryRepository::DeleteById(const std::string& id, std::size_t& deleted) {
  std::scoped_lock lock(mutex_);
  deleted = std::erase_if(items_, [&](const model::SavedItem& item) { return item.id == id; });
  return Result::Ok();
}

Result MemoryRepository::DeleteByTitle(const std::string& substr, std::size_t& deleted) {
  std::scoped_lock lock(mutex_);
  deleted = std::erase_if(items_, [&](const model::SavedItem& item) { return ContainsIgnoreCase(item.title, substr); });
  return Result::Ok();
}

Result MemoryRepository::DeleteAll(std::size_t& deleted) {
  std::scoped_lock lock(mutex_);
  deleted = items_.size();
  items_.clear();
  return Result::Ok();
}

} // namespace favorites::db::memory
