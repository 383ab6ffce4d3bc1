#pragma once

#include <memory>
#include <optional>
#include <vector>

#include "internal/db/api/result_set.hpp"
#include "internal/model/saved_item.hpp"

namespace favorites::cache {

/*
  Owned handle over a ResultSet that decodes rows into SavedItem.

  The result set is closed when the cursor is destroyed, reset or
  move-assigned over. id/url columns are required (util::DataCorruption
  when absent); a missing title reads as empty and a missing time as 0.
*/
class ResultCursor {
 public:
  explicit ResultCursor(std::unique_ptr<db::ResultSet> results);
  ~ResultCursor();

  ResultCursor(ResultCursor&& other) noexcept;
  ResultCursor& operator=(ResultCursor&& other) noexcept;

  ResultCursor(const ResultCursor&)            = delete;
  ResultCursor& operator=(const ResultCursor&) = delete;

  std::size_t Count() const;

  bool MoveToFirst();
  bool MoveToNext();
  bool MoveToPosition(std::size_t position);

  // Item at the current position.
  model::SavedItem Current() const;

  std::optional<model::SavedItem> ItemAt(std::size_t position);

  // Every row from the first, in result order.
  std::vector<model::SavedItem> ReadAll();

  void Close();
  bool IsClosed() const;

 private:
  std::unique_ptr<db::ResultSet> results_;
};

} // namespace favorites::cache
