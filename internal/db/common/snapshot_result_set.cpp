#include "snapshot_result_set.hpp"

#include <utility>

#include "internal/util/errors.hpp"

namespace favorites::db {

SnapshotResultSet::SnapshotResultSet(std::vector<std::string> columns, std::vector<Row> rows)
    : columns_(std::move(columns)), rows_(std::move(rows)) {
}

void SnapshotResultSet::EnsureOpen() const {
  if (closed_) {
    throw util::InvalidState("result set is closed");
  }
}

std::size_t SnapshotResultSet::Count() const {
  EnsureOpen();
  return rows_.size();
}

bool SnapshotResultSet::MoveToFirst() {
  return MoveToPosition(0);
}

bool SnapshotResultSet::MoveToNext() {
  EnsureOpen();
  if (position_ + 1 >= static_cast<std::int64_t>(rows_.size())) {
    position_ = static_cast<std::int64_t>(rows_.size());
    return false;
  }
  ++position_;
  return true;
}

bool SnapshotResultSet::MoveToPosition(std::size_t position) {
  EnsureOpen();
  if (position >= rows_.size()) {
    position_ = static_cast<std::int64_t>(rows_.size());
    return false;
  }
  position_ = static_cast<std::int64_t>(position);
  return true;
}

std::optional<std::size_t> SnapshotResultSet::ColumnIndex(std::string_view name) const {
  for (std::size_t i = 0; i < columns_.size(); ++i) {
    if (columns_[i] == name) return i;
  }
  return std::nullopt;
}

std::optional<std::string> SnapshotResultSet::GetString(std::size_t column) const {
  EnsureOpen();
  if (position_ < 0 || position_ >= static_cast<std::int64_t>(rows_.size())) {
    throw util::InvalidState("result set is not positioned on a row");
  }
  const auto& row = rows_[static_cast<std::size_t>(position_)];
  if (column >= row.size()) {
    throw util::DataCorruption("column index " + std::to_string(column) + " out of range");
  }
  return row[column];
}

void SnapshotResultSet::Close() {
  if (closed_) return;
  closed_ = true;
  rows_.clear();
  rows_.shrink_to_fit();
}

} // namespace favorites::db
