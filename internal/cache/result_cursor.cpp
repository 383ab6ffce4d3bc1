#include "result_cursor.hpp"

#include <charconv>
#include <stdexcept>
#include <utility>

#include "internal/util/errors.hpp"

namespace favorites::cache {

namespace {

std::int64_t ParseEpochSeconds(const std::string& text) {
  std::int64_t value = 0;
  const auto   res   = std::from_chars(text.data(), text.data() + text.size(), value);
  if (res.ec != std::errc() || res.ptr != text.data() + text.size()) {
    return 0;
  }
  return value;
}

} // namespace

ResultCursor::ResultCursor(std::unique_ptr<db::ResultSet> results) : results_(std::move(results)) {
  if (!results_) {
    throw std::invalid_argument("result cursor requires a result set");
  }
}

ResultCursor::~ResultCursor() {
  Close();
}

ResultCursor::ResultCursor(ResultCursor&& other) noexcept : results_(std::move(other.results_)) {
}

ResultCursor& ResultCursor::operator=(ResultCursor&& other) noexcept {
  if (this != &other) {
    Close();
    results_ = std::move(other.results_);
  }
  return *this;
}

std::size_t ResultCursor::Count() const {
  return results_ && !results_->IsClosed() ? results_->Count() : 0;
}

bool ResultCursor::MoveToFirst() {
  return !IsClosed() && results_->MoveToFirst();
}

bool ResultCursor::MoveToNext() {
  return !IsClosed() && results_->MoveToNext();
}

bool ResultCursor::MoveToPosition(std::size_t position) {
  return !IsClosed() && results_->MoveToPosition(position);
}

model::SavedItem ResultCursor::Current() const {
  if (IsClosed()) {
    throw util::InvalidState("result cursor is closed");
  }

  model::SavedItem item;

  const auto id_column  = results_->ColumnIndexOrThrow(db::kColumnItemId);
  const auto url_column = results_->ColumnIndexOrThrow(db::kColumnUrl);

  auto id = results_->GetString(id_column);
  if (!id || id->empty()) {
    throw util::DataCorruption("saved item row has no id");
  }
  item.id  = std::move(*id);
  item.url = results_->GetString(url_column).value_or("");

  if (auto title_column = results_->ColumnIndex(db::kColumnTitle)) {
    item.title = results_->GetString(*title_column).value_or("");
  }
  if (auto time_column = results_->ColumnIndex(db::kColumnTime)) {
    if (auto time = results_->GetString(*time_column)) {
      item.saved_at_epoch_seconds = ParseEpochSeconds(*time);
    }
  }
  return item;
}

std::optional<model::SavedItem> ResultCursor::ItemAt(std::size_t position) {
  if (!MoveToPosition(position)) {
    return std::nullopt;
  }
  return Current();
}

std::vector<model::SavedItem> ResultCursor::ReadAll() {
  std::vector<model::SavedItem> items;
  if (!MoveToFirst()) {
    return items;
  }
  items.reserve(Count());
  do {
    items.push_back(Current());
  } while (MoveToNext());
  return items;
}

void ResultCursor::Close() {
  if (results_ && !results_->IsClosed()) {
    results_->Close();
  }
  results_.reset();
}

bool ResultCursor::IsClosed() const {
  return !results_ || results_->IsClosed();
}

} // namespace favorites::cache
