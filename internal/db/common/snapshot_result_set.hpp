#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result_set.hpp"

namespace favorites::db {

/*
  Materialized result set.

  Rows are copied out of the backend when the query runs, so the set
  stays valid after the backend statement or lock is gone. Both
  repositories hand these out.
*/
class SnapshotResultSet final : public ResultSet {
 public:
  using Row = std::vector<std::optional<std::string>>;

  SnapshotResultSet(std::vector<std::string> columns, std::vector<Row> rows);

  std::size_t Count() const override;

  bool MoveToFirst() override;
  bool MoveToNext() override;
  bool MoveToPosition(std::size_t position) override;

  std::optional<std::size_t> ColumnIndex(std::string_view name) const override;
  std::optional<std::string> GetString(std::size_t column) const override;

  void Close() override;
  bool IsClosed() const override {
    return closed_;
  }

 private:
  void EnsureOpen() const;

  std::vector<std::string> columns_;
  std::vector<Row>         rows_;
  std::int64_t             position_ = -1;
  bool                     closed_   = false;
};

} // namespace favorites::db
