#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include "internal/util/errors.hpp"

namespace favorites::db {

// Logical column names of a saved item row.
inline constexpr std::string_view kColumnItemId = "itemid";
inline constexpr std::string_view kColumnUrl    = "url";
inline constexpr std::string_view kColumnTitle  = "title";
inline constexpr std::string_view kColumnTime   = "time";

/*
  Forward-only, position-addressable view over a query result.

  Positions start before the first row. Move*() return false and leave
  the position outside the row range when there is no such row.
  Close() releases the backing resource; any later access throws
  util::InvalidState.
*/
class ResultSet {
 public:
  virtual ~ResultSet() = default;

  virtual std::size_t Count() const = 0;

  virtual bool MoveToFirst()                        = 0;
  virtual bool MoveToNext()                         = 0;
  virtual bool MoveToPosition(std::size_t position) = 0;

  virtual std::optional<std::size_t> ColumnIndex(std::string_view name) const = 0;

  // nullopt for SQL NULL
  virtual std::optional<std::string> GetString(std::size_t column) const = 0;

  virtual void Close()          = 0;
  virtual bool IsClosed() const = 0;

  std::size_t ColumnIndexOrThrow(std::string_view name) const {
    auto index = ColumnIndex(name);
    if (!index) {
      throw util::DataCorruption("column '" + std::string(name) + "' does not exist");
    }
    return *index;
  }
};

} // namespace favorites::db
