#pragma once

#include <cstddef>
#include <memory>
#include <string>

#include "internal/db/api/result.hpp"
#include "internal/db/api/result_set.hpp"
#include "internal/model/saved_item.hpp"

namespace favorites::db {

/*
  Persistent store of saved items.

  GUARANTEES:

  - Queries return a snapshot; later writes never change a returned ResultSet
  - Query order is newest saved time first, ties in insertion order
  - Insert of an existing id replaces the record and keeps its position
  - Title search is a case-insensitive substring match

  Implementations must be safe to call from several background threads.
*/

class SavedItemRepository {
 public:
  virtual ~SavedItemRepository() = default;

  // ---------------------------------------------------------------------
  // Queries
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<ResultSet> QueryAll() = 0;

  virtual std::unique_ptr<ResultSet> QueryByTitle(const std::string& substr) = 0;

  // ---------------------------------------------------------------------
  // Mutations
  // ---------------------------------------------------------------------

  virtual Result Insert(const model::SavedItem& item) = 0;

  virtual Result DeleteById(const std::string& id, std::size_t& deleted) = 0;

  virtual Result DeleteByTitle(const std::string& substr, std::size_t& deleted) = 0;

  virtual Result DeleteAll(std::size_t& deleted) = 0;
};

} // namespace favorites::db
