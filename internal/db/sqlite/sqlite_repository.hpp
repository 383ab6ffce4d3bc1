#pragma once

#include <memory>

#include "internal/db/api/saved_item_repository.hpp"
#include "sqlite_db.hpp"

namespace favorites::db::sqlite {

class SqliteRepository final : public db::SavedItemRepository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  // Creates the saved_item table when missing.
  static void BootstrapSchema(SqliteDB& db);

  std::unique_ptr<ResultSet> QueryAll() override;
  std::unique_ptr<ResultSet> QueryByTitle(const std::string& substr) override;

  Result Insert(const model::SavedItem& item) override;
  Result DeleteById(const std::string& id, std::size_t& deleted) override;
  Result DeleteByTitle(const std::string& substr, std::size_t& deleted) override;
  Result DeleteAll(std::size_t& deleted) override;

private:
  std::unique_ptr<ResultSet> Select(const char* sql, const std::string* bound_pattern);
  Result Delete(const char* sql, const std::string* bound_text, std::size_t& deleted);

  static Result Translate(sqlite3* db, int rc);

  std::shared_ptr<SqliteDB> db_;
};

}
