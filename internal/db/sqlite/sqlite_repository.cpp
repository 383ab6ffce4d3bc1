#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/common/snapshot_result_set.hpp"
#include "internal/util/errors.hpp"

namespace favorites::db::sqlite {

using favorites::db::ErrorCode;
using favorites::db::Result;

namespace {

/*
  RAII guard for a prepared statement.
*/
class Statement {
public:
  Statement(sqlite3* db, const char* sql) {
    if (sqlite3_prepare_v2(db, sql, -1, &st_, nullptr) != SQLITE_OK) {
      st_ = nullptr;
    }
  }
  ~Statement() {
    if (st_) sqlite3_finalize(st_);
  }

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  sqlite3_stmt* get() const { return st_; }
  explicit operator bool() const { return st_ != nullptr; }

private:
  sqlite3_stmt* st_ = nullptr;
};

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindI64(sqlite3_stmt* st, int idx, std::int64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

std::optional<std::string> ColText(sqlite3_stmt* st, int col) {
    if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? std::string(reinterpret_cast<const char*>(t)) : std::string();
}

// LIKE pattern for a case-insensitive substring match; '\' escapes.
std::string LikePattern(const std::string& substr) {
    std::string pattern = "%";
    for (char c : substr) {
        if (c == '%' || c == '_' || c == '\\') pattern.push_back('\\');
        pattern.push_back(c);
    }
    pattern.push_back('%');
    return pattern;
}

constexpr const char* kSelectColumns = "SELECT itemid,url,title,time FROM saved_item ";
constexpr const char* kOrderBy       = " ORDER BY time DESC, rowid ASC;";

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

void SqliteRepository::BootstrapSchema(SqliteDB& db) {
    db.Exec("CREATE TABLE IF NOT EXISTS saved_item (itemid TEXT PRIMARY KEY NOT NULL, url TEXT NOT NULL, title TEXT, time INTEGER NOT NULL);");
    db.Exec("CREATE INDEX IF NOT EXISTS saved_item_time ON saved_item(time);");
    db.Exec("SELECT itemid,url,title,time FROM saved_item LIMIT 1;");
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xFF) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Queries
// ------------------------------------------------------------------

std::unique_ptr<ResultSet> SqliteRepository::Select(const char* sql, const std::string* bound_pattern) {
    auto  lock = db_->Lock();
    auto* db   = db_->Handle();

    Statement st(db, sql);
    if (!st) throw util::StoreError(std::string("sqlite prepare: ") + sqlite3_errmsg(db));

    if (bound_pattern) BindText(st.get(), 1, *bound_pattern);

    std::vector<std::string> columns;
    const int column_count = sqlite3_column_count(st.get());
    for (int i = 0; i < column_count; ++i) {
        columns.emplace_back(sqlite3_column_name(st.get(), i));
    }

    std::vector<SnapshotResultSet::Row> rows;
    int rc = SQLITE_OK;
    while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
        SnapshotResultSet::Row row;
        row.reserve(static_cast<std::size_t>(column_count));
        for (int i = 0; i < column_count; ++i) {
            row.push_back(ColText(st.get(), i));
        }
        rows.push_back(std::move(row));
    }

    if (rc != SQLITE_DONE) {
        throw util::StoreError("sqlite query failed: " + Translate(db, rc).message);
    }

    return std::make_unique<SnapshotResultSet>(std::move(columns), std::move(rows));
}

std::unique_ptr<ResultSet> SqliteRepository::QueryAll() {
    const std::string sql = std::string(kSelectColumns) + kOrderBy;
    return Select(sql.c_str(), nullptr);
}

std::unique_ptr<ResultSet> SqliteRepository::QueryByTitle(const std::string& substr) {
    const std::string sql     = std::string(kSelectColumns) + "WHERE title LIKE ? ESCAPE '\\'" + kOrderBy;
    const std::string pattern = LikePattern(substr);
    return Select(sql.c_str(), &pattern);
}

// ------------------------------------------------------------------
// Mutations
// ------------------------------------------------------------------

Result SqliteRepository::Insert(const model::SavedItem& item) {
    if (item.id.empty()) return Result::Err(ErrorCode::ConstraintViolation, "saved item id must not be empty");

    auto  lock = db_->Lock();
    auto* db   = db_->Handle();

    const char* sql =
        "INSERT INTO saved_item(itemid,url,title,time) VALUES(?,?,?,?) "
        "ON CONFLICT(itemid) DO UPDATE SET url=excluded.url, title=excluded.title, time=excluded.time;";

    Statement st(db, sql);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, item.id);
    BindText(st.get(), 2, item.url);
    BindText(st.get(), 3, item.title);
    BindI64(st.get(), 4, item.saved_at_epoch_seconds);

    return Translate(db, sqlite3_step(st.get()));
}

Result SqliteRepository::Delete(const char* sql, const std::string* bound_text, std::size_t& deleted) {
    deleted = 0;

    auto  lock = db_->Lock();
    auto* db   = db_->Handle();

    Statement st(db, sql);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    if (bound_text) BindText(st.get(), 1, *bound_text);

    auto result = Translate(db, sqlite3_step(st.get()));
    if (result) deleted = static_cast<std::size_t>(sqlite3_changes(db));
    return result;
}

Result SqliteRepository::DeleteById(const std::string& id, std::size_t& deleted) {
    return Delete("DELETE FROM saved_item WHERE itemid=?;", &id, deleted);
}

Result SqliteRepository::DeleteByTitle(const std::string& substr, std::size_t& deleted) {
    const std::string pattern = LikePattern(substr);
    return Delete("DELETE FROM saved_item WHERE title LIKE ? ESCAPE '\\';", &pattern, deleted);
}

Result SqliteRepository::DeleteAll(std::size_t& deleted) {
    return Delete("DELETE FROM saved_item;", nullptr, deleted);
}

} // namespace favorites::db::sqlite
