#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <memory>
#include <string>

namespace tasktree::db::sqlite {

struct StatementDeleter {
  void operator()(sqlite3_stmt* stmt) const {
    sqlite3_finalize(stmt);
  }
};

using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

/*
  Thin RAII wrapper around sqlite3*.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Execute a SQL string (used for pragmas/schema)
  void Exec(const std::string& sql);

  Statement Prepare(const std::string& sql);

  // Configure recommended PRAGMAs (WAL, busy timeout, etc.)
  void Configure();

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
};

// Binding / column helpers shared by the sqlite adapters.
void        BindText(sqlite3_stmt* st, int idx, const std::string& s);
void        BindI64(sqlite3_stmt* st, int idx, std::int64_t v);
std::string ColText(sqlite3_stmt* st, int col);
std::int64_t ColI64(sqlite3_stmt* st, int col);
bool        ColIsNull(sqlite3_stmt* st, int col);

} // namespace tasktree::db::sqlite
