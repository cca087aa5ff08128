#pragma once

#include <sqlite3.h>

#include <memory>
#include <string>

namespace powerscore::db::sqlite {

struct StatementDeleter {
  void operator()(sqlite3_stmt* stmt) const {
    sqlite3_finalize(stmt);
  }
};

using StatementPtr = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

/*
  Thin RAII wrapper around sqlite3*.

  ":memory:" is accepted as a path and gives a private in-process DB.
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

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  // Prepare a statement; finalized when the returned pointer dies
  StatementPtr Prepare(const std::string& sql);

  // Configure recommended PRAGMAs (WAL, busy timeout, etc.)
  void Configure();

  // Create tables and indexes if missing
  void BootstrapSchema();

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
};

} // namespace powerscore::db::sqlite
