#include "sqlite_db.hpp"

#include <stdexcept>
#include <vector>

namespace powerscore::db::sqlite {

static void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    throw std::runtime_error(std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

SqliteDB::SqliteDB(std::string path) : path_(std::move(path)) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error(msg);
  }

  Configure();
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    throw std::runtime_error(msg);
  }
}

StatementPtr SqliteDB::Prepare(const std::string& sql) {
  sqlite3_stmt* stmt = nullptr;
  int           rc   = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
  ThrowIf(rc, db_, "sqlite prepare");
  return StatementPtr(stmt);
}

void SqliteDB::Configure() {
  // in-memory databases have no WAL; keep the default journal there
  if (path_ != ":memory:") {
    Exec("PRAGMA journal_mode=WAL;");
  }

  Exec("PRAGMA synchronous=NORMAL;");

  // wait for locks instead of failing immediately
  ThrowIf(sqlite3_busy_timeout(db_, 5000), db_, "busy_timeout");

  Exec("PRAGMA temp_store=MEMORY;");
  Exec("PRAGMA cache_size=-20000;"); // ~20MB (negative means KB)
}

void SqliteDB::BootstrapSchema() {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS games (game_id TEXT NOT NULL, team_id TEXT NOT NULL, date TEXT NOT NULL, opponent_id TEXT NOT NULL, "
      "age INTEGER, gender TEXT, opponent_age INTEGER, opponent_gender TEXT, goals_for INTEGER, goals_against INTEGER, "
      "home_team_id TEXT, provider TEXT NOT NULL DEFAULT '', PRIMARY KEY (game_id, team_id));",
      "CREATE INDEX IF NOT EXISTS games_date_idx ON games(date);",
      "CREATE TABLE IF NOT EXISTS teams (team_id TEXT PRIMARY KEY, state_code TEXT NOT NULL DEFAULT '');",
      "CREATE TABLE IF NOT EXISTS rankings (team_id TEXT NOT NULL, age INTEGER NOT NULL, gender TEXT NOT NULL, status TEXT NOT NULL, "
      "games_played INTEGER NOT NULL, games_last_180_days INTEGER NOT NULL, last_game TEXT NOT NULL, off_norm REAL NOT NULL, "
      "def_norm REAL NOT NULL, sos REAL NOT NULL, sos_norm REAL NOT NULL, scf REAL NOT NULL, perf_centered REAL NOT NULL, "
      "powerscore_core REAL NOT NULL, powerscore_adj REAL NOT NULL, power_score_final REAL NOT NULL, ml_norm REAL NOT NULL, "
      "powerscore_ml REAL NOT NULL, power_score_final_ml REAL NOT NULL, sos_rank INTEGER, rank_in_cohort INTEGER, "
      "rank_in_cohort_ml INTEGER, rank_change_7d INTEGER, rank_change_30d INTEGER, snapshot_date TEXT NOT NULL, "
      "PRIMARY KEY (team_id, age, gender));",
      "CREATE TABLE IF NOT EXISTS ranking_history (team_id TEXT NOT NULL, snapshot_date TEXT NOT NULL, age INTEGER NOT NULL, "
      "gender TEXT NOT NULL, rank_in_cohort INTEGER, rank_in_cohort_ml INTEGER, power_score_final REAL NOT NULL, "
      "powerscore_ml REAL NOT NULL, PRIMARY KEY (team_id, snapshot_date));",
      "CREATE INDEX IF NOT EXISTS ranking_history_date_idx ON ranking_history(snapshot_date);",
      "CREATE TABLE IF NOT EXISTS game_residuals (game_id TEXT PRIMARY KEY, residual REAL NOT NULL, snapshot_date TEXT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS rating_cache (cache_key TEXT PRIMARY KEY, created_at_ms INTEGER NOT NULL, payload BLOB NOT NULL);"};

  for (const auto& sql : kBootstrapSql) {
    Exec(sql);
  }
}

} // namespace powerscore::db::sqlite
