#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include "internal/util/errors.hpp"

namespace powerscore::db::sqlite {

using powerscore::db::ErrorCode;
using powerscore::db::Result;

namespace {

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindBlob(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_blob(st, idx, s.data(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
  sqlite3_bind_int(st, idx, v);
}

void BindU64(sqlite3_stmt* st, int idx, std::uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindDouble(sqlite3_stmt* st, int idx, double v) {
  sqlite3_bind_double(st, idx, v);
}

void BindOptI32(sqlite3_stmt* st, int idx, const std::optional<int>& v) {
  if (v) {
    sqlite3_bind_int(st, idx, *v);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

void BindOptText(sqlite3_stmt* st, int idx, const std::optional<std::string>& v) {
  if (v) {
    BindText(st, idx, *v);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

std::string ColBlob(sqlite3_stmt* st, int col) {
  const void* data = sqlite3_column_blob(st, col);
  const int   size = sqlite3_column_bytes(st, col);
  return data ? std::string(static_cast<const char*>(data), static_cast<std::size_t>(size)) : std::string{};
}

int ColI32(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col);
}

std::uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<std::uint64_t>(sqlite3_column_int64(st, col));
}

double ColDouble(sqlite3_stmt* st, int col) {
  return sqlite3_column_double(st, col);
}

std::optional<int> ColOptI32(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return sqlite3_column_int(st, col);
}

std::optional<std::string> ColOptText(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return ColText(st, col);
}

StatementPtr TryPrepare(sqlite3* db, const char* sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
    return nullptr;
  }
  return StatementPtr(st);
}

// Reads have no Result channel; surface failures as StorageError.
StatementPtr PrepareOrThrow(sqlite3* db, const char* sql) {
  auto st = TryPrepare(db, sql);
  if (!st) {
    throw util::StorageError(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
  }
  return st;
}

void ThrowIfStepFailed(sqlite3* db, int rc) {
  if (rc != SQLITE_DONE && rc != SQLITE_ROW) {
    throw util::StorageError(std::string("sqlite step: ") + sqlite3_errmsg(db));
  }
}

model::SnapshotRecord ReadSnapshot(sqlite3_stmt* st) {
  model::SnapshotRecord r;
  r.team_id           = ColText(st, 0);
  r.snapshot_date     = ColText(st, 1);
  r.age               = ColI32(st, 2);
  r.gender            = ColText(st, 3);
  r.rank_in_cohort    = ColOptI32(st, 4);
  r.rank_in_cohort_ml = ColOptI32(st, 5);
  r.power_score_final = ColDouble(st, 6);
  r.powerscore_ml     = ColDouble(st, 7);
  return r;
}

constexpr const char* kSnapshotColumns =
    "team_id,snapshot_date,age,gender,rank_in_cohort,rank_in_cohort_ml,power_score_final,powerscore_ml";

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
    case SQLITE_FULL:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
    case SQLITE_NOTADB:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Games
// ------------------------------------------------------------------

Result SqliteRepository::UpsertGame(Transaction& t, const model::GameRow& r) {
  auto* db = TX(t).DB().Handle();

  const char* sql =
      "INSERT INTO games(game_id,team_id,date,opponent_id,age,gender,opponent_age,opponent_gender,goals_for,goals_against,"
      "home_team_id,provider) VALUES(?,?,?,?,?,?,?,?,?,?,?,?) "
      "ON CONFLICT(game_id,team_id) DO UPDATE SET date=excluded.date, opponent_id=excluded.opponent_id, age=excluded.age, "
      "gender=excluded.gender, opponent_age=excluded.opponent_age, opponent_gender=excluded.opponent_gender, "
      "goals_for=excluded.goals_for, goals_against=excluded.goals_against, home_team_id=excluded.home_team_id, "
      "provider=excluded.provider;";

  auto st = TryPrepare(db, sql);
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.game_id);
  BindText(st.get(), 2, r.team_id);
  BindText(st.get(), 3, r.date);
  BindText(st.get(), 4, r.opponent_id);
  BindOptI32(st.get(), 5, r.age);
  BindOptText(st.get(), 6, r.gender);
  BindOptI32(st.get(), 7, r.opponent_age);
  BindOptText(st.get(), 8, r.opponent_gender);
  BindOptI32(st.get(), 9, r.goals_for);
  BindOptI32(st.get(), 10, r.goals_against);
  BindOptText(st.get(), 11, r.home_team_id);
  BindText(st.get(), 12, r.provider);

  return Translate(db, sqlite3_step(st.get()));
}

std::vector<model::GameRow> SqliteRepository::ListGames(Transaction& t, const std::string& from_date, const std::string& to_date,
                                                        const std::string& provider) {
  auto* db = TX(t).DB().Handle();

  const char* sql =
      "SELECT game_id,team_id,date,opponent_id,age,gender,opponent_age,opponent_gender,goals_for,goals_against,home_team_id,provider "
      "FROM games WHERE date>=? AND date<=? AND (?='' OR provider=?) ORDER BY date,game_id,team_id;";

  auto st = PrepareOrThrow(db, sql);
  BindText(st.get(), 1, from_date);
  BindText(st.get(), 2, to_date);
  BindText(st.get(), 3, provider);
  BindText(st.get(), 4, provider);

  std::vector<model::GameRow> out;
  int                         rc = SQLITE_OK;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    model::GameRow r;
    r.game_id         = ColText(st.get(), 0);
    r.team_id         = ColText(st.get(), 1);
    r.date            = ColText(st.get(), 2);
    r.opponent_id     = ColText(st.get(), 3);
    r.age             = ColOptI32(st.get(), 4);
    r.gender          = ColOptText(st.get(), 5);
    r.opponent_age    = ColOptI32(st.get(), 6);
    r.opponent_gender = ColOptText(st.get(), 7);
    r.goals_for       = ColOptI32(st.get(), 8);
    r.goals_against   = ColOptI32(st.get(), 9);
    r.home_team_id    = ColOptText(st.get(), 10);
    r.provider        = ColText(st.get(), 11);
    out.push_back(std::move(r));
  }
  ThrowIfStepFailed(db, rc);
  return out;
}

// ------------------------------------------------------------------
// Teams
// ------------------------------------------------------------------

Result SqliteRepository::UpsertTeam(Transaction& t, const model::TeamRecord& r) {
  auto* db = TX(t).DB().Handle();

  const char* sql = "INSERT INTO teams(team_id,state_code) VALUES(?,?) ON CONFLICT(team_id) DO UPDATE SET state_code=excluded.state_code;";

  auto st = TryPrepare(db, sql);
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.team_id);
  BindText(st.get(), 2, r.state_code);
  return Translate(db, sqlite3_step(st.get()));
}

std::vector<model::TeamRecord> SqliteRepository::ListTeams(Transaction& t) {
  auto* db = TX(t).DB().Handle();
  auto  st = PrepareOrThrow(db, "SELECT team_id,state_code FROM teams ORDER BY team_id;");

  std::vector<model::TeamRecord> out;
  int                            rc = SQLITE_OK;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    out.push_back({ColText(st.get(), 0), ColText(st.get(), 1)});
  }
  ThrowIfStepFailed(db, rc);
  return out;
}

// ------------------------------------------------------------------
// Rankings
// ------------------------------------------------------------------

Result SqliteRepository::UpsertRanking(Transaction& t, const model::RankingRecord& r) {
  auto* db = TX(t).DB().Handle();

  const char* sql =
      "INSERT INTO rankings(team_id,age,gender,status,games_played,games_last_180_days,last_game,off_norm,def_norm,sos,sos_norm,scf,"
      "perf_centered,powerscore_core,powerscore_adj,power_score_final,ml_norm,powerscore_ml,power_score_final_ml,sos_rank,"
      "rank_in_cohort,rank_in_cohort_ml,rank_change_7d,rank_change_30d,snapshot_date) "
      "VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?) "
      "ON CONFLICT(team_id,age,gender) DO UPDATE SET status=excluded.status, games_played=excluded.games_played, "
      "games_last_180_days=excluded.games_last_180_days, last_game=excluded.last_game, off_norm=excluded.off_norm, "
      "def_norm=excluded.def_norm, sos=excluded.sos, sos_norm=excluded.sos_norm, scf=excluded.scf, "
      "perf_centered=excluded.perf_centered, powerscore_core=excluded.powerscore_core, powerscore_adj=excluded.powerscore_adj, "
      "power_score_final=excluded.power_score_final, ml_norm=excluded.ml_norm, powerscore_ml=excluded.powerscore_ml, "
      "power_score_final_ml=excluded.power_score_final_ml, sos_rank=excluded.sos_rank, rank_in_cohort=excluded.rank_in_cohort, "
      "rank_in_cohort_ml=excluded.rank_in_cohort_ml, rank_change_7d=excluded.rank_change_7d, "
      "rank_change_30d=excluded.rank_change_30d, snapshot_date=excluded.snapshot_date;";

  auto st = TryPrepare(db, sql);
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  auto* s = st.get();
  BindText(s, 1, r.team_id);
  BindI32(s, 2, r.age);
  BindText(s, 3, r.gender);
  BindText(s, 4, r.status);
  BindI32(s, 5, r.games_played);
  BindI32(s, 6, r.games_last_180_days);
  BindText(s, 7, r.last_game);
  BindDouble(s, 8, r.off_norm);
  BindDouble(s, 9, r.def_norm);
  BindDouble(s, 10, r.sos);
  BindDouble(s, 11, r.sos_norm);
  BindDouble(s, 12, r.scf);
  BindDouble(s, 13, r.perf_centered);
  BindDouble(s, 14, r.powerscore_core);
  BindDouble(s, 15, r.powerscore_adj);
  BindDouble(s, 16, r.power_score_final);
  BindDouble(s, 17, r.ml_norm);
  BindDouble(s, 18, r.powerscore_ml);
  BindDouble(s, 19, r.power_score_final_ml);
  BindOptI32(s, 20, r.sos_rank);
  BindOptI32(s, 21, r.rank_in_cohort);
  BindOptI32(s, 22, r.rank_in_cohort_ml);
  BindOptI32(s, 23, r.rank_change_7d);
  BindOptI32(s, 24, r.rank_change_30d);
  BindText(s, 25, r.snapshot_date);

  return Translate(db, sqlite3_step(s));
}

std::vector<model::RankingRecord> SqliteRepository::ListRankings(Transaction& t, int age, const std::string& gender) {
  auto* db = TX(t).DB().Handle();

  const char* sql =
      "SELECT team_id,age,gender,status,games_played,games_last_180_days,last_game,off_norm,def_norm,sos,sos_norm,scf,"
      "perf_centered,powerscore_core,powerscore_adj,power_score_final,ml_norm,powerscore_ml,power_score_final_ml,sos_rank,"
      "rank_in_cohort,rank_in_cohort_ml,rank_change_7d,rank_change_30d,snapshot_date FROM rankings WHERE age=? AND gender=? "
      "ORDER BY rank_in_cohort IS NULL, rank_in_cohort, team_id;";

  auto st = PrepareOrThrow(db, sql);
  BindI32(st.get(), 1, age);
  BindText(st.get(), 2, gender);

  std::vector<model::RankingRecord> out;
  int                               rc = SQLITE_OK;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    auto*                s = st.get();
    model::RankingRecord r;
    r.team_id              = ColText(s, 0);
    r.age                  = ColI32(s, 1);
    r.gender               = ColText(s, 2);
    r.status               = ColText(s, 3);
    r.games_played         = ColI32(s, 4);
    r.games_last_180_days  = ColI32(s, 5);
    r.last_game            = ColText(s, 6);
    r.off_norm             = ColDouble(s, 7);
    r.def_norm             = ColDouble(s, 8);
    r.sos                  = ColDouble(s, 9);
    r.sos_norm             = ColDouble(s, 10);
    r.scf                  = ColDouble(s, 11);
    r.perf_centered        = ColDouble(s, 12);
    r.powerscore_core      = ColDouble(s, 13);
    r.powerscore_adj       = ColDouble(s, 14);
    r.power_score_final    = ColDouble(s, 15);
    r.ml_norm              = ColDouble(s, 16);
    r.powerscore_ml        = ColDouble(s, 17);
    r.power_score_final_ml = ColDouble(s, 18);
    r.sos_rank             = ColOptI32(s, 19);
    r.rank_in_cohort       = ColOptI32(s, 20);
    r.rank_in_cohort_ml    = ColOptI32(s, 21);
    r.rank_change_7d       = ColOptI32(s, 22);
    r.rank_change_30d      = ColOptI32(s, 23);
    r.snapshot_date        = ColText(s, 24);
    out.push_back(std::move(r));
  }
  ThrowIfStepFailed(db, rc);
  return out;
}

// ------------------------------------------------------------------
// Snapshots
// ------------------------------------------------------------------

Result SqliteRepository::UpsertSnapshot(Transaction& t, const model::SnapshotRecord& r) {
  auto* db = TX(t).DB().Handle();

  const char* sql =
      "INSERT INTO ranking_history(team_id,snapshot_date,age,gender,rank_in_cohort,rank_in_cohort_ml,power_score_final,powerscore_ml) "
      "VALUES(?,?,?,?,?,?,?,?) ON CONFLICT(team_id,snapshot_date) DO UPDATE SET age=excluded.age, gender=excluded.gender, "
      "rank_in_cohort=excluded.rank_in_cohort, rank_in_cohort_ml=excluded.rank_in_cohort_ml, "
      "power_score_final=excluded.power_score_final, powerscore_ml=excluded.powerscore_ml;";

  auto st = TryPrepare(db, sql);
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.team_id);
  BindText(st.get(), 2, r.snapshot_date);
  BindI32(st.get(), 3, r.age);
  BindText(st.get(), 4, r.gender);
  BindOptI32(st.get(), 5, r.rank_in_cohort);
  BindOptI32(st.get(), 6, r.rank_in_cohort_ml);
  BindDouble(st.get(), 7, r.power_score_final);
  BindDouble(st.get(), 8, r.powerscore_ml);

  return Translate(db, sqlite3_step(st.get()));
}

std::vector<model::SnapshotRecord> SqliteRepository::ListSnapshots(Transaction& t, const std::string& from_date, const std::string& to_date) {
  auto* db  = TX(t).DB().Handle();
  auto  sql = std::string("SELECT ") + kSnapshotColumns +
             " FROM ranking_history WHERE snapshot_date>=? AND snapshot_date<=? ORDER BY team_id,snapshot_date;";

  auto st = PrepareOrThrow(db, sql.c_str());
  BindText(st.get(), 1, from_date);
  BindText(st.get(), 2, to_date);

  std::vector<model::SnapshotRecord> out;
  int                                rc = SQLITE_OK;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    out.push_back(ReadSnapshot(st.get()));
  }
  ThrowIfStepFailed(db, rc);
  return out;
}

std::vector<model::SnapshotRecord> SqliteRepository::ListSnapshotsForTeam(Transaction& t, const std::string& team_id) {
  auto* db  = TX(t).DB().Handle();
  auto  sql = std::string("SELECT ") + kSnapshotColumns + " FROM ranking_history WHERE team_id=? ORDER BY snapshot_date;";

  auto st = PrepareOrThrow(db, sql.c_str());
  BindText(st.get(), 1, team_id);

  std::vector<model::SnapshotRecord> out;
  int                                rc = SQLITE_OK;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    out.push_back(ReadSnapshot(st.get()));
  }
  ThrowIfStepFailed(db, rc);
  return out;
}

Result SqliteRepository::DeleteSnapshotsBefore(Transaction& t, const std::string& cutoff_date, std::uint64_t& deleted) {
  auto* db = TX(t).DB().Handle();

  auto st = TryPrepare(db, "DELETE FROM ranking_history WHERE snapshot_date<?;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, cutoff_date);
  auto result = Translate(db, sqlite3_step(st.get()));
  deleted     = result ? static_cast<std::uint64_t>(sqlite3_changes(db)) : 0;
  return result;
}

// ------------------------------------------------------------------
// Residuals
// ------------------------------------------------------------------

Result SqliteRepository::UpsertGameResidual(Transaction& t, const model::GameResidualRecord& r) {
  auto* db = TX(t).DB().Handle();

  const char* sql =
      "INSERT INTO game_residuals(game_id,residual,snapshot_date) VALUES(?,?,?) "
      "ON CONFLICT(game_id) DO UPDATE SET residual=excluded.residual, snapshot_date=excluded.snapshot_date;";

  auto st = TryPrepare(db, sql);
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.game_id);
  BindDouble(st.get(), 2, r.residual);
  BindText(st.get(), 3, r.snapshot_date);
  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::GameResidualRecord> SqliteRepository::GetGameResidual(Transaction& t, const std::string& game_id) {
  auto* db = TX(t).DB().Handle();
  auto  st = PrepareOrThrow(db, "SELECT game_id,residual,snapshot_date FROM game_residuals WHERE game_id=?;");
  BindText(st.get(), 1, game_id);

  int rc = sqlite3_step(st.get());
  if (rc != SQLITE_ROW) {
    ThrowIfStepFailed(db, rc);
    return std::nullopt;
  }

  model::GameResidualRecord r;
  r.game_id       = ColText(st.get(), 0);
  r.residual      = ColDouble(st.get(), 1);
  r.snapshot_date = ColText(st.get(), 2);
  return r;
}

// ------------------------------------------------------------------
// Cache
// ------------------------------------------------------------------

Result SqliteRepository::PutCacheEntry(Transaction& t, const model::CacheRecord& r) {
  auto* db = TX(t).DB().Handle();

  const char* sql =
      "INSERT INTO rating_cache(cache_key,created_at_ms,payload) VALUES(?,?,?) "
      "ON CONFLICT(cache_key) DO UPDATE SET created_at_ms=excluded.created_at_ms, payload=excluded.payload;";

  auto st = TryPrepare(db, sql);
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.cache_key);
  BindU64(st.get(), 2, r.created_at_ms);
  BindBlob(st.get(), 3, r.payload);
  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::CacheRecord> SqliteRepository::GetCacheEntry(Transaction& t, const std::string& cache_key) {
  auto* db = TX(t).DB().Handle();
  auto  st = PrepareOrThrow(db, "SELECT cache_key,created_at_ms,payload FROM rating_cache WHERE cache_key=?;");
  BindText(st.get(), 1, cache_key);

  int rc = sqlite3_step(st.get());
  if (rc != SQLITE_ROW) {
    ThrowIfStepFailed(db, rc);
    return std::nullopt;
  }

  model::CacheRecord r;
  r.cache_key     = ColText(st.get(), 0);
  r.created_at_ms = ColU64(st.get(), 1);
  r.payload       = ColBlob(st.get(), 2);
  return r;
}

} // namespace powerscore::db::sqlite
