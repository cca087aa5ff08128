#include "pg_repository.hpp"

#include <cstddef>

#include "internal/util/errors.hpp"

namespace powerscore::db::postgres {

using powerscore::db::ErrorCode;
using powerscore::db::Result;

namespace {

constexpr const char* kSnapshotColumns =
    "team_id,snapshot_date::text,age,gender,rank_in_cohort,rank_in_cohort_ml,power_score_final,powerscore_ml";

model::SnapshotRecord ReadSnapshot(const pqxx::row& row) {
  model::SnapshotRecord r;
  r.team_id           = row[0].as<std::string>();
  r.snapshot_date     = row[1].as<std::string>();
  r.age               = row[2].as<int>();
  r.gender            = row[3].as<std::string>();
  r.rank_in_cohort    = row[4].as<std::optional<int>>();
  r.rank_in_cohort_ml = row[5].as<std::optional<int>>();
  r.power_score_final = row[6].as<double>();
  r.powerscore_ml     = row[7].as<double>();
  return r;
}

// Reads have no Result channel; rethrow backend errors as StorageError.
template <typename Fn>
auto ReadOrThrow(const char* what, Fn&& fn) {
  try {
    return fn();
  } catch (const pqxx::failure& e) {
    throw util::StorageError(std::string("postgres ") + what + ": " + e.what());
  }
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Games
// ------------------------------------------------------------------

Result PgRepository::UpsertGame(Transaction& t, const model::GameRow& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO games(game_id,team_id,date,opponent_id,age,gender,opponent_age,opponent_gender,goals_for,goals_against,"
        "home_team_id,provider) VALUES($1,$2,$3::date,$4,$5,$6,$7,$8,$9,$10,$11,$12) "
        "ON CONFLICT(game_id,team_id) DO UPDATE SET date=EXCLUDED.date, opponent_id=EXCLUDED.opponent_id, age=EXCLUDED.age, "
        "gender=EXCLUDED.gender, opponent_age=EXCLUDED.opponent_age, opponent_gender=EXCLUDED.opponent_gender, "
        "goals_for=EXCLUDED.goals_for, goals_against=EXCLUDED.goals_against, home_team_id=EXCLUDED.home_team_id, "
        "provider=EXCLUDED.provider;",
        r.game_id, r.team_id, r.date, r.opponent_id, r.age, r.gender, r.opponent_age, r.opponent_gender, r.goals_for,
        r.goals_against, r.home_team_id, r.provider);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::GameRow> PgRepository::ListGames(Transaction& t, const std::string& from_date, const std::string& to_date,
                                                    const std::string& provider) {
  auto res = ReadOrThrow("list games", [&] {
    return TX(t).Work().exec_params(
        "SELECT game_id,team_id,date::text,opponent_id,age,gender,opponent_age,opponent_gender,goals_for,goals_against,"
        "home_team_id,provider FROM games WHERE date>=$1::date AND date<=$2::date AND ($3='' OR provider=$3) "
        "ORDER BY date,game_id,team_id;",
        from_date, to_date, provider);
  });

  std::vector<model::GameRow> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    model::GameRow r;
    r.game_id         = row[0].as<std::string>();
    r.team_id         = row[1].as<std::string>();
    r.date            = row[2].as<std::string>();
    r.opponent_id     = row[3].as<std::string>();
    r.age             = row[4].as<std::optional<int>>();
    r.gender          = row[5].as<std::optional<std::string>>();
    r.opponent_age    = row[6].as<std::optional<int>>();
    r.opponent_gender = row[7].as<std::optional<std::string>>();
    r.goals_for       = row[8].as<std::optional<int>>();
    r.goals_against   = row[9].as<std::optional<int>>();
    r.home_team_id    = row[10].as<std::optional<std::string>>();
    r.provider        = row[11].as<std::string>();
    out.push_back(std::move(r));
  }
  return out;
}

// ------------------------------------------------------------------
// Teams
// ------------------------------------------------------------------

Result PgRepository::UpsertTeam(Transaction& t, const model::TeamRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO teams(team_id,state_code) VALUES($1,$2) ON CONFLICT(team_id) DO UPDATE SET state_code=EXCLUDED.state_code;",
        r.team_id, r.state_code);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::TeamRecord> PgRepository::ListTeams(Transaction& t) {
  auto res = ReadOrThrow("list teams", [&] { return TX(t).Work().exec("SELECT team_id,state_code FROM teams ORDER BY team_id;"); });

  std::vector<model::TeamRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back({row[0].as<std::string>(), row[1].as<std::string>()});
  }
  return out;
}

// ------------------------------------------------------------------
// Rankings
// ------------------------------------------------------------------

Result PgRepository::UpsertRanking(Transaction& t, const model::RankingRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO rankings(team_id,age,gender,status,games_played,games_last_180_days,last_game,off_norm,def_norm,sos,sos_norm,"
        "scf,perf_centered,powerscore_core,powerscore_adj,power_score_final,ml_norm,powerscore_ml,power_score_final_ml,sos_rank,"
        "rank_in_cohort,rank_in_cohort_ml,rank_change_7d,rank_change_30d,snapshot_date) "
        "VALUES($1,$2,$3,$4,$5,$6,$7::date,$8,$9,$10,$11,$12,$13,$14,$15,$16,$17,$18,$19,$20,$21,$22,$23,$24,$25::date) "
        "ON CONFLICT(team_id,age,gender) DO UPDATE SET status=EXCLUDED.status, games_played=EXCLUDED.games_played, "
        "games_last_180_days=EXCLUDED.games_last_180_days, last_game=EXCLUDED.last_game, off_norm=EXCLUDED.off_norm, "
        "def_norm=EXCLUDED.def_norm, sos=EXCLUDED.sos, sos_norm=EXCLUDED.sos_norm, scf=EXCLUDED.scf, "
        "perf_centered=EXCLUDED.perf_centered, powerscore_core=EXCLUDED.powerscore_core, powerscore_adj=EXCLUDED.powerscore_adj, "
        "power_score_final=EXCLUDED.power_score_final, ml_norm=EXCLUDED.ml_norm, powerscore_ml=EXCLUDED.powerscore_ml, "
        "power_score_final_ml=EXCLUDED.power_score_final_ml, sos_rank=EXCLUDED.sos_rank, rank_in_cohort=EXCLUDED.rank_in_cohort, "
        "rank_in_cohort_ml=EXCLUDED.rank_in_cohort_ml, rank_change_7d=EXCLUDED.rank_change_7d, "
        "rank_change_30d=EXCLUDED.rank_change_30d, snapshot_date=EXCLUDED.snapshot_date;",
        r.team_id, r.age, r.gender, r.status, r.games_played, r.games_last_180_days, r.last_game, r.off_norm, r.def_norm, r.sos,
        r.sos_norm, r.scf, r.perf_centered, r.powerscore_core, r.powerscore_adj, r.power_score_final, r.ml_norm, r.powerscore_ml,
        r.power_score_final_ml, r.sos_rank, r.rank_in_cohort, r.rank_in_cohort_ml, r.rank_change_7d, r.rank_change_30d,
        r.snapshot_date);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::RankingRecord> PgRepository::ListRankings(Transaction& t, int age, const std::string& gender) {
  auto res = ReadOrThrow("list rankings", [&] {
    return TX(t).Work().exec_params(
        "SELECT team_id,age,gender,status,games_played,games_last_180_days,last_game::text,off_norm,def_norm,sos,sos_norm,scf,"
        "perf_centered,powerscore_core,powerscore_adj,power_score_final,ml_norm,powerscore_ml,power_score_final_ml,sos_rank,"
        "rank_in_cohort,rank_in_cohort_ml,rank_change_7d,rank_change_30d,snapshot_date::text FROM rankings "
        "WHERE age=$1 AND gender=$2 ORDER BY rank_in_cohort ASC NULLS LAST, team_id;",
        age, gender);
  });

  std::vector<model::RankingRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    model::RankingRecord r;
    r.team_id              = row[0].as<std::string>();
    r.age                  = row[1].as<int>();
    r.gender               = row[2].as<std::string>();
    r.status               = row[3].as<std::string>();
    r.games_played         = row[4].as<int>();
    r.games_last_180_days  = row[5].as<int>();
    r.last_game            = row[6].as<std::string>();
    r.off_norm             = row[7].as<double>();
    r.def_norm             = row[8].as<double>();
    r.sos                  = row[9].as<double>();
    r.sos_norm             = row[10].as<double>();
    r.scf                  = row[11].as<double>();
    r.perf_centered        = row[12].as<double>();
    r.powerscore_core      = row[13].as<double>();
    r.powerscore_adj       = row[14].as<double>();
    r.power_score_final    = row[15].as<double>();
    r.ml_norm              = row[16].as<double>();
    r.powerscore_ml        = row[17].as<double>();
    r.power_score_final_ml = row[18].as<double>();
    r.sos_rank             = row[19].as<std::optional<int>>();
    r.rank_in_cohort       = row[20].as<std::optional<int>>();
    r.rank_in_cohort_ml    = row[21].as<std::optional<int>>();
    r.rank_change_7d       = row[22].as<std::optional<int>>();
    r.rank_change_30d      = row[23].as<std::optional<int>>();
    r.snapshot_date        = row[24].as<std::string>();
    out.push_back(std::move(r));
  }
  return out;
}

// ------------------------------------------------------------------
// Snapshots
// ------------------------------------------------------------------

Result PgRepository::UpsertSnapshot(Transaction& t, const model::SnapshotRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO ranking_history(team_id,snapshot_date,age,gender,rank_in_cohort,rank_in_cohort_ml,power_score_final,"
        "powerscore_ml) VALUES($1,$2::date,$3,$4,$5,$6,$7,$8) ON CONFLICT(team_id,snapshot_date) DO UPDATE SET "
        "age=EXCLUDED.age, gender=EXCLUDED.gender, rank_in_cohort=EXCLUDED.rank_in_cohort, "
        "rank_in_cohort_ml=EXCLUDED.rank_in_cohort_ml, power_score_final=EXCLUDED.power_score_final, "
        "powerscore_ml=EXCLUDED.powerscore_ml;",
        r.team_id, r.snapshot_date, r.age, r.gender, r.rank_in_cohort, r.rank_in_cohort_ml, r.power_score_final, r.powerscore_ml);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::SnapshotRecord> PgRepository::ListSnapshots(Transaction& t, const std::string& from_date, const std::string& to_date) {
  const auto sql = std::string("SELECT ") + kSnapshotColumns +
                   " FROM ranking_history WHERE snapshot_date>=$1::date AND snapshot_date<=$2::date ORDER BY team_id,snapshot_date;";
  auto res = ReadOrThrow("list snapshots", [&] { return TX(t).Work().exec_params(sql, from_date, to_date); });

  std::vector<model::SnapshotRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadSnapshot(row));
  }
  return out;
}

std::vector<model::SnapshotRecord> PgRepository::ListSnapshotsForTeam(Transaction& t, const std::string& team_id) {
  const auto sql = std::string("SELECT ") + kSnapshotColumns + " FROM ranking_history WHERE team_id=$1 ORDER BY snapshot_date;";
  auto       res = ReadOrThrow("list team snapshots", [&] { return TX(t).Work().exec_params(sql, team_id); });

  std::vector<model::SnapshotRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadSnapshot(row));
  }
  return out;
}

Result PgRepository::DeleteSnapshotsBefore(Transaction& t, const std::string& cutoff_date, std::uint64_t& deleted) {
  deleted = 0;
  try {
    auto res = TX(t).Work().exec_params("DELETE FROM ranking_history WHERE snapshot_date<$1::date;", cutoff_date);
    deleted  = static_cast<std::uint64_t>(res.affected_rows());
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Residuals
// ------------------------------------------------------------------

Result PgRepository::UpsertGameResidual(Transaction& t, const model::GameResidualRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO game_residuals(game_id,residual,snapshot_date) VALUES($1,$2,$3::date) "
        "ON CONFLICT(game_id) DO UPDATE SET residual=EXCLUDED.residual, snapshot_date=EXCLUDED.snapshot_date;",
        r.game_id, r.residual, r.snapshot_date);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::GameResidualRecord> PgRepository::GetGameResidual(Transaction& t, const std::string& game_id) {
  auto res = ReadOrThrow("get residual", [&] {
    return TX(t).Work().exec_params("SELECT game_id,residual,snapshot_date::text FROM game_residuals WHERE game_id=$1;", game_id);
  });
  if (res.empty()) return std::nullopt;

  model::GameResidualRecord r;
  r.game_id       = res[0][0].as<std::string>();
  r.residual      = res[0][1].as<double>();
  r.snapshot_date = res[0][2].as<std::string>();
  return r;
}

// ------------------------------------------------------------------
// Cache
// ------------------------------------------------------------------

Result PgRepository::PutCacheEntry(Transaction& t, const model::CacheRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO rating_cache(cache_key,created_at_ms,payload) VALUES($1,$2,$3) "
        "ON CONFLICT(cache_key) DO UPDATE SET created_at_ms=EXCLUDED.created_at_ms, payload=EXCLUDED.payload;",
        r.cache_key, static_cast<std::int64_t>(r.created_at_ms), pqxx::binary_cast(r.payload));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::CacheRecord> PgRepository::GetCacheEntry(Transaction& t, const std::string& cache_key) {
  auto res = ReadOrThrow("get cache entry", [&] {
    return TX(t).Work().exec_params("SELECT cache_key,created_at_ms,payload FROM rating_cache WHERE cache_key=$1;", cache_key);
  });
  if (res.empty()) return std::nullopt;

  model::CacheRecord r;
  r.cache_key     = res[0][0].as<std::string>();
  r.created_at_ms = static_cast<std::uint64_t>(res[0][1].as<std::int64_t>());

  const auto bytes = res[0][2].as<std::basic_string<std::byte>>();
  r.payload.assign(reinterpret_cast<const char*>(bytes.data()), bytes.size());
  return r;
}

} // namespace powerscore::db::postgres
