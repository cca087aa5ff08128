#include "pg_pool.hpp"

namespace powerscore::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)), max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);
  cv_.wait(lock, [this] { return !idle_.empty() || live_connections_ < max_connections_; });

  if (!idle_.empty()) {
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    return Wrap(conn.release());
  }

  ++live_connections_;
  lock.unlock();

  std::unique_ptr<pqxx::connection> conn;
  try {
    conn = std::make_unique<pqxx::connection>(conninfo_);
  } catch (const std::exception&) {
    std::lock_guard rollback_lock(mutex_);
    --live_connections_;
    cv_.notify_one();
    throw;
  }
  return Wrap(conn.release());
}

void PgPool::BootstrapSchema() {
  auto       conn = Acquire();
  pqxx::work tx(*conn);

  tx.exec(
      "CREATE TABLE IF NOT EXISTS games (game_id TEXT NOT NULL, team_id TEXT NOT NULL, date DATE NOT NULL, opponent_id TEXT NOT NULL, "
      "age INTEGER, gender TEXT, opponent_age INTEGER, opponent_gender TEXT, goals_for INTEGER, goals_against INTEGER, "
      "home_team_id TEXT, provider TEXT NOT NULL DEFAULT '', PRIMARY KEY (game_id, team_id));");
  tx.exec("CREATE INDEX IF NOT EXISTS games_date_idx ON games(date);");
  tx.exec("CREATE TABLE IF NOT EXISTS teams (team_id TEXT PRIMARY KEY, state_code TEXT NOT NULL DEFAULT '');");
  tx.exec(
      "CREATE TABLE IF NOT EXISTS rankings (team_id TEXT NOT NULL, age INTEGER NOT NULL, gender TEXT NOT NULL, status TEXT NOT NULL, "
      "games_played INTEGER NOT NULL, games_last_180_days INTEGER NOT NULL, last_game DATE NOT NULL, off_norm DOUBLE PRECISION NOT NULL, "
      "def_norm DOUBLE PRECISION NOT NULL, sos DOUBLE PRECISION NOT NULL, sos_norm DOUBLE PRECISION NOT NULL, scf DOUBLE PRECISION NOT NULL, "
      "perf_centered DOUBLE PRECISION NOT NULL, powerscore_core DOUBLE PRECISION NOT NULL, powerscore_adj DOUBLE PRECISION NOT NULL, "
      "power_score_final DOUBLE PRECISION NOT NULL, ml_norm DOUBLE PRECISION NOT NULL, powerscore_ml DOUBLE PRECISION NOT NULL, "
      "power_score_final_ml DOUBLE PRECISION NOT NULL, sos_rank INTEGER, rank_in_cohort INTEGER, rank_in_cohort_ml INTEGER, "
      "rank_change_7d INTEGER, rank_change_30d INTEGER, snapshot_date DATE NOT NULL, PRIMARY KEY (team_id, age, gender));");
  tx.exec(
      "CREATE TABLE IF NOT EXISTS ranking_history (team_id TEXT NOT NULL, snapshot_date DATE NOT NULL, age INTEGER NOT NULL, "
      "gender TEXT NOT NULL, rank_in_cohort INTEGER, rank_in_cohort_ml INTEGER, power_score_final DOUBLE PRECISION NOT NULL, "
      "powerscore_ml DOUBLE PRECISION NOT NULL, PRIMARY KEY (team_id, snapshot_date));");
  tx.exec("CREATE INDEX IF NOT EXISTS ranking_history_date_idx ON ranking_history(snapshot_date);");
  tx.exec(
      "CREATE TABLE IF NOT EXISTS game_residuals (game_id TEXT PRIMARY KEY, residual DOUBLE PRECISION NOT NULL, "
      "snapshot_date DATE NOT NULL);");
  tx.exec("CREATE TABLE IF NOT EXISTS rating_cache (cache_key TEXT PRIMARY KEY, created_at_ms BIGINT NOT NULL, payload BYTEA NOT NULL);");
  tx.commit();
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace powerscore::db::postgres
