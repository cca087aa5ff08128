#include "rank_history.hpp"

#include <cstdlib>

#include "internal/observability/logging.hpp"

namespace powerscore::history {

std::optional<int> PreferredRank(std::optional<int> ml_rank, std::optional<int> core_rank) {
  return ml_rank ? ml_rank : core_rank;
}

std::optional<int> RankChange(std::optional<int> historical, std::optional<int> current) {
  if (!historical || !current) return std::nullopt;
  return *historical - *current;
}

std::map<std::string, HistoricalRank> HistoricalRanks(const std::vector<db::model::SnapshotRecord>& snapshots, util::Date target,
                                           int tolerance_days) {
  struct Best {
    int                              distance = 0;
    util::Date                       date{};
    const db::model::SnapshotRecord* row      = nullptr;
  };

  std::map<std::string, Best> best;
  for (const auto& s : snapshots) {
    auto date = util::ParseDate(s.snapshot_date);
    if (!date) continue;

    const int distance = std::abs(util::DaysBetween(target, *date));
    if (distance > tolerance_days) continue;

    auto it = best.find(s.team_id);
    if (it == best.end()) {
      best.emplace(s.team_id, Best{distance, *date, &s});
      continue;
    }
    auto& b = it->second;
    if (distance < b.distance || (distance == b.distance && *date > b.date)) {
      b = Best{distance, *date, &s};
    }
  }

  std::map<std::string, HistoricalRank> out;
  for (const auto& [team_id, b] : best) {
    if (auto rank = PreferredRank(b.row->rank_in_cohort_ml, b.row->rank_in_cohort)) {
      out.emplace(team_id, HistoricalRank{*rank, b.row->age, b.row->gender});
    }
  }
  return out;
}

RankHistory::RankHistory(db::Repository& repo, HistorySettings settings) : repo_(repo), settings_(settings) {
}

std::map<std::string, HistoricalRank> RankHistory::RanksAround(util::Date target) {
  const auto from = util::FormatDate(util::AddDays(target, -settings_.lookup_tolerance_days));
  const auto to   = util::FormatDate(util::AddDays(target, settings_.lookup_tolerance_days));

  auto tx        = repo_.Begin();
  auto snapshots = repo_.ListSnapshots(*tx, from, to);
  tx->Commit();

  return HistoricalRanks(snapshots, target, settings_.lookup_tolerance_days);
}

void RankHistory::ApplyDeltas(std::vector<model::TeamCohortStat>& teams, util::Date today) {
  const auto week  = RanksAround(util::AddDays(today, -7));
  const auto month = RanksAround(util::AddDays(today, -30));

  int  other_cohort = 0;
  auto lookup       = [&other_cohort](const std::map<std::string, HistoricalRank>& ranks,
                                const model::TeamCohortStat& team) -> std::optional<int> {
    auto it = ranks.find(team.team_id);
    if (it == ranks.end()) return std::nullopt;
    if (!it->second.SameCohort(team)) {
      ++other_cohort;
      return std::nullopt;
    }
    return it->second.rank;
  };

  int with_history = 0;
  for (auto& t : teams) {
    const auto current = PreferredRank(t.rank_in_cohort_ml, t.rank_in_cohort);
    t.rank_change_7d   = RankChange(lookup(week, t), current);
    t.rank_change_30d  = RankChange(lookup(month, t), current);
    if (t.rank_change_7d || t.rank_change_30d) ++with_history;
  }

  POWERSCORE_LOG_INFO("rank deltas computed", {observability::IntField("teams_with_history", with_history),
                                              observability::IntField("other_cohort_skips", other_cohort),
                                              observability::IntField("snapshots_7d", static_cast<std::int64_t>(week.size())),
                                              observability::IntField("snapshots_30d", static_cast<std::int64_t>(month.size()))});
}

std::vector<db::model::SnapshotRecord> RankHistory::BuildSnapshots(const std::vector<model::TeamCohortStat>& teams,
                                                                   util::Date today) const {
  const auto date = util::FormatDate(today);

  std::map<std::string, const model::TeamCohortStat*> chosen;
  for (const auto& t : teams) {
    if (!t.rank_in_cohort && !t.rank_in_cohort_ml) continue;
    auto it = chosen.find(t.team_id);
    if (it == chosen.end() || t.games_played > it->second->games_played) {
      chosen[t.team_id] = &t;
    }
  }

  std::vector<db::model::SnapshotRecord> out;
  out.reserve(chosen.size());
  for (const auto& [team_id, t] : chosen) {
    db::model::SnapshotRecord s;
    s.team_id           = team_id;
    s.snapshot_date     = date;
    s.age               = t->age;
    s.gender            = t->gender;
    s.rank_in_cohort    = t->rank_in_cohort;
    s.rank_in_cohort_ml = t->rank_in_cohort_ml;
    s.power_score_final = t->power_score_final;
    s.powerscore_ml     = t->powerscore_ml;
    out.push_back(std::move(s));
  }
  return out;
}

db::Result RankHistory::Prune(util::Date today, std::uint64_t& deleted) {
  const auto cutoff = util::FormatDate(util::AddDays(today, -settings_.snapshot_retention_days));

  auto tx     = repo_.Begin();
  auto result = tx->Finish(repo_.DeleteSnapshotsBefore(*tx, cutoff, deleted));
  if (!result) return result;

  POWERSCORE_LOG_INFO("snapshots pruned", {observability::StringField("cutoff", cutoff),
                                          observability::IntField("deleted", static_cast<std::int64_t>(deleted))});
  return result;
}

} // namespace powerscore::history
