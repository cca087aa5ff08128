#include "rating_engine.hpp"

#include <map>

#include "cohort_worker_pool.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/rating/performance_layer.hpp"
#include "internal/rating/power_score_composer.hpp"
#include "internal/rating/shrinkage_normalizer.hpp"
#include "internal/rating/sos_engine.hpp"
#include "internal/rating/team_maps.hpp"

namespace powerscore::pipeline {

using observability::Stage;
using observability::StageSpan;

RatingEngine::RatingEngine(const rating::Settings& settings, std::size_t worker_threads)
    : settings_(settings), worker_threads_(worker_threads) {
}

EngineOutput RatingEngine::Compute(const std::vector<model::GameRecord>& games, const rating::TeamDirectory& directory,
                                   util::Date today) const {
  auto out = ComputeCore(games, directory, today);
  ApplyPredictive(out);
  return out;
}

EngineOutput RatingEngine::ComputeCore(const std::vector<model::GameRecord>& games, const rating::TeamDirectory& directory,
                                       util::Date today) const {
  EngineOutput out;

  rating::AggregateResult aggregate;
  {
    StageSpan span(Stage::kAggregate);
    aggregate = rating::FeatureAggregator(settings_).Aggregate(games, today);
    span.SetCount("teams", static_cast<std::int64_t>(aggregate.teams.size()));
  }

  {
    StageSpan                   span(Stage::kShrinkage);
    rating::ShrinkageNormalizer shrinkage(settings_);
    shrinkage.Apply(aggregate.teams);
    if (settings_.shrinkage.opponent_adjust_enabled) {
      aggregate.teams = shrinkage.AdjustForOpponents(aggregate.games, aggregate.teams, today);
    }
  }

  const auto strength = rating::BuildTeamValueMap(aggregate.teams, &model::TeamCohortStat::abs_strength);
  const auto power    = rating::BuildTeamValueMap(aggregate.teams, &model::TeamCohortStat::power_presos);

  if (settings_.sos.scf_enabled && directory.empty()) {
    POWERSCORE_LOG_WARN("team directory empty, schedule connectivity disabled for this run");
  }

  // cohort tables and game views, in cohort key order
  std::vector<std::vector<model::TeamCohortStat>>      tables;
  std::vector<std::vector<const rating::PreparedGame*>> cohort_games;
  {
    std::map<model::CohortKey, std::size_t> slot;
    for (const auto& [key, rows] : rating::GroupByCohort(aggregate.teams)) {
      slot.emplace(key, tables.size());
      auto& table = tables.emplace_back();
      for (auto i : rows) {
        table.push_back(aggregate.teams[i]);
      }
      cohort_games.emplace_back();
    }
    for (const auto& p : aggregate.games) {
      auto it = slot.find({p.game.age, p.game.gender});
      if (it != slot.end()) {
        cohort_games[it->second].push_back(&p);
      }
    }
  }

  {
    StageSpan span(Stage::kCohorts);
    span.SetCount("cohorts", static_cast<std::int64_t>(tables.size()));

    rating::SosEngine          sos(settings_, strength, directory);
    rating::PerformanceLayer   performance(settings_, power, strength);
    rating::PowerScoreComposer composer(settings_, today);

    CohortWorkerPool pool(worker_threads_);
    pool.Run(tables.size(), [&](std::size_t i) {
      sos.Apply(tables[i], cohort_games[i], today);
      performance.Apply(tables[i], cohort_games[i]);
      composer.Apply(tables[i]);
    });
  }

  for (auto& table : tables) {
    for (auto& t : table) {
      out.teams.push_back(std::move(t));
    }
  }
  rating::SortTable(out.teams);

  out.games        = std::move(aggregate.games);
  out.cohort_count = tables.size();

  POWERSCORE_LOG_INFO("core rating computed", {observability::IntField("teams", static_cast<std::int64_t>(out.teams.size())),
                                               observability::IntField("cohorts", static_cast<std::int64_t>(out.cohort_count)),
                                               observability::IntField("games", static_cast<std::int64_t>(out.games.size()))});
  return out;
}

void RatingEngine::ApplyPredictive(EngineOutput& output) const {
  StageSpan span(Stage::kPredictive);
  output.predictive = ml::PredictiveLayer(settings_).Apply(output.teams, output.games);
  span.SetFlag("enabled", output.predictive.enabled);
}

} // namespace powerscore::pipeline
