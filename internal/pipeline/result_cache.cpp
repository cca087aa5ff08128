#include "result_cache.hpp"

#include <google/protobuf/io/coded_stream.h>
#include <google/protobuf/io/zero_copy_stream_impl_lite.h>
#include <google/protobuf/message.h>

#include <algorithm>
#include <set>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/hash.hpp"
#include "internal/util/time.hpp"

namespace powerscore::pipeline {

namespace {

powerscore::v1::TeamStatus ToProto(model::TeamStatus status) {
  switch (status) {
    case model::TeamStatus::kActive:
      return powerscore::v1::TEAM_STATUS_ACTIVE;
    case model::TeamStatus::kInactive:
      return powerscore::v1::TEAM_STATUS_INACTIVE;
    case model::TeamStatus::kNotEnoughRankedGames:
      return powerscore::v1::TEAM_STATUS_NOT_ENOUGH_GAMES;
  }
  return powerscore::v1::TEAM_STATUS_UNSPECIFIED;
}

model::TeamStatus FromProto(powerscore::v1::TeamStatus status) {
  switch (status) {
    case powerscore::v1::TEAM_STATUS_INACTIVE:
      return model::TeamStatus::kInactive;
    case powerscore::v1::TEAM_STATUS_NOT_ENOUGH_GAMES:
      return model::TeamStatus::kNotEnoughRankedGames;
    default:
      return model::TeamStatus::kActive;
  }
}

void Fill(powerscore::v1::TeamStat& p, const model::TeamCohortStat& t) {
  p.set_team_id(t.team_id);
  p.set_age(t.age);
  p.set_gender(t.gender);
  p.set_off_raw(t.off_raw);
  p.set_sad_raw(t.sad_raw);
  p.set_def_raw(t.def_raw);
  p.set_off_shrunk(t.off_shrunk);
  p.set_sad_shrunk(t.sad_shrunk);
  p.set_def_shrunk(t.def_shrunk);
  p.set_off_norm(t.off_norm);
  p.set_def_norm(t.def_norm);
  p.set_games_played(t.games_played);
  p.set_games_last_180_days(t.games_last_180_days);
  p.set_last_game_days(util::ToEpochDays(t.last_game));
  p.set_power_presos(t.power_presos);
  p.set_anchor(t.anchor);
  p.set_abs_strength(t.abs_strength);
  p.set_sos_raw(t.sos_raw);
  p.set_sos(t.sos);
  p.set_sos_norm(t.sos_norm);
  if (t.sos_rank) p.set_sos_rank(*t.sos_rank);
  p.set_scf(t.scf);
  p.set_bridge_games(t.bridge_games);
  p.set_unique_opp_states(t.unique_opp_states);
  p.set_unique_opp_regions(t.unique_opp_regions);
  p.set_is_isolated(t.is_isolated);
  p.set_component_id(t.component_id);
  p.set_component_size(t.component_size);
  p.set_low_sample(t.sample_flag == model::SampleFlag::kLowSample);
  p.set_status(ToProto(t.status));
  p.set_perf_raw(t.perf_raw);
  p.set_perf_centered(t.perf_centered);
  p.set_powerscore_core(t.powerscore_core);
  p.set_provisional_mult(t.provisional_mult);
  p.set_powerscore_adj(t.powerscore_adj);
  p.set_power_score_final(t.power_score_final);
  if (t.rank_in_cohort) p.set_rank_in_cohort(*t.rank_in_cohort);
}

model::TeamCohortStat Read(const powerscore::v1::TeamStat& p) {
  model::TeamCohortStat t;
  t.team_id             = p.team_id();
  t.age                 = p.age();
  t.gender              = p.gender();
  t.off_raw             = p.off_raw();
  t.sad_raw             = p.sad_raw();
  t.def_raw             = p.def_raw();
  t.off_shrunk          = p.off_shrunk();
  t.sad_shrunk          = p.sad_shrunk();
  t.def_shrunk          = p.def_shrunk();
  t.off_norm            = p.off_norm();
  t.def_norm            = p.def_norm();
  t.games_played        = p.games_played();
  t.games_last_180_days = p.games_last_180_days();
  t.last_game           = util::FromEpochDays(p.last_game_days());
  t.power_presos        = p.power_presos();
  t.anchor              = p.anchor();
  t.abs_strength        = p.abs_strength();
  t.sos_raw             = p.sos_raw();
  t.sos                 = p.sos();
  t.sos_norm            = p.sos_norm();
  if (p.has_sos_rank()) t.sos_rank = p.sos_rank();
  t.scf                = p.scf();
  t.bridge_games       = p.bridge_games();
  t.unique_opp_states  = p.unique_opp_states();
  t.unique_opp_regions = p.unique_opp_regions();
  t.is_isolated        = p.is_isolated();
  t.component_id       = p.component_id();
  t.component_size     = p.component_size();
  t.sample_flag        = p.low_sample() ? model::SampleFlag::kLowSample : model::SampleFlag::kOk;
  t.status             = FromProto(p.status());
  t.perf_raw           = p.perf_raw();
  t.perf_centered      = p.perf_centered();
  t.powerscore_core    = p.powerscore_core();
  t.provisional_mult   = p.provisional_mult();
  t.powerscore_adj     = p.powerscore_adj();
  t.power_score_final  = p.power_score_final();
  if (p.has_rank_in_cohort()) t.rank_in_cohort = p.rank_in_cohort();
  return t;
}

void Fill(powerscore::v1::GameFeature& p, const rating::PreparedGame& g) {
  p.set_game_id(g.game.game_id);
  p.set_date_days(util::ToEpochDays(g.game.date));
  p.set_team_id(g.game.team_id);
  p.set_opponent_id(g.game.opponent_id);
  p.set_age(g.game.age);
  p.set_gender(g.game.gender);
  p.set_opponent_age(g.game.opponent_age);
  p.set_opponent_gender(g.game.opponent_gender);
  p.set_goals_for(g.goals_for);
  p.set_goals_against(g.goals_against);
  p.set_goal_diff(g.goal_diff);
  p.set_margin(g.Margin());
  p.set_rank_recency(g.rank_recency);
  p.set_weight(g.weight);
  p.set_is_home(g.game.is_home);
}

rating::PreparedGame Read(const powerscore::v1::GameFeature& p) {
  rating::PreparedGame g;
  g.game.game_id         = p.game_id();
  g.game.date            = util::FromEpochDays(p.date_days());
  g.game.team_id         = p.team_id();
  g.game.opponent_id     = p.opponent_id();
  g.game.age             = p.age();
  g.game.gender          = p.gender();
  g.game.opponent_age    = p.opponent_age();
  g.game.opponent_gender = p.opponent_gender();
  g.game.is_home         = p.is_home();

  // Only the margin survives from the raw score.
  g.game.goals_for     = p.margin();
  g.game.goals_against = 0;

  g.goals_for     = p.goals_for();
  g.goals_against = p.goals_against();
  g.goal_diff     = p.goal_diff();
  g.rank_recency  = p.rank_recency();
  g.weight        = p.weight();
  return g;
}

} // namespace

ResultCache::ResultCache(db::Repository& repo, bool enabled) : repo_(repo), enabled_(enabled) {
}

std::string ResultCache::ComputeKey(const std::vector<model::GameRecord>& window_games, const rating::TeamDirectory& directory,
                                    int window_days, const std::string& provider_filter, util::Date today,
                                    const std::string& rating_config_bytes) {
  std::set<std::string> ids;
  for (const auto& g : window_games) {
    ids.insert(g.game_id);
  }

  util::Fnv1a hash;
  hash.Update(static_cast<std::int64_t>(ids.size()));
  for (const auto& id : ids) {
    hash.Update(id);
  }
  hash.Update(static_cast<std::int64_t>(directory.size()));
  for (const auto& [team_id, state_code] : directory) {
    hash.Update(team_id);
    hash.Update(state_code);
  }
  hash.Update(static_cast<std::int64_t>(window_days));
  hash.Update(provider_filter);
  hash.Update(util::FormatDate(today));
  hash.Update(rating_config_bytes);
  return hash.HexDigest();
}

std::string ResultCache::DeterministicBytes(const google::protobuf::Message& message) {
  std::string out;
  {
    google::protobuf::io::StringOutputStream raw(&out);
    google::protobuf::io::CodedOutputStream  coded(&raw);
    coded.SetSerializationDeterministic(true);
    message.SerializeToCodedStream(&coded);
  }
  return out;
}

powerscore::v1::RatingTable ResultCache::ToProto(const std::string& key, const EngineOutput& output) {
  powerscore::v1::RatingTable table;
  table.set_cache_key(key);
  table.set_cohort_count(static_cast<std::uint32_t>(output.cohort_count));
  for (const auto& t : output.teams) {
    Fill(*table.add_teams(), t);
  }
  for (const auto& g : output.games) {
    Fill(*table.add_games(), g);
  }
  return table;
}

EngineOutput ResultCache::FromProto(const powerscore::v1::RatingTable& table) {
  EngineOutput out;
  out.cohort_count = table.cohort_count();
  out.teams.reserve(static_cast<std::size_t>(table.teams_size()));
  for (const auto& t : table.teams()) {
    out.teams.push_back(Read(t));
  }
  out.games.reserve(static_cast<std::size_t>(table.games_size()));
  for (const auto& g : table.games()) {
    out.games.push_back(Read(g));
  }
  return out;
}

std::optional<EngineOutput> ResultCache::Lookup(const std::string& key) {
  if (!enabled_) return std::nullopt;

  auto tx    = repo_.Begin();
  auto entry = repo_.GetCacheEntry(*tx, key);
  tx->Commit();

  if (!entry) {
    observability::Metrics::Instance().RecordCacheLookup(false);
    POWERSCORE_LOG_INFO("rating cache miss", {observability::StringField("key", key)});
    return std::nullopt;
  }

  powerscore::v1::RatingTable table;
  if (!table.ParseFromString(entry->payload) || table.cache_key() != key) {
    observability::Metrics::Instance().RecordCacheLookup(false);
    POWERSCORE_LOG_WARN("rating cache entry unreadable, recomputing", {observability::StringField("key", key)});
    return std::nullopt;
  }

  observability::Metrics::Instance().RecordCacheLookup(true);
  POWERSCORE_LOG_INFO("rating cache hit", {observability::StringField("key", key),
                                          observability::IntField("teams", table.teams_size())});
  return FromProto(table);
}

db::Result ResultCache::Store(const std::string& key, const EngineOutput& output) {
  if (!enabled_) return db::Result::Ok();

  db::model::CacheRecord record;
  record.cache_key     = key;
  record.created_at_ms = util::ToUnixMillis(util::Now());
  if (!ToProto(key, output).SerializeToString(&record.payload)) {
    return db::Result::Err(db::ErrorCode::InternalError, "rating table serialization failed");
  }

  auto tx     = repo_.Begin();
  auto result = tx->Finish(repo_.PutCacheEntry(*tx, record));
  if (!result) {
    POWERSCORE_LOG_WARN("rating cache store failed", {observability::StringField("error", result.Describe())});
  }
  return result;
}

} // namespace powerscore::pipeline
