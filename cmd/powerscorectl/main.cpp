#include <cstdint>
#include <exception>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/factory.hpp"
#include "internal/ingest/csv_reader.hpp"
#include "internal/observability/logging.hpp"
#include "internal/pipeline/batch_writer.hpp"
#include "internal/util/date.hpp"

using namespace powerscore;

static void Usage() {
  std::cout << "Usage:\n"
            << "  powerscorectl <config.yaml> import-games <csv>\n"
            << "  powerscorectl <config.yaml> import-teams <csv>\n"
            << "  powerscorectl <config.yaml> rankings <age> <gender>\n"
            << "  powerscorectl <config.yaml> history <team_id>\n"
            << "  powerscorectl <config.yaml> prune <YYYY-MM-DD>\n";
}

static std::string RankText(const std::optional<int>& rank) {
  return rank ? std::to_string(*rank) : "-";
}

static int ReportWrite(const pipeline::BatchWriteSummary& summary) {
  std::cout << summary.table << ": " << summary.rows_written << " rows written, " << summary.rows_failed << " failed\n";
  for (const auto& error : summary.errors) {
    std::cerr << "  " << error << "\n";
  }
  return summary.Ok() ? 0 : 2;
}

static int ImportGames(db::Repository& repo, const pipeline::WriterSettings& writer_settings, const std::string& path) {
  const auto rows = ingest::ReadGameRowsFromFile(path);

  pipeline::BatchWriter writer(repo, writer_settings);
  auto summary = writer.Write<db::model::GameRow>(
      "games", rows, [](db::Repository& r, db::Transaction& tx, const db::model::GameRow& row) { return r.UpsertGame(tx, row); });
  return ReportWrite(summary);
}

static int ImportTeams(db::Repository& repo, const pipeline::WriterSettings& writer_settings, const std::string& path) {
  const auto rows = ingest::ReadTeamRecordsFromFile(path);

  pipeline::BatchWriter writer(repo, writer_settings);
  auto summary = writer.Write<db::model::TeamRecord>(
      "teams", rows, [](db::Repository& r, db::Transaction& tx, const db::model::TeamRecord& row) { return r.UpsertTeam(tx, row); });
  return ReportWrite(summary);
}

static int ShowRankings(db::Repository& repo, int age, const std::string& gender) {
  auto tx   = repo.Begin();
  auto rows = repo.ListRankings(*tx, age, gender);
  tx->Commit();

  std::cout << "rank  ml_rank  team_id  status  games  power_score_final  powerscore_ml  sos  d7  d30\n";
  for (const auto& row : rows) {
    std::cout << RankText(row.rank_in_cohort) << "  " << RankText(row.rank_in_cohort_ml) << "  " << row.team_id << "  "
              << row.status << "  " << row.games_played << "  " << std::fixed << std::setprecision(4)
              << row.power_score_final << "  " << row.powerscore_ml << "  " << row.sos << "  "
              << RankText(row.rank_change_7d) << "  " << RankText(row.rank_change_30d) << "\n";
  }
  std::cout << rows.size() << " teams in U" << age << " " << gender << "\n";
  return 0;
}

static int ShowHistory(db::Repository& repo, const std::string& team_id) {
  auto tx        = repo.Begin();
  auto snapshots = repo.ListSnapshotsForTeam(*tx, team_id);
  tx->Commit();

  if (snapshots.empty()) {
    std::cerr << "no snapshots for team " << team_id << "\n";
    return 2;
  }
  for (const auto& s : snapshots) {
    std::cout << s.snapshot_date << "  U" << s.age << " " << s.gender << "  rank=" << RankText(s.rank_in_cohort)
              << "  ml_rank=" << RankText(s.rank_in_cohort_ml) << "  power=" << std::fixed << std::setprecision(4)
              << s.power_score_final << "\n";
  }
  return 0;
}

static int Prune(db::Repository& repo, util::Date cutoff) {
  auto          tx      = repo.Begin();
  std::uint64_t deleted = 0;
  auto          result  = tx->Finish(repo.DeleteSnapshotsBefore(*tx, util::FormatDate(cutoff), deleted));
  if (!result) {
    std::cerr << "prune failed: " << result.Describe() << "\n";
    return 2;
  }
  std::cout << "deleted " << deleted << " snapshots before " << util::FormatDate(cutoff) << "\n";
  return 0;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  const std::string              config_path = argv[1];
  const std::string              cmd         = argv[2];
  const std::vector<std::string> rest(argv + 3, argv + argc);

  const bool known = (cmd == "import-games" && rest.size() == 1) || (cmd == "import-teams" && rest.size() == 1) ||
                     (cmd == "rankings" && rest.size() == 2) || (cmd == "history" && rest.size() == 1) ||
                     (cmd == "prune" && rest.size() == 1);
  if (!known) {
    Usage();
    return 1;
  }

  int age = 0;
  if (cmd == "rankings") {
    try {
      age = std::stoi(rest[0]);
    } catch (const std::exception&) {
      std::cerr << "invalid age: " << rest[0] << "\n";
      return 1;
    }
  }

  std::optional<util::Date> cutoff;
  if (cmd == "prune") {
    cutoff = util::ParseDate(rest[0]);
    if (!cutoff) {
      std::cerr << "invalid date: " << rest[0] << "\n";
      return 1;
    }
  }

  try {
    auto config = config::ConfigLoader::LoadFromYaml(config_path);
    observability::InitializeLogging(config);

    auto app = factory::Build(config);

    int rc = 0;
    if (cmd == "import-games") {
      rc = ImportGames(*app.repository, app.settings.writer, rest[0]);
    } else if (cmd == "import-teams") {
      rc = ImportTeams(*app.repository, app.settings.writer, rest[0]);
    } else if (cmd == "rankings") {
      rc = ShowRankings(*app.repository, age, rest[1]);
    } else if (cmd == "history") {
      rc = ShowHistory(*app.repository, rest[0]);
    } else {
      rc = Prune(*app.repository, *cutoff);
    }

    observability::ShutdownLogging();
    return rc;
  } catch (const std::exception& e) {
    std::cerr << cmd << " failed: " << e.what() << "\n";
    observability::ShutdownLogging();
    return 2;
  }
}
