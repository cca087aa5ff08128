#include "csv_reader.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <fstream>
#include <initializer_list>
#include <map>
#include <optional>

#include "internal/util/errors.hpp"

namespace powerscore::ingest {

namespace {

std::string Trim(const std::string& s) {
  auto begin = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
  auto end   = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
  return begin < end ? std::string(begin, end) : std::string{};
}

class Header {
 public:
  explicit Header(const std::vector<std::string>& names) {
    for (std::size_t i = 0; i < names.size(); ++i) {
      index_[Trim(names[i])] = i;
    }
  }

  void Require(std::initializer_list<const char*> names) const {
    for (const auto* name : names) {
      if (!index_.count(name)) {
        throw util::InvalidArgument(std::string("csv missing column: ") + name);
      }
    }
  }

  std::string Text(const std::vector<std::string>& cells, const std::string& name) const {
    auto it = index_.find(name);
    if (it == index_.end() || it->second >= cells.size()) return {};
    return Trim(cells[it->second]);
  }

  std::optional<std::string> OptText(const std::vector<std::string>& cells, const std::string& name) const {
    auto text = Text(cells, name);
    if (text.empty()) return std::nullopt;
    return text;
  }

  std::optional<int> OptInt(const std::vector<std::string>& cells, const std::string& name) const {
    auto text = Text(cells, name);
    if (text.empty()) return std::nullopt;

    // Accept "14.0" as exported by spreadsheet tools.
    double value = 0.0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) return std::nullopt;
    return static_cast<int>(value);
  }

 private:
  std::map<std::string, std::size_t> index_;
};

bool NextRecord(std::istream& in, std::vector<std::string>& cells) {
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (Trim(line).empty()) continue;
    cells = SplitCsvLine(line);
    return true;
  }
  return false;
}

} // namespace

std::vector<std::string> SplitCsvLine(const std::string& line) {
  std::vector<std::string> out;
  std::string              cell;
  bool                     quoted = false;

  for (std::size_t i = 0; i < line.size(); ++i) {
    const char c = line[i];
    if (quoted) {
      if (c == '"' && i + 1 < line.size() && line[i + 1] == '"') {
        cell.push_back('"');
        ++i;
      } else if (c == '"') {
        quoted = false;
      } else {
        cell.push_back(c);
      }
    } else if (c == '"') {
      quoted = true;
    } else if (c == ',') {
      out.push_back(std::move(cell));
      cell.clear();
    } else {
      cell.push_back(c);
    }
  }
  out.push_back(std::move(cell));
  return out;
}

std::vector<db::model::GameRow> ReadGameRows(std::istream& in) {
  std::vector<std::string> cells;
  if (!NextRecord(in, cells)) return {};

  Header header(cells);
  header.Require({"game_id", "date", "team_id", "opponent_id", "age", "gender", "goals_for", "goals_against"});

  std::vector<db::model::GameRow> out;
  while (NextRecord(in, cells)) {
    db::model::GameRow row;
    row.game_id         = header.Text(cells, "game_id");
    row.date            = header.Text(cells, "date");
    row.team_id         = header.Text(cells, "team_id");
    row.opponent_id     = header.Text(cells, "opponent_id");
    row.age             = header.OptInt(cells, "age");
    row.gender          = header.OptText(cells, "gender");
    row.opponent_age    = header.OptInt(cells, "opponent_age");
    row.opponent_gender = header.OptText(cells, "opponent_gender");
    row.goals_for       = header.OptInt(cells, "goals_for");
    row.goals_against   = header.OptInt(cells, "goals_against");
    row.home_team_id    = header.OptText(cells, "home_team_id");
    row.provider        = header.Text(cells, "provider");

    // The date column is stored as plain YYYY-MM-DD.
    if (row.date.size() > 10) row.date.resize(10);
    out.push_back(std::move(row));
  }
  return out;
}

std::vector<db::model::TeamRecord> ReadTeamRecords(std::istream& in) {
  std::vector<std::string> cells;
  if (!NextRecord(in, cells)) return {};

  Header header(cells);
  header.Require({"team_id", "state_code"});

  std::vector<db::model::TeamRecord> out;
  while (NextRecord(in, cells)) {
    db::model::TeamRecord team;
    team.team_id    = header.Text(cells, "team_id");
    team.state_code = header.Text(cells, "state_code");
    std::transform(team.state_code.begin(), team.state_code.end(), team.state_code.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (!team.team_id.empty()) {
      out.push_back(std::move(team));
    }
  }
  return out;
}

std::vector<db::model::GameRow> ReadGameRowsFromFile(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw util::NotFound("cannot open games csv: " + path);
  }
  return ReadGameRows(in);
}

std::vector<db::model::TeamRecord> ReadTeamRecordsFromFile(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw util::NotFound("cannot open teams csv: " + path);
  }
  return ReadTeamRecords(in);
}

} // namespace powerscore::ingest
