#include <f1qp/dataset.hpp>
#include <f1qp/csv.hpp>
#include <f1qp/logging.hpp>
#include <algorithm>
#include <fstream>
#include <map>

namespace f1qp {

// Drops the header row when present.
static std::vector<std::vector<std::string>> body_rows(std::istream& in, const char* first_col) {
  auto rows = read_csv_rows(in);
  if (!rows.empty() && is_header_row(rows.front(), first_col)) rows.erase(rows.begin());
  return rows;
}

std::vector<StandingsRow> standings_from_csv_stream(std::istream& in) {
  std::vector<StandingsRow> out;
  for (const auto& cols : body_rows(in, "competitor")) {
    if (cols.size() < 2 || cols[0].empty()) {
      F1QP_LOG_WARN("standings: skipping short row");
      continue;
    }
    StandingsRow row;
    row.competitor = cols[0];
    row.team = cols[1];
    if (cols.size() > 2 && !cols[2].empty()) {
      auto rank = parse_int(cols[2]);
      if (!rank) { F1QP_LOG_WARN("standings: bad rank '%s' for %s", cols[2].c_str(), cols[0].c_str()); continue; }
      row.rank = *rank;
    }
    if (cols.size() > 3 && !cols[3].empty()) {
      auto pts = parse_double(cols[3]);
      if (!pts) { F1QP_LOG_WARN("standings: bad points '%s' for %s", cols[3].c_str(), cols[0].c_str()); continue; }
      row.points = *pts;
    }
    if (cols.size() > 4 && !cols[4].empty()) {
      auto seasons = parse_int(cols[4]);
      if (!seasons || *seasons < 0) { F1QP_LOG_WARN("standings: bad seasons for %s", cols[0].c_str()); continue; }
      row.seasons = *seasons;
    }
    out.push_back(std::move(row));
  }
  return out;
}

std::vector<TeamTier> team_tiers_from_csv_stream(std::istream& in) {
  std::vector<TeamTier> out;
  for (const auto& cols : body_rows(in, "team")) {
    if (cols.size() < 2 || cols[0].empty() || cols[1].empty()) {
      F1QP_LOG_WARN("tiers: skipping incomplete row");
      continue;
    }
    out.push_back(TeamTier{cols[0], lower(cols[1])});
  }
  return out;
}

std::vector<EntryRow> entries_from_csv_stream(std::istream& in) {
  std::vector<EntryRow> out;
  for (const auto& cols : body_rows(in, "competitor")) {
    if (cols.size() < 2 || cols[0].empty()) {
      F1QP_LOG_WARN("entries: skipping incomplete row");
      continue;
    }
    out.push_back(EntryRow{cols[0], cols[1]});
  }
  return out;
}

std::vector<EventData> events_from_csv_stream(std::istream& in) {
  std::vector<EventData> out;
  for (const auto& cols : body_rows(in, "event")) {
    if (cols.size() < 2 || cols[0].empty()) {
      F1QP_LOG_WARN("events: skipping incomplete row");
      continue;
    }
    auto round = parse_int(cols[1]);
    if (!round) {
      F1QP_LOG_WARN("events: bad round '%s' for %s", cols[1].c_str(), cols[0].c_str());
      continue;
    }
    EventData ev;
    ev.event = cols[0];
    ev.round = *round;
    out.push_back(std::move(ev));
  }
  return out;
}

std::vector<MetricsRecord> session_metrics_from_csv_stream(std::istream& in) {
  std::vector<MetricsRecord> out;
  auto rows = read_csv_rows(in);
  if (rows.empty()) return out;
  if (!is_header_row(rows.front(), "event") || rows.front().size() < 4) {
    F1QP_LOG_ERROR("metrics: header 'event,session,competitor,clean_laps,...' required");
    return out;
  }
  const std::vector<std::string> header = rows.front();

  for (std::size_t r = 1; r < rows.size(); ++r) {
    const auto& cols = rows[r];
    if (cols.size() < 4 || cols[0].empty() || cols[1].empty() || cols[2].empty()) {
      F1QP_LOG_WARN("metrics: skipping incomplete row %zu", r);
      continue;
    }
    auto laps = parse_int(cols[3]);
    if (!laps || *laps < 0) {
      F1QP_LOG_WARN("metrics: bad clean_laps '%s' on row %zu", cols[3].c_str(), r);
      continue;
    }

    MetricsRecord rec;
    rec.event = cols[0];
    rec.metrics.session = cols[1];
    rec.metrics.competitor = cols[2];
    rec.metrics.clean_laps = *laps;
    bool ok = true;
    for (std::size_t c = 4; c < cols.size() && c < header.size(); ++c) {
      if (cols[c].empty()) continue;
      auto v = parse_double(cols[c]);
      if (!v) { ok = false; break; }
      rec.metrics.metrics[header[c]] = *v;
    }
    if (!ok) {
      F1QP_LOG_WARN("metrics: non-numeric value on row %zu", r);
      continue;
    }
    out.push_back(std::move(rec));
  }
  return out;
}

std::vector<ResultRecord> results_from_csv_stream(std::istream& in) {
  std::vector<ResultRecord> out;
  for (const auto& cols : body_rows(in, "event")) {
    if (cols.size() < 3 || cols[0].empty() || cols[1].empty()) {
      F1QP_LOG_WARN("results: skipping incomplete row");
      continue;
    }
    auto pos = parse_int(cols[2]);
    if (!pos) {
      F1QP_LOG_WARN("results: bad position '%s' for %s", cols[2].c_str(), cols[1].c_str());
      continue;
    }
    out.push_back(ResultRecord{cols[0], cols[1], *pos});
  }
  return out;
}

Season assemble_season(std::vector<EntryRow> entries,
                       std::vector<StandingsRow> standings,
                       std::vector<TeamTier> tiers,
                       std::vector<EventData> events,
                       const std::vector<MetricsRecord>& metrics,
                       const std::vector<ResultRecord>& results) {
  std::map<std::string, std::size_t> index;
  for (std::size_t i = 0; i < events.size(); ++i) index.emplace(events[i].event, i);

  for (const auto& m : metrics) {
    auto it = index.find(m.event);
    if (it == index.end()) {
      F1QP_LOG_WARN("season: metrics for unknown event %s dropped", m.event.c_str());
      continue;
    }
    events[it->second].sessions.push_back(m.metrics);
  }
  for (const auto& r : results) {
    auto it = index.find(r.event);
    if (it == index.end()) {
      F1QP_LOG_WARN("season: result for unknown event %s dropped", r.event.c_str());
      continue;
    }
    auto& truth = events[it->second].results;
    if (!truth.emplace(r.competitor, r.position).second) {
      F1QP_LOG_WARN("season: repeated result for %s in %s ignored", r.competitor.c_str(), r.event.c_str());
    }
  }

  Season s;
  s.entries = std::move(entries);
  s.standings = std::move(standings);
  s.tiers = std::move(tiers);
  s.events = std::move(events);
  return s;
}

std::optional<Season> load_season(const std::string& dir) {
  const std::string base = dir.empty() || dir.back() == '/' ? dir : dir + "/";
  std::ifstream standings(base + "standings.csv");
  std::ifstream tiers(base + "tiers.csv");
  std::ifstream events(base + "events.csv");
  std::ifstream metrics(base + "metrics.csv");
  std::ifstream results(base + "results.csv");
  if (!standings || !tiers || !events || !metrics || !results) {
    F1QP_LOG_ERROR("season: missing input file under '%s'", dir.c_str());
    return std::nullopt;
  }

  std::vector<EntryRow> entry_rows;
  if (std::ifstream entries(base + "entries.csv"); entries) {
    entry_rows = entries_from_csv_stream(entries);
  }

  return assemble_season(std::move(entry_rows),
                         standings_from_csv_stream(standings),
                         team_tiers_from_csv_stream(tiers),
                         events_from_csv_stream(events),
                         session_metrics_from_csv_stream(metrics),
                         results_from_csv_stream(results));
}

} // namespace f1qp
