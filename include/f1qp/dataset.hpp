#pragma once
#include <istream>
#include <optional>
#include <string>
#include <vector>
#include <f1qp/prior.hpp>
#include <f1qp/scoring.hpp>
#include <f1qp/validation.hpp>

namespace f1qp {

// Stream-based CSV loaders (test-friendly; no filesystem required).
// Each accepts an optional header row, ignores '#' comments and blank lines,
// trims fields, and skips (logging) rows that do not parse.

// competitor,team,rank,points,seasons   (rank/points may be empty; seasons defaults to 0)
std::vector<StandingsRow> standings_from_csv_stream(std::istream& in);

// team,tier
std::vector<TeamTier> team_tiers_from_csv_stream(std::istream& in);

// competitor,team
std::vector<EntryRow> entries_from_csv_stream(std::istream& in);

// event,round   (sessions and results are attached by assemble_season)
std::vector<EventData> events_from_csv_stream(std::istream& in);

struct MetricsRecord {
  std::string event;
  SessionMetrics metrics;
};

// Header required: event,session,competitor,clean_laps,<metric>...
// Empty metric cells are treated as absent.
std::vector<MetricsRecord> session_metrics_from_csv_stream(std::istream& in);

struct ResultRecord {
  std::string event;
  CompetitorId competitor;
  int position = 0;
};

// event,competitor,position
std::vector<ResultRecord> results_from_csv_stream(std::istream& in);

// Attaches metrics and results to their events; records for unknown events are
// dropped with a warning. A repeated (event, competitor) result keeps the first.
Season assemble_season(std::vector<EntryRow> entries,
                       std::vector<StandingsRow> standings,
                       std::vector<TeamTier> tiers,
                       std::vector<EventData> events,
                       const std::vector<MetricsRecord>& metrics,
                       const std::vector<ResultRecord>& results);

// Reads standings.csv, tiers.csv, events.csv, metrics.csv, results.csv and the
// optional entries.csv from dir; nullopt if a required file cannot be opened.
std::optional<Season> load_season(const std::string& dir);

} // namespace f1qp
