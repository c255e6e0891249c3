#pragma once
#include <optional>
#include <string>
#include <vector>
#include <f1qp/config.hpp>
#include <f1qp/types.hpp>

namespace f1qp {

// One row of the previous season's standings.
struct StandingsRow {
  CompetitorId competitor;
  std::string team;
  int rank = 0;                  // <= 0: unknown, fall back to points
  std::optional<double> points;  // used only when rank is unknown
  int seasons = 0;               // seasons of standings history behind this row
};

struct TeamTier {
  std::string team;
  std::string tier;              // "top", "midfield", "backmarker", ...
};

// Who actually takes part (competitor -> current team).
struct EntryRow {
  CompetitorId competitor;
  std::string team;
};

struct PriorTable {
  std::vector<CompetitorPrior> priors;
  std::vector<Issue> issues;     // MissingPriorInput, one per unresolved competitor

  const CompetitorPrior* find(const CompetitorId& id) const;
};

// Monotonic rank transform; rank 1 maps to the highest mean.
double rank_to_mean(int rank, const PriorConfig& cfg);

// Variance shrinks with standings history.
double history_to_variance(int seasons, const PriorConfig& cfg);

// Team-tier fallback with rookie inflation; nullopt if the team or its tier is unknown.
std::optional<CompetitorPrior> tier_prior(const CompetitorId& competitor,
                                          const std::string& team,
                                          const std::vector<TeamTier>& tiers,
                                          const PriorConfig& cfg);

// Builds one prior per entry (or per standings row when entries is empty).
// Pure: the result depends only on the arguments.
PriorTable build_priors(const std::vector<EntryRow>& entries,
                        const std::vector<StandingsRow>& standings,
                        const std::vector<TeamTier>& tiers,
                        const PriorConfig& cfg);

// Descending prior mean, ties to lower variance, then competitor id.
std::vector<CompetitorId> prior_ranking(const std::vector<CompetitorPrior>& priors);

} // namespace f1qp
