#pragma once
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <f1qp/belief.hpp>
#include <f1qp/config.hpp>
#include <f1qp/prior.hpp>
#include <f1qp/scoring.hpp>
#include <f1qp/stats.hpp>
#include <f1qp/weekend.hpp>

namespace f1qp {

struct EventData {
  std::string event;
  int round = 0;                          // chronological order within the season
  std::vector<SessionMetrics> sessions;   // rows of every session of the weekend
  std::map<CompetitorId, int> results;    // qualifying position, unique per event
};

struct Season {
  std::vector<EntryRow> entries;
  std::vector<StandingsRow> standings;
  std::vector<TeamTier> tiers;
  std::vector<EventData> events;
};

// Distinct session identifiers in order of first appearance.
std::vector<std::string> session_ids(const EventData& ev);

struct EventPrediction {
  std::string event;
  WeekendFormat format = WeekendFormat::Standard;
  std::vector<CompetitorId> ranking;
  std::vector<Belief> beliefs;
  std::vector<UpdateRecord> history;
  std::vector<Issue> issues;              // MissingPriorInput, DegenerateVariance
};

// Full pipeline for one event: classify, score, fold, rank. Competitors are
// those of `priors` that appear in the event (all of them if none appear).
EventPrediction predict_event(const EventData& ev,
                              const std::vector<CompetitorPrior>& priors,
                              const ScoringMethod& method,
                              const ModelConfig& cfg,
                              unsigned threads = 1);

// Description of the first structural problem (duplicate or non-positive
// position), or nullopt when the ground truth is usable.
std::optional<std::string> ground_truth_problem(const std::map<CompetitorId, int>& truth);

// Mean absolute position error over the competitors present in both inputs,
// each side re-ranked 1..n among them. nullopt if there is no overlap.
std::optional<double> ranking_mae(const std::vector<CompetitorId>& predicted,
                                  const std::map<CompetitorId, int>& truth);

// One evaluated event and the events strictly earlier than it.
struct TemporalFold {
  std::size_t test = 0;                   // index into the season's events
  std::vector<std::size_t> train;         // rounds strictly below test's round
};

// One fold per event, in chronological order.
std::vector<TemporalFold> temporal_folds(const std::vector<EventData>& events);

// Picks the global trust multiplier from cfg.trust_scale_grid minimizing mean MAE
// over the training events (ties to the smaller value). Returns cfg.trust_scale
// when nothing can be fitted.
double fit_trust_scale(const std::vector<const EventData*>& train,
                       const std::vector<CompetitorPrior>& priors,
                       const ScoringMethod& method,
                       const ModelConfig& cfg);

struct EventError {
  std::string event;
  int round = 0;
  WeekendFormat format = WeekendFormat::Standard;
  double mae = 0.0;
  double trust_scale = 1.0;               // multiplier used for this event
};

struct ValidationResult {
  std::string method;
  std::optional<std::string> ablation;    // category left out, if any
  std::vector<EventError> events;         // chronological
  double mae = 0.0;                       // mean over events
  std::vector<Issue> issues;

  std::vector<double> errors() const;
};

// Walk-forward evaluation: every event is predicted with parameters fitted on
// strictly earlier events only. Events without enough history or with broken
// ground truth are reported in issues and left out; the run continues.
ValidationResult run_validation(const Season& season,
                                const ScoringMethod& method,
                                const ModelConfig& cfg,
                                std::optional<std::string> ablation = std::nullopt);

// Same, with the method built from cfg.scoring_method and cfg.scoring.
ValidationResult run_validation(const Season& season, const ModelConfig& cfg);

struct MethodComparison {
  ValidationResult baseline;              // prior_only
  ValidationResult candidate;
  std::optional<PairedTest> test;         // on baseline - candidate per event
  double mae_improvement = 0.0;           // baseline.mae - candidate.mae
};

MethodComparison compare_methods(const Season& season,
                                 const ScoringMethod& candidate,
                                 const ModelConfig& cfg);

// Candidate built from cfg.scoring_method and cfg.scoring.
MethodComparison compare_methods(const Season& season, const ModelConfig& cfg);

struct AblationResult {
  std::string category;
  ValidationResult result;
  double mae_delta = 0.0;                 // ablated MAE - full MAE
};

// One run per weighted category with that category's weight zeroed.
std::vector<AblationResult> run_ablation(const Season& season,
                                         const ScoringMethod& method,
                                         const ModelConfig& cfg);

struct FormatSummary {
  WeekendFormat format = WeekendFormat::Standard;
  std::size_t events = 0;
  double mae = 0.0;
};

// Standard first, then sprint; formats without events report mae 0.
std::vector<FormatSummary> mae_by_format(const ValidationResult& result);

} // namespace f1qp
