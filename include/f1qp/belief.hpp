#pragma once
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <f1qp/types.hpp>
#include <f1qp/weekend.hpp>

namespace f1qp {

struct Posterior {
  double mean = 0.0;
  double variance = 1.0;
  bool variance_clamped = false; // a variance had to be raised to the floor
};

// Gaussian conjugate fusion of N(mean, variance) with evidence e ~ N(., evidence_variance)
// whose precision is scaled by trust (clamped to [0,1]):
//   p_e  = trust / evidence_variance
//   P1   = 1 / variance + p_e
//   mu1  = (mean / variance + e * p_e) / P1
//   var1 = 1 / P1
// trust == 0 (or a non-finite evidence value) returns the input unchanged.
// Variances at or below variance_floor are replaced by the floor.
Posterior fuse(double mean, double variance,
               double evidence, double evidence_variance,
               double trust, double variance_floor);

Belief seed_belief(const CompetitorPrior& prior);

// One session step; session_index always advances by one.
Belief update_belief(const Belief& b, const EvidenceObservation& e,
                     double trust, double variance_floor);

// nullopt means "no observation": the belief passes through with its variance floored.
Belief update_belief(const Belief& b, const std::optional<EvidenceObservation>& e,
                     double trust, double variance_floor);

struct WeightedEvidence {
  double value = 0.0;
  double variance = 1.0;
  double trust = 0.0;
};

// Single update with the combined precision sum(trust_i / variance_i).
// Equal (up to rounding) to applying the same evidence one step at a time.
Belief joint_update(const Belief& b, const std::vector<WeightedEvidence>& evidence,
                    double variance_floor);

// Audit entry for one applied (or passed-through) session step.
struct UpdateRecord {
  CompetitorId competitor;
  std::string session;
  double prior_mean = 0.0;
  double prior_variance = 0.0;
  std::optional<double> evidence;
  double evidence_variance = 0.0;
  double trust = 0.0;
  double posterior_mean = 0.0;
  double posterior_variance = 0.0;
  bool variance_clamped = false;
};

// session id -> competitor -> observation, for one event.
using SessionEvidence = std::map<std::string, std::map<CompetitorId, EvidenceObservation>>;

// Folds one competitor's prior through the plan, in order. Appends to history when given.
Belief run_chain(const CompetitorPrior& prior,
                 const WeekendPlan& plan,
                 const SessionEvidence& evidence,
                 double variance_floor,
                 std::vector<UpdateRecord>* history = nullptr);

struct WeekendResult {
  std::vector<Belief> beliefs;        // same order as the priors
  std::vector<UpdateRecord> history;  // grouped per competitor, in session order
  std::vector<Issue> issues;          // DegenerateVariance
};

// run_chain for every competitor; competitors are independent and run in parallel.
WeekendResult run_weekend(const std::vector<CompetitorPrior>& priors,
                          const WeekendPlan& plan,
                          const SessionEvidence& evidence,
                          double variance_floor,
                          unsigned threads = 1);

// Descending mean; ties go to the lower variance, then to the competitor id.
std::vector<CompetitorId> rank_by_belief(const std::vector<Belief>& beliefs);

struct PositionPrediction {
  CompetitorId competitor;
  int predicted_rank = 0;
  double mean = 0.0;
  double variance = 0.0;
  double position_estimate = 0.0; // (n + 1) - mean
  double ci_lower = 0.0;          // 95% interval, clamped to [1, n]
  double ci_upper = 0.0;
  std::size_t observations = 0;
};

// Predictions sorted by predicted_rank.
std::vector<PositionPrediction> predict_positions(const std::vector<Belief>& beliefs);

} // namespace f1qp
