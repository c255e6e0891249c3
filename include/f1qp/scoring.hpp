#pragma once
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <f1qp/config.hpp>
#include <f1qp/types.hpp>

namespace f1qp {

// Aggregate metrics for one competitor in one session (Feature Extractor output).
struct SessionMetrics {
  CompetitorId competitor;
  std::string session;                   // identifier as provided, e.g. "FP2"
  int clean_laps = 0;
  std::map<std::string, double> metrics; // "corner_slow.min_speed" -> 92.4
};

// "corner_slow.min_speed" -> "corner_slow"; names without a dot are their own category.
std::string metric_category(const std::string& metric);

// Weighted sum of raw values, mapped onto the pace scale by offset + scale * sum.
struct SimpleWeighted {
  std::map<std::string, double> weights;
  double offset = 0.0;
  double scale = 1.0;
};

// Weighted sum of per-session z-scores, mapped by center + spread * sum.
struct ZScoreNormalized {
  std::map<std::string, double> weights;
  double center = 10.5;
  double spread = 4.0;
  double outlier_mad = 0.0;
};

// Never produces an observation.
struct PriorOnly {};

using ScoringMethod = std::variant<SimpleWeighted, ZScoreNormalized, PriorOnly>;

ScoringMethod make_scoring_method(ScoringKind kind, const ScoringConfig& cfg);
ScoringKind scoring_kind(const ScoringMethod& m);

// Categories carrying a weight entry, sorted. Empty for PriorOnly.
std::vector<std::string> weighted_categories(const ScoringMethod& m);

// Copy of m with the category's weight set to zero.
ScoringMethod without_category(const ScoringMethod& m, const std::string& category);

struct MetricStats {
  double mean = 0.0;
  double stddev = 0.0;     // sample standard deviation (n - 1)
  std::size_t count = 0;
  double lower = 0.0;      // accepted range; values outside are outliers
  double upper = 0.0;
  bool bounded = false;    // false when no outlier filter applies
};

// Distribution of each metric over the usable rows of one session.
struct FieldStats {
  std::map<std::string, MetricStats> metrics;
};

// Median absolute deviation (unscaled). 0 for an empty input.
double median_abs_deviation(std::vector<double> values);

// Statistics over rows with clean_laps >= min_clean_laps. With outlier_mad > 0,
// values beyond median +/- outlier_mad * MAD are left out of mean/stddev.
FieldStats field_stats(const std::vector<SessionMetrics>& session,
                       int min_clean_laps,
                       double outlier_mad);

// Scalar evidence on the pace scale, or nullopt ("no observation") when the
// row has too few clean laps or the method is PriorOnly. Does not modify row.
std::optional<double> score(const ScoringMethod& method,
                            const SessionMetrics& row,
                            const FieldStats& field,
                            int min_clean_laps);

// Scores every row of one session. Rows without an observation are omitted.
std::vector<EvidenceObservation> score_session(const ScoringMethod& method,
                                               const std::vector<SessionMetrics>& session,
                                               int min_clean_laps,
                                               double evidence_variance);

} // namespace f1qp
