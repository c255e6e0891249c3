#include <f1qp/scoring.hpp>
#include <f1qp/logging.hpp>
#include <algorithm>
#include <cmath>

namespace f1qp {

std::string metric_category(const std::string& metric) {
  const auto dot = metric.find('.');
  return dot == std::string::npos ? metric : metric.substr(0, dot);
}

ScoringMethod make_scoring_method(ScoringKind kind, const ScoringConfig& cfg) {
  switch (kind) {
    case ScoringKind::SimpleWeighted:
      return SimpleWeighted{cfg.weights, cfg.simple_offset, cfg.simple_scale};
    case ScoringKind::ZScoreNormalized:
      return ZScoreNormalized{cfg.weights, cfg.zscore_center, cfg.zscore_spread, cfg.outlier_mad};
    case ScoringKind::PriorOnly:
      return PriorOnly{};
  }
  return PriorOnly{};
}

ScoringKind scoring_kind(const ScoringMethod& m) {
  if (std::holds_alternative<SimpleWeighted>(m))   return ScoringKind::SimpleWeighted;
  if (std::holds_alternative<ZScoreNormalized>(m)) return ScoringKind::ZScoreNormalized;
  return ScoringKind::PriorOnly;
}

static const std::map<std::string, double>* weights_of(const ScoringMethod& m) {
  if (const auto* s = std::get_if<SimpleWeighted>(&m))   return &s->weights;
  if (const auto* z = std::get_if<ZScoreNormalized>(&m)) return &z->weights;
  return nullptr;
}

std::vector<std::string> weighted_categories(const ScoringMethod& m) {
  std::vector<std::string> out;
  if (const auto* w = weights_of(m)) {
    for (const auto& [cat, _] : *w) out.push_back(cat);
  }
  return out;
}

ScoringMethod without_category(const ScoringMethod& m, const std::string& category) {
  ScoringMethod out = m;
  if (auto* s = std::get_if<SimpleWeighted>(&out))   s->weights[category] = 0.0;
  if (auto* z = std::get_if<ZScoreNormalized>(&out)) z->weights[category] = 0.0;
  return out;
}

static double category_weight(const std::map<std::string, double>& weights, const std::string& metric) {
  auto it = weights.find(metric_category(metric));
  return it == weights.end() ? 0.0 : it->second;
}

static double median_of(std::vector<double> v) {
  if (v.empty()) return 0.0;
  std::sort(v.begin(), v.end());
  const std::size_t n = v.size();
  return (n % 2 == 1) ? v[n / 2] : 0.5 * (v[n / 2 - 1] + v[n / 2]);
}

double median_abs_deviation(std::vector<double> values) {
  if (values.empty()) return 0.0;
  const double med = median_of(values);
  for (auto& x : values) x = std::abs(x - med);
  return median_of(std::move(values));
}

FieldStats field_stats(const std::vector<SessionMetrics>& session,
                       int min_clean_laps,
                       double outlier_mad) {
  std::map<std::string, std::vector<double>> columns;
  for (const auto& row : session) {
    if (row.clean_laps < min_clean_laps) continue;
    for (const auto& [name, value] : row.metrics) {
      if (std::isfinite(value)) columns[name].push_back(value);
    }
  }

  FieldStats out;
  for (auto& [name, values] : columns) {
    MetricStats st;
    // Zero MAD would reject every value off the median; leave such columns unfiltered.
    if (outlier_mad > 0.0) {
      const double mad = median_abs_deviation(values);
      if (mad > 0.0) {
        const double med = median_of(values);
        st.lower = med - outlier_mad * mad;
        st.upper = med + outlier_mad * mad;
        st.bounded = true;
        const auto before = values.size();
        values.erase(std::remove_if(values.begin(), values.end(), [&](double x){
          return x < st.lower || x > st.upper;
        }), values.end());
        if (values.size() != before) {
          F1QP_LOG_INFO("scoring: %zu outlier(s) in %s outside [%.3f, %.3f]",
                        before - values.size(), name.c_str(), st.lower, st.upper);
        }
      }
    }

    st.count = values.size();
    if (st.count > 0) {
      double sum = 0.0;
      for (double x : values) sum += x;
      st.mean = sum / static_cast<double>(st.count);
    }
    if (st.count > 1) {
      double ss = 0.0;
      for (double x : values) ss += (x - st.mean) * (x - st.mean);
      st.stddev = std::sqrt(ss / static_cast<double>(st.count - 1));
    }
    out.metrics.emplace(name, st);
  }
  return out;
}

static double zscore_of(const FieldStats& field, const std::string& name, double value) {
  auto it = field.metrics.find(name);
  if (it == field.metrics.end()) return 0.0;
  const auto& st = it->second;
  if (st.bounded && (value < st.lower || value > st.upper)) return 0.0;
  if (st.stddev <= 0.0) return 0.0;
  return (value - st.mean) / st.stddev;
}

std::optional<double> score(const ScoringMethod& method,
                            const SessionMetrics& row,
                            const FieldStats& field,
                            int min_clean_laps) {
  if (std::holds_alternative<PriorOnly>(method)) return std::nullopt;
  if (row.clean_laps < min_clean_laps) return std::nullopt;

  if (const auto* s = std::get_if<SimpleWeighted>(&method)) {
    double sum = 0.0;
    for (const auto& [name, value] : row.metrics) {
      if (!std::isfinite(value)) continue;
      sum += category_weight(s->weights, name) * value;
    }
    return s->offset + s->scale * sum;
  }

  const auto& z = std::get<ZScoreNormalized>(method);
  double sum = 0.0;
  for (const auto& [name, value] : row.metrics) {
    if (!std::isfinite(value)) continue;
    sum += category_weight(z.weights, name) * zscore_of(field, name, value);
  }
  return z.center + z.spread * sum;
}

std::vector<EvidenceObservation> score_session(const ScoringMethod& method,
                                               const std::vector<SessionMetrics>& session,
                                               int min_clean_laps,
                                               double evidence_variance) {
  std::vector<EvidenceObservation> out;
  if (std::holds_alternative<PriorOnly>(method)) return out;

  const double mad = std::holds_alternative<ZScoreNormalized>(method)
                       ? std::get<ZScoreNormalized>(method).outlier_mad : 0.0;
  const FieldStats field = field_stats(session, min_clean_laps, mad);

  out.reserve(session.size());
  for (const auto& row : session) {
    auto v = score(method, row, field, min_clean_laps);
    if (!v) {
      F1QP_LOG_DEBUG("scoring: %s in %s has %d clean laps, no observation",
                     row.competitor.c_str(), row.session.c_str(), row.clean_laps);
      continue;
    }
    out.push_back(EvidenceObservation{row.competitor, row.session, *v, evidence_variance});
  }
  return out;
}

} // namespace f1qp
