#include <f1qp/belief.hpp>
#include <f1qp/logging.hpp>
#include <f1qp/parallel.hpp>
#include <algorithm>
#include <cmath>

namespace f1qp {

static inline double clamp01(double x) {
  return x < 0.0 ? 0.0 : (x > 1.0 ? 1.0 : x);
}

static double floor_variance(double v, double floor, bool& clamped) {
  if (!std::isfinite(v) || v <= floor) {
    if (!(std::isfinite(v) && v == floor)) clamped = true;
    return floor;
  }
  return v;
}

Posterior fuse(double mean, double variance,
               double evidence, double evidence_variance,
               double trust, double variance_floor) {
  Posterior out;
  const double prior_var = floor_variance(variance, variance_floor, out.variance_clamped);
  const double lambda = clamp01(trust);
  if (lambda == 0.0 || !std::isfinite(evidence)) {
    out.mean = mean;
    out.variance = prior_var;
    return out;
  }

  const double ev_var = floor_variance(evidence_variance, variance_floor, out.variance_clamped);
  const double p_e = lambda / ev_var;
  const double p1 = 1.0 / prior_var + p_e;
  out.mean = (mean / prior_var + evidence * p_e) / p1;
  out.variance = floor_variance(1.0 / p1, variance_floor, out.variance_clamped);
  return out;
}

Belief seed_belief(const CompetitorPrior& prior) {
  Belief b;
  b.competitor = prior.competitor;
  b.mean = prior.mean;
  b.variance = prior.variance;
  return b;
}

Belief update_belief(const Belief& b, const EvidenceObservation& e,
                     double trust, double variance_floor) {
  const Posterior p = fuse(b.mean, b.variance, e.value, e.variance, trust, variance_floor);
  if (p.variance_clamped) {
    F1QP_LOG_WARN("belief: variance for %s clamped to floor %g in %s",
                  b.competitor.c_str(), variance_floor, e.session.c_str());
  }
  Belief out = b;
  out.mean = p.mean;
  out.variance = p.variance;
  out.session_index = b.session_index + 1;
  if (clamp01(trust) > 0.0 && std::isfinite(e.value)) ++out.observations;
  return out;
}

Belief update_belief(const Belief& b, const std::optional<EvidenceObservation>& e,
                     double trust, double variance_floor) {
  if (e.has_value()) return update_belief(b, *e, trust, variance_floor);
  const Posterior p = fuse(b.mean, b.variance, 0.0, 1.0, 0.0, variance_floor);
  if (p.variance_clamped) {
    F1QP_LOG_WARN("belief: variance for %s clamped to floor %g with no observation",
                  b.competitor.c_str(), variance_floor);
  }
  Belief out = b;
  out.variance = p.variance;
  out.session_index = b.session_index + 1;
  return out;
}

Belief joint_update(const Belief& b, const std::vector<WeightedEvidence>& evidence,
                    double variance_floor) {
  bool clamped = false;
  const double prior_var = floor_variance(b.variance, variance_floor, clamped);
  double precision = 1.0 / prior_var;
  double weighted = b.mean / prior_var;
  std::size_t used = 0;
  for (const auto& e : evidence) {
    const double lambda = clamp01(e.trust);
    if (lambda == 0.0 || !std::isfinite(e.value)) continue;
    const double p_e = lambda / floor_variance(e.variance, variance_floor, clamped);
    precision += p_e;
    weighted += e.value * p_e;
    ++used;
  }

  Belief out = b;
  out.mean = weighted / precision;
  out.variance = floor_variance(1.0 / precision, variance_floor, clamped);
  out.session_index = b.session_index + evidence.size();
  out.observations = b.observations + used;
  if (clamped) {
    F1QP_LOG_WARN("belief: variance for %s clamped to floor %g in joint update",
                  b.competitor.c_str(), variance_floor);
  }
  return out;
}

Belief run_chain(const CompetitorPrior& prior,
                 const WeekendPlan& plan,
                 const SessionEvidence& evidence,
                 double variance_floor,
                 std::vector<UpdateRecord>* history) {
  Belief b = seed_belief(prior);
  for (const auto& step : plan.sequence) {
    std::optional<EvidenceObservation> obs;
    if (auto s = evidence.find(step.session); s != evidence.end()) {
      if (auto c = s->second.find(prior.competitor); c != s->second.end()) obs = c->second;
    }

    const Belief next = update_belief(b, obs, step.trust, variance_floor);
    if (history) {
      UpdateRecord r;
      r.competitor = prior.competitor;
      r.session = step.session;
      r.prior_mean = b.mean;
      r.prior_variance = b.variance;
      if (obs) {
        r.evidence = obs->value;
        r.evidence_variance = obs->variance;
        r.variance_clamped = fuse(b.mean, b.variance, obs->value, obs->variance,
                                  step.trust, variance_floor).variance_clamped;
      } else {
        r.variance_clamped = fuse(b.mean, b.variance, 0.0, 1.0, 0.0, variance_floor).variance_clamped;
      }
      r.trust = step.trust;
      r.posterior_mean = next.mean;
      r.posterior_variance = next.variance;
      history->push_back(std::move(r));
    }
    b = next;
  }
  return b;
}

WeekendResult run_weekend(const std::vector<CompetitorPrior>& priors,
                          const WeekendPlan& plan,
                          const SessionEvidence& evidence,
                          double variance_floor,
                          unsigned threads) {
  std::vector<Belief> beliefs(priors.size());
  std::vector<std::vector<UpdateRecord>> histories(priors.size());

  parallel_for(priors.size(), threads, [&](std::size_t i){
    beliefs[i] = run_chain(priors[i], plan, evidence, variance_floor, &histories[i]);
  });

  WeekendResult out;
  out.beliefs = std::move(beliefs);
  for (auto& h : histories) {
    for (auto& r : h) {
      if (r.variance_clamped) {
        out.issues.push_back(Issue{IssueKind::DegenerateVariance, r.competitor,
                                   "variance clamped in " + r.session});
      }
      out.history.push_back(std::move(r));
    }
  }
  return out;
}

std::vector<CompetitorId> rank_by_belief(const std::vector<Belief>& beliefs) {
  std::vector<const Belief*> order;
  order.reserve(beliefs.size());
  for (const auto& b : beliefs) order.push_back(&b);
  std::sort(order.begin(), order.end(), [](const Belief* a, const Belief* b){
    if (a->mean != b->mean) return a->mean > b->mean;
    if (a->variance != b->variance) return a->variance < b->variance;
    return a->competitor < b->competitor;
  });

  std::vector<CompetitorId> out;
  out.reserve(order.size());
  for (const auto* b : order) out.push_back(b->competitor);
  return out;
}

std::vector<PositionPrediction> predict_positions(const std::vector<Belief>& beliefs) {
  const auto ranking = rank_by_belief(beliefs);
  const double n = static_cast<double>(beliefs.size());

  std::vector<PositionPrediction> out;
  out.reserve(ranking.size());
  for (std::size_t i = 0; i < ranking.size(); ++i) {
    auto b = std::find_if(beliefs.begin(), beliefs.end(),
                          [&](const Belief& x){ return x.competitor == ranking[i]; });
    PositionPrediction p;
    p.competitor = b->competitor;
    p.predicted_rank = static_cast<int>(i + 1);
    p.mean = b->mean;
    p.variance = b->variance;
    p.position_estimate = (n + 1.0) - b->mean;
    const double half = 1.96 * std::sqrt(b->variance);
    p.ci_lower = std::clamp(p.position_estimate - half, 1.0, n);
    p.ci_upper = std::clamp(p.position_estimate + half, 1.0, n);
    p.observations = b->observations;
    out.push_back(std::move(p));
  }
  return out;
}

} // namespace f1qp
