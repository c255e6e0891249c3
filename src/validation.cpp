#include <f1qp/validation.hpp>
#include <f1qp/logging.hpp>
#include <f1qp/parallel.hpp>
#include <algorithm>
#include <cmath>
#include <set>
#include <utility>

namespace f1qp {

std::vector<std::string> session_ids(const EventData& ev) {
  std::vector<std::string> out;
  for (const auto& row : ev.sessions) {
    if (std::find(out.begin(), out.end(), row.session) == out.end()) out.push_back(row.session);
  }
  return out;
}

static std::set<CompetitorId> event_competitors(const EventData& ev) {
  std::set<CompetitorId> ids;
  for (const auto& row : ev.sessions) ids.insert(row.competitor);
  for (const auto& [id, _] : ev.results) ids.insert(id);
  return ids;
}

EventPrediction predict_event(const EventData& ev,
                              const std::vector<CompetitorPrior>& priors,
                              const ScoringMethod& method,
                              const ModelConfig& cfg,
                              unsigned threads) {
  EventPrediction out;
  out.event = ev.event;

  const auto present = event_competitors(ev);
  std::vector<CompetitorPrior> field;
  for (const auto& p : priors) {
    if (present.empty() || present.count(p.competitor)) field.push_back(p);
  }
  for (const auto& id : present) {
    auto it = std::find_if(priors.begin(), priors.end(),
                           [&](const CompetitorPrior& p){ return p.competitor == id; });
    if (it == priors.end()) {
      out.issues.push_back(Issue{IssueKind::MissingPriorInput, id, "no prior in event " + ev.event});
    }
  }

  const WeekendPlan plan = plan_weekend(session_ids(ev), cfg);
  out.format = plan.format;

  SessionEvidence evidence;
  for (const auto& step : plan.sequence) {
    std::vector<SessionMetrics> rows;
    for (const auto& row : ev.sessions) {
      if (row.session == step.session) rows.push_back(row);
    }
    auto& slot = evidence[step.session];
    for (auto& obs : score_session(method, rows, cfg.min_clean_laps, cfg.evidence_variance)) {
      slot.emplace(obs.competitor, std::move(obs));
    }
  }

  WeekendResult wk = run_weekend(field, plan, evidence, cfg.variance_floor, threads);
  out.ranking = rank_by_belief(wk.beliefs);
  out.beliefs = std::move(wk.beliefs);
  out.history = std::move(wk.history);
  for (auto& issue : wk.issues) out.issues.push_back(std::move(issue));
  return out;
}

std::optional<std::string> ground_truth_problem(const std::map<CompetitorId, int>& truth) {
  if (truth.empty()) return std::string{"no results"};
  std::map<int, CompetitorId> seen;
  for (const auto& [id, pos] : truth) {
    if (pos <= 0) return "non-positive position " + std::to_string(pos) + " for " + id;
    auto [it, inserted] = seen.emplace(pos, id);
    if (!inserted) {
      return "position " + std::to_string(pos) + " shared by " + it->second + " and " + id;
    }
  }
  return std::nullopt;
}

std::optional<double> ranking_mae(const std::vector<CompetitorId>& predicted,
                                  const std::map<CompetitorId, int>& truth) {
  std::vector<CompetitorId> pred_common;
  for (const auto& id : predicted) {
    if (truth.count(id)) pred_common.push_back(id);
  }
  if (pred_common.empty()) return std::nullopt;

  std::vector<std::pair<int, CompetitorId>> true_order;
  for (const auto& id : pred_common) true_order.emplace_back(truth.at(id), id);
  std::sort(true_order.begin(), true_order.end());

  std::map<CompetitorId, int> true_pos;
  for (std::size_t i = 0; i < true_order.size(); ++i) {
    true_pos[true_order[i].second] = static_cast<int>(i + 1);
  }

  double sum = 0.0;
  for (std::size_t i = 0; i < pred_common.size(); ++i) {
    sum += std::abs(static_cast<double>(i + 1) - static_cast<double>(true_pos[pred_common[i]]));
  }
  return sum / static_cast<double>(pred_common.size());
}

std::vector<TemporalFold> temporal_folds(const std::vector<EventData>& events) {
  std::vector<std::size_t> order(events.size());
  for (std::size_t i = 0; i < order.size(); ++i) order[i] = i;
  std::sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b){
    if (events[a].round != events[b].round) return events[a].round < events[b].round;
    return events[a].event < events[b].event;
  });

  std::vector<TemporalFold> folds;
  folds.reserve(order.size());
  for (std::size_t idx : order) {
    TemporalFold f;
    f.test = idx;
    for (std::size_t j : order) {
      if (events[j].round < events[idx].round) f.train.push_back(j);
    }
    folds.push_back(std::move(f));
  }
  return folds;
}

// Mean MAE over the usable events; nullopt if none is usable.
static std::optional<double> mean_event_mae(const std::vector<const EventData*>& events,
                                            const std::vector<CompetitorPrior>& priors,
                                            const ScoringMethod& method,
                                            const ModelConfig& cfg) {
  double sum = 0.0;
  std::size_t n = 0;
  for (const auto* ev : events) {
    if (ground_truth_problem(ev->results)) continue;
    const auto pred = predict_event(*ev, priors, method, cfg);
    if (auto mae = ranking_mae(pred.ranking, ev->results)) {
      sum += *mae;
      ++n;
    }
  }
  if (n == 0) return std::nullopt;
  return sum / static_cast<double>(n);
}

double fit_trust_scale(const std::vector<const EventData*>& train,
                       const std::vector<CompetitorPrior>& priors,
                       const ScoringMethod& method,
                       const ModelConfig& cfg) {
  if (std::holds_alternative<PriorOnly>(method) || cfg.trust_scale_grid.empty()) return cfg.trust_scale;

  std::vector<double> grid = cfg.trust_scale_grid;
  std::sort(grid.begin(), grid.end());

  std::optional<double> best_scale;
  double best_mae = 0.0;
  for (double g : grid) {
    ModelConfig trial = cfg;
    trial.trust_scale = g;
    auto mae = mean_event_mae(train, priors, method, trial);
    if (!mae) return cfg.trust_scale;
    if (!best_scale || *mae < best_mae) {
      best_scale = g;
      best_mae = *mae;
    }
  }
  return best_scale.value_or(cfg.trust_scale);
}

std::vector<double> ValidationResult::errors() const {
  std::vector<double> out;
  out.reserve(events.size());
  for (const auto& e : events) out.push_back(e.mae);
  return out;
}

namespace {

struct FoldOutcome {
  std::optional<EventError> error;
  std::vector<Issue> issues;
};

FoldOutcome evaluate_fold(const Season& season,
                          const TemporalFold& fold,
                          const std::vector<CompetitorPrior>& priors,
                          const ScoringMethod& method,
                          const ModelConfig& cfg) {
  FoldOutcome out;
  const EventData& ev = season.events[fold.test];

  if (fold.train.size() < static_cast<std::size_t>(cfg.min_history_events)) {
    F1QP_LOG_WARN("validation: %s excluded, %zu earlier event(s) available",
                  ev.event.c_str(), fold.train.size());
    out.issues.push_back(Issue{IssueKind::InsufficientHistory, ev.event,
                               std::to_string(fold.train.size()) + " earlier event(s), need " +
                               std::to_string(cfg.min_history_events)});
    return out;
  }
  if (auto problem = ground_truth_problem(ev.results)) {
    F1QP_LOG_ERROR("validation: %s has invalid results: %s", ev.event.c_str(), problem->c_str());
    out.issues.push_back(Issue{IssueKind::InvalidGroundTruth, ev.event, *problem});
    return out;
  }

  ModelConfig event_cfg = cfg;
  if (cfg.fit_trust_scale) {
    std::vector<const EventData*> train;
    train.reserve(fold.train.size());
    for (std::size_t j : fold.train) train.push_back(&season.events[j]);
    event_cfg.trust_scale = fit_trust_scale(train, priors, method, cfg);
  }

  auto pred = predict_event(ev, priors, method, event_cfg);
  out.issues = std::move(pred.issues);
  auto mae = ranking_mae(pred.ranking, ev.results);
  if (!mae) {
    out.issues.push_back(Issue{IssueKind::InvalidGroundTruth, ev.event,
                               "no competitor in both prediction and results"});
    return out;
  }
  out.error = EventError{ev.event, ev.round, pred.format, *mae, event_cfg.trust_scale};
  return out;
}

} // namespace

ValidationResult run_validation(const Season& season,
                                const ScoringMethod& method,
                                const ModelConfig& cfg,
                                std::optional<std::string> ablation) {
  ValidationResult out;
  out.method = scoring_kind_name(scoring_kind(method));
  out.ablation = std::move(ablation);

  PriorTable priors = build_priors(season.entries, season.standings, season.tiers, cfg.prior);
  out.issues = priors.issues;

  const auto folds = temporal_folds(season.events);
  std::vector<FoldOutcome> outcomes(folds.size());
  // Each fold reads only its own earlier events; folds share nothing mutable.
  parallel_for(folds.size(), cfg.threads, [&](std::size_t i){
    outcomes[i] = evaluate_fold(season, folds[i], priors.priors, method, cfg);
  });

  for (auto& o : outcomes) {
    if (o.error) out.events.push_back(*o.error);
    for (auto& issue : o.issues) out.issues.push_back(std::move(issue));
  }
  out.mae = mean_of(out.errors());

  for (const auto& issue : out.issues) {
    F1QP_LOG_DEBUG("validation: %s %s: %s", issue_kind_name(issue.kind),
                   issue.subject.c_str(), issue.detail.c_str());
  }
  F1QP_LOG_INFO("validation: %s over %zu event(s), MAE %.4f, %zu issue(s)",
                out.method.c_str(), out.events.size(), out.mae, out.issues.size());
  return out;
}

ValidationResult run_validation(const Season& season, const ModelConfig& cfg) {
  return run_validation(season, make_scoring_method(cfg.scoring_method, cfg.scoring), cfg);
}

MethodComparison compare_methods(const Season& season,
                                 const ScoringMethod& candidate,
                                 const ModelConfig& cfg) {
  MethodComparison out;
  out.baseline = run_validation(season, PriorOnly{}, cfg);
  out.candidate = run_validation(season, candidate, cfg);
  out.mae_improvement = out.baseline.mae - out.candidate.mae;

  // Pair by event; both runs evaluate the same events unless a run failed differently.
  std::vector<double> a, b;
  for (const auto& e : out.baseline.events) {
    auto it = std::find_if(out.candidate.events.begin(), out.candidate.events.end(),
                           [&](const EventError& c){ return c.event == e.event; });
    if (it == out.candidate.events.end()) continue;
    a.push_back(e.mae);
    b.push_back(it->mae);
  }
  out.test = paired_t_test(a, b);
  return out;
}

MethodComparison compare_methods(const Season& season, const ModelConfig& cfg) {
  return compare_methods(season, make_scoring_method(cfg.scoring_method, cfg.scoring), cfg);
}

std::vector<AblationResult> run_ablation(const Season& season,
                                         const ScoringMethod& method,
                                         const ModelConfig& cfg) {
  std::vector<AblationResult> out;
  const auto categories = weighted_categories(method);
  if (categories.empty()) return out;

  const ValidationResult full = run_validation(season, method, cfg);
  for (const auto& cat : categories) {
    AblationResult r;
    r.category = cat;
    r.result = run_validation(season, without_category(method, cat), cfg, cat);
    r.mae_delta = r.result.mae - full.mae;
    F1QP_LOG_INFO("ablation: without %s MAE %.4f (delta %+.4f)", cat.c_str(), r.result.mae, r.mae_delta);
    out.push_back(std::move(r));
  }
  return out;
}

std::vector<FormatSummary> mae_by_format(const ValidationResult& result) {
  std::vector<FormatSummary> out;
  for (WeekendFormat f : {WeekendFormat::Standard, WeekendFormat::Sprint}) {
    FormatSummary s;
    s.format = f;
    double sum = 0.0;
    for (const auto& e : result.events) {
      if (e.format != f) continue;
      sum += e.mae;
      ++s.events;
    }
    s.mae = s.events ? sum / static_cast<double>(s.events) : 0.0;
    out.push_back(s);
  }
  return out;
}

} // namespace f1qp
