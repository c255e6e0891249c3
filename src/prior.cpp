#include <f1qp/prior.hpp>
#include <f1qp/belief.hpp>
#include <f1qp/logging.hpp>
#include <algorithm>
#include <unordered_map>

namespace f1qp {

const CompetitorPrior* PriorTable::find(const CompetitorId& id) const {
  auto it = std::find_if(priors.begin(), priors.end(),
                         [&](const CompetitorPrior& p){ return p.competitor == id; });
  return it == priors.end() ? nullptr : &*it;
}

double rank_to_mean(int rank, const PriorConfig& cfg) {
  const int r = std::max(1, rank);
  return std::max(cfg.min_mean, cfg.top_mean - cfg.rank_step * static_cast<double>(r - 1));
}

double history_to_variance(int seasons, const PriorConfig& cfg) {
  const double n = static_cast<double>(std::max(0, seasons));
  return cfg.established_variance + cfg.inexperience_variance / (1.0 + n);
}

std::optional<CompetitorPrior> tier_prior(const CompetitorId& competitor,
                                          const std::string& team,
                                          const std::vector<TeamTier>& tiers,
                                          const PriorConfig& cfg) {
  if (team.empty()) return std::nullopt;
  auto t = std::find_if(tiers.begin(), tiers.end(),
                        [&](const TeamTier& tt){ return tt.team == team; });
  if (t == tiers.end()) return std::nullopt;
  auto tp = cfg.tiers.find(t->tier);
  if (tp == cfg.tiers.end()) return std::nullopt;

  CompetitorPrior p;
  p.competitor = competitor;
  p.team = team;
  p.mean = tp->second.mean;
  p.variance = tp->second.variance * cfg.rookie_multiplier;
  p.tier = t->tier;
  p.rookie = true;
  return p;
}

// Rank when given; otherwise position by descending points among the rows
// that lack a rank, placed after the lowest explicit rank. Rows with neither
// get no entry (no individual history).
static std::unordered_map<CompetitorId, int> effective_ranks(const std::vector<StandingsRow>& standings) {
  std::unordered_map<CompetitorId, int> out;
  std::vector<const StandingsRow*> by_points;
  int last_rank = 0;
  for (const auto& row : standings) {
    if (row.rank > 0) {
      out[row.competitor] = row.rank;
      last_rank = std::max(last_rank, row.rank);
    } else if (row.points.has_value()) {
      by_points.push_back(&row);
    }
  }
  std::sort(by_points.begin(), by_points.end(), [](const StandingsRow* a, const StandingsRow* b){
    if (*a->points != *b->points) return *a->points > *b->points;
    return a->competitor < b->competitor;
  });
  for (std::size_t i = 0; i < by_points.size(); ++i) {
    out[by_points[i]->competitor] = last_rank + static_cast<int>(i + 1);
  }
  return out;
}

PriorTable build_priors(const std::vector<EntryRow>& entries,
                        const std::vector<StandingsRow>& standings,
                        const std::vector<TeamTier>& tiers,
                        const PriorConfig& cfg) {
  std::vector<EntryRow> field = entries;
  if (field.empty()) {
    for (const auto& row : standings) field.push_back(EntryRow{row.competitor, row.team});
  }

  const auto ranks = effective_ranks(standings);
  PriorTable out;
  out.priors.reserve(field.size());

  for (const auto& e : field) {
    auto row = std::find_if(standings.begin(), standings.end(),
                            [&](const StandingsRow& s){ return s.competitor == e.competitor; });
    const std::string team = !e.team.empty() ? e.team
                           : (row != standings.end() ? row->team : std::string{});

    auto r = ranks.find(e.competitor);
    if (row != standings.end() && r != ranks.end()) {
      CompetitorPrior p;
      p.competitor = e.competitor;
      p.team = team;
      p.mean = rank_to_mean(r->second, cfg);
      p.variance = history_to_variance(row->seasons, cfg);
      out.priors.push_back(std::move(p));
      continue;
    }

    if (auto p = tier_prior(e.competitor, team, tiers, cfg)) {
      F1QP_LOG_DEBUG("prior: %s has no standings history, using tier '%s'",
                     e.competitor.c_str(), p->tier.c_str());
      out.priors.push_back(std::move(*p));
      continue;
    }

    F1QP_LOG_WARN("prior: no standings and no resolvable tier for %s (team '%s')",
                  e.competitor.c_str(), team.c_str());
    out.issues.push_back(Issue{IssueKind::MissingPriorInput, e.competitor,
                               team.empty() ? "no team" : "no tier for team " + team});
  }
  return out;
}

std::vector<CompetitorId> prior_ranking(const std::vector<CompetitorPrior>& priors) {
  std::vector<Belief> beliefs;
  beliefs.reserve(priors.size());
  for (const auto& p : priors) beliefs.push_back(seed_belief(p));
  return rank_by_belief(beliefs);
}

} // namespace f1qp
