#pragma once
#include <string>
#include <vector>

#include <f1qp/validation.hpp>

// Four-car season where the standings order (A, B, C, D) is exactly wrong:
// D is quickest on the straights and qualifies first at every round.
namespace fixture {

inline f1qp::SessionMetrics row(const std::string& competitor, const std::string& session,
                                double vmax, double slow_corner) {
  f1qp::SessionMetrics m;
  m.competitor = competitor;
  m.session = session;
  m.clean_laps = 5;
  m.metrics["straight.vmax"] = vmax;
  m.metrics["corner_slow.min_speed"] = slow_corner;
  return m;
}

inline f1qp::EventData event(const std::string& name, int round,
                             const std::vector<std::string>& sessions) {
  f1qp::EventData ev;
  ev.event = name;
  ev.round = round;
  const std::vector<std::string> ids{"A", "B", "C", "D"};
  for (const auto& s : sessions) {
    for (std::size_t i = 0; i < ids.size(); ++i) {
      // slow-corner speed points the wrong way; it only matters if weighted
      ev.sessions.push_back(row(ids[i], s, 300.0 + i, 90.0 - i));
    }
  }
  ev.results = {{"D", 1}, {"C", 2}, {"B", 3}, {"A", 4}};
  return ev;
}

inline f1qp::Season season() {
  f1qp::Season s;
  s.standings = {
    {"A", "Alpha", 1, std::nullopt, 3},
    {"B", "Bravo", 2, std::nullopt, 3},
    {"C", "Charlie", 3, std::nullopt, 3},
    {"D", "Delta", 4, std::nullopt, 3},
  };
  for (int r = 1; r <= 4; ++r) {
    s.events.push_back(event("R" + std::to_string(r), r, {"FP1", "FP2"}));
  }
  return s;
}

inline f1qp::ModelConfig config() {
  f1qp::ModelConfig cfg;
  cfg.prior.established_variance = 100.0;
  cfg.prior.inexperience_variance = 0.0;
  cfg.trust_weights[f1qp::SessionType::Practice1] = 1.0;
  cfg.trust_weights[f1qp::SessionType::Practice2] = 1.0;
  cfg.evidence_variance = 1.0;
  cfg.threads = 2;
  return cfg;
}

inline f1qp::ScoringMethod straight_line_method() {
  f1qp::ZScoreNormalized z;
  z.weights = {{"straight", 1.0}, {"corner_slow", 0.0}};
  return z;
}

} // namespace fixture
