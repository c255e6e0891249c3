#pragma once
#include <cstddef>
#include <string>
#include <vector>

namespace f1qp {

using CompetitorId = std::string;

// Prior belief about one competitor's pace (higher mean = faster).
struct CompetitorPrior {
  CompetitorId competitor;
  std::string team;
  double mean = 0.0;      // mu0 on the pace scale
  double variance = 1.0;  // sigma0^2
  std::string tier;       // tier label the prior came from ("" for individual priors)
  bool rookie = false;    // true when inherited from the team tier
};

// One usable session's evidence for one competitor.
struct EvidenceObservation {
  CompetitorId competitor;
  std::string session;
  double value = 0.0;     // pace scale, same as CompetitorPrior::mean
  double variance = 1.0;  // sigma_e^2
};

// Running belief; seeded from a prior at session_index 0.
struct Belief {
  CompetitorId competitor;
  double mean = 0.0;
  double variance = 1.0;
  std::size_t session_index = 0; // sessions consumed so far (incl. pass-throughs)
  std::size_t observations = 0;  // sessions that actually moved the belief
};

enum class IssueKind {
  MissingPriorInput,
  InsufficientHistory,
  InvalidGroundTruth,
  DegenerateVariance,
};

const char* issue_kind_name(IssueKind k);

// Recoverable, per-competitor or per-event failure reported next to results.
struct Issue {
  IssueKind kind;
  std::string subject; // competitor or event id
  std::string detail;
};

} // namespace f1qp
