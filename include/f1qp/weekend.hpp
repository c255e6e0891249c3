#pragma once
#include <string>
#include <vector>
#include <f1qp/config.hpp>
#include <f1qp/session.hpp>

namespace f1qp {

enum class WeekendFormat { Standard, Sprint };

const char* weekend_format_name(WeekendFormat f);

struct PlannedSession {
  std::string session;   // identifier as provided by the data ("FP1")
  SessionType type;
  double trust = 0.0;    // effective lambda in [0,1]
};

struct WeekendPlan {
  WeekendFormat format = WeekendFormat::Standard;
  std::vector<PlannedSession> sequence; // in update order
};

// Sprint if a sprint-qualifying or sprint session is present; otherwise standard.
WeekendFormat classify_format(const std::vector<std::string>& sessions);

// Ordered, trust-weighted update sequence for the sessions present.
//   standard: FP1, FP2, FP3
//   sprint:   FP1, Sprint Qualifying
// Sessions missing from the input are dropped; unrecognized identifiers are ignored.
WeekendPlan plan_weekend(const std::vector<std::string>& sessions, const ModelConfig& cfg);

} // namespace f1qp
