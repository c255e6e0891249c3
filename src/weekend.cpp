#include <f1qp/weekend.hpp>
#include <f1qp/logging.hpp>
#include <algorithm>
#include <optional>

namespace f1qp {

const char* weekend_format_name(WeekendFormat f) {
  return f == WeekendFormat::Sprint ? "sprint" : "standard";
}

WeekendFormat classify_format(const std::vector<std::string>& sessions) {
  for (const auto& id : sessions) {
    const auto t = parse_session_type(id);
    if (t == SessionType::SprintQualifying || t == SessionType::Sprint) return WeekendFormat::Sprint;
  }
  return WeekendFormat::Standard;
}

static std::optional<std::string> first_of_type(const std::vector<std::string>& sessions, SessionType type) {
  auto it = std::find_if(sessions.begin(), sessions.end(), [&](const std::string& id){
    return parse_session_type(id) == type;
  });
  if (it == sessions.end()) return std::nullopt;
  return *it;
}

WeekendPlan plan_weekend(const std::vector<std::string>& sessions, const ModelConfig& cfg) {
  WeekendPlan plan;
  plan.format = classify_format(sessions);

  static const std::vector<SessionType> kStandard{
    SessionType::Practice1, SessionType::Practice2, SessionType::Practice3};
  static const std::vector<SessionType> kSprint{
    SessionType::Practice1, SessionType::SprintQualifying};

  const auto& order = plan.format == WeekendFormat::Sprint ? kSprint : kStandard;
  for (SessionType type : order) {
    auto id = first_of_type(sessions, type);
    if (!id) {
      F1QP_LOG_DEBUG("weekend: no %s session, continuing on belief only", session_type_key(type));
      continue;
    }
    plan.sequence.push_back(PlannedSession{*id, type, trust_weight(cfg, type)});
  }
  return plan;
}

} // namespace f1qp
