#include <f1qp/session.hpp>
#include <f1qp/csv.hpp>
#include <array>
#include <utility>

namespace f1qp {

namespace {

// Separators are normalized away before lookup ("Sprint-Qualifying" == "sprintqualifying").
std::string squash(const std::string& s) {
  std::string out;
  for (char c : lower(s)) {
    if (c == ' ' || c == '_' || c == '-') continue;
    out.push_back(c);
  }
  return out;
}

const std::array<std::pair<const char*, SessionType>, 20> kAliases{{
  {"fp1", SessionType::Practice1},
  {"practice1", SessionType::Practice1},
  {"freepractice1", SessionType::Practice1},
  {"fp2", SessionType::Practice2},
  {"practice2", SessionType::Practice2},
  {"freepractice2", SessionType::Practice2},
  {"fp3", SessionType::Practice3},
  {"practice3", SessionType::Practice3},
  {"freepractice3", SessionType::Practice3},
  {"sq", SessionType::SprintQualifying},
  {"sprintqualifying", SessionType::SprintQualifying},
  {"sprintshootout", SessionType::SprintQualifying},
  {"s", SessionType::Sprint},
  {"sprint", SessionType::Sprint},
  {"q", SessionType::Qualifying},
  {"qualifying", SessionType::Qualifying},
  {"r", SessionType::Race},
  {"race", SessionType::Race},
  {"t", SessionType::Testing},
  {"testing", SessionType::Testing},
}};

} // namespace

std::optional<SessionType> parse_session_type(const std::string& id) {
  auto key = squash(trim(id));
  if (key == "preseasontesting") key = "testing";
  for (const auto& [alias, type] : kAliases) {
    if (key == alias) return type;
  }
  return std::nullopt;
}

const char* session_type_key(SessionType t) {
  switch (t) {
    case SessionType::Testing:          return "testing";
    case SessionType::Practice1:        return "fp1";
    case SessionType::Practice2:        return "fp2";
    case SessionType::Practice3:        return "fp3";
    case SessionType::SprintQualifying: return "sprint_qualifying";
    case SessionType::Sprint:           return "sprint";
    case SessionType::Qualifying:       return "qualifying";
    case SessionType::Race:             return "race";
  }
  return "unknown";
}

std::optional<SessionType> session_type_from_key(const std::string& key) {
  const auto k = lower(trim(key));
  for (int i = 0; i <= static_cast<int>(SessionType::Race); ++i) {
    const auto t = static_cast<SessionType>(i);
    if (k == session_type_key(t)) return t;
  }
  return std::nullopt;
}

} // namespace f1qp
