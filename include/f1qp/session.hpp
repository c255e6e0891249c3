#pragma once
#include <optional>
#include <string>

namespace f1qp {

// Declared in chronological order within a weekend.
enum class SessionType : int {
  Testing = 0,
  Practice1,
  Practice2,
  Practice3,
  SprintQualifying,
  Sprint,
  Qualifying,
  Race,
};

// Accepts short and long identifiers, case-insensitive:
// "FP1" / "Practice 1", "SQ" / "Sprint Qualifying" / "Sprint Shootout", "Q", "R", ...
std::optional<SessionType> parse_session_type(const std::string& id);

// Stable lower-case key used by configuration ("fp1", "sprint_qualifying", ...).
const char* session_type_key(SessionType t);
std::optional<SessionType> session_type_from_key(const std::string& key);

} // namespace f1qp
