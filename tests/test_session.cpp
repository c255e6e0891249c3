#include <catch2/catch_test_macros.hpp>
#include <string>

#include <f1qp/session.hpp>

using namespace f1qp;

TEST_CASE("parse_session_type accepts short and long names") {
  REQUIRE(parse_session_type("FP1") == SessionType::Practice1);
  REQUIRE(parse_session_type("Practice 2") == SessionType::Practice2);
  REQUIRE(parse_session_type("free-practice-3") == SessionType::Practice3);
  REQUIRE(parse_session_type("sq") == SessionType::SprintQualifying);
  REQUIRE(parse_session_type("Sprint Shootout") == SessionType::SprintQualifying);
  REQUIRE(parse_session_type("Sprint") == SessionType::Sprint);
  REQUIRE(parse_session_type(" Qualifying ") == SessionType::Qualifying);
  REQUIRE(parse_session_type("R") == SessionType::Race);
  REQUIRE(parse_session_type("Pre-Season Testing") == SessionType::Testing);
}

TEST_CASE("parse_session_type rejects unknown identifiers") {
  REQUIRE_FALSE(parse_session_type("").has_value());
  REQUIRE_FALSE(parse_session_type("FP4").has_value());
  REQUIRE_FALSE(parse_session_type("warmup").has_value());
}

TEST_CASE("session keys round-trip") {
  for (int i = 0; i <= static_cast<int>(SessionType::Race); ++i) {
    const auto t = static_cast<SessionType>(i);
    REQUIRE(session_type_from_key(session_type_key(t)) == t);
  }
  REQUIRE(std::string(session_type_key(SessionType::SprintQualifying)) == "sprint_qualifying");
}
