#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <sstream>

#include <f1qp/dataset.hpp>

using Catch::Approx;
using namespace f1qp;

TEST_CASE("standings_from_csv_stream") {
  std::istringstream ss(
    "competitor,team,rank,points,seasons\n"
    "VER,Red Bull Racing,1,437,9\n"
    "# comment\n"
    "BEA,Haas,,,0\n"
    "BAD,Haas,first,,\n"
    "NOR,McLaren\n");
  const auto rows = standings_from_csv_stream(ss);
  REQUIRE(rows.size() == 3);
  REQUIRE(rows[0].competitor == "VER");
  REQUIRE(rows[0].rank == 1);
  REQUIRE(rows[0].points == Approx(437.0));
  REQUIRE(rows[0].seasons == 9);
  REQUIRE(rows[1].rank == 0);
  REQUIRE_FALSE(rows[1].points.has_value());
  REQUIRE(rows[2].competitor == "NOR");
  REQUIRE(rows[2].seasons == 0);
}

TEST_CASE("team tiers, entries and events") {
  std::istringstream tiers("team,tier\nMcLaren, TOP\nHaas,backmarker\nOrphan,\n");
  const auto t = team_tiers_from_csv_stream(tiers);
  REQUIRE(t.size() == 2);
  REQUIRE(t[0].tier == "top");

  std::istringstream entries("LAW,Racing Bulls\n");
  const auto e = entries_from_csv_stream(entries);
  REQUIRE(e.size() == 1);
  REQUIRE(e[0].team == "Racing Bulls");

  std::istringstream events("event,round\nBahrain,1\nJeddah,2\nMelbourne,third\n");
  const auto ev = events_from_csv_stream(events);
  REQUIRE(ev.size() == 2);
  REQUIRE(ev[1].event == "Jeddah");
  REQUIRE(ev[1].round == 2);
}

TEST_CASE("session_metrics_from_csv_stream reads the wide layout") {
  std::istringstream ss(
    "event,session,competitor,clean_laps,straight.vmax,corner_slow.min_speed\n"
    "Bahrain,FP1,VER,8,330.5,92.1\n"
    "Bahrain,FP1,NOR,6,,93.0\n"
    "Bahrain,FP1,HAM,x,329.0,91.0\n"
    "Bahrain,FP1,LEC,7,fast,91.0\n");
  const auto recs = session_metrics_from_csv_stream(ss);
  REQUIRE(recs.size() == 2);
  REQUIRE(recs[0].event == "Bahrain");
  REQUIRE(recs[0].metrics.session == "FP1");
  REQUIRE(recs[0].metrics.clean_laps == 8);
  REQUIRE(recs[0].metrics.metrics.at("straight.vmax") == Approx(330.5));
  REQUIRE(recs[1].metrics.metrics.count("straight.vmax") == 0);
  REQUIRE(recs[1].metrics.metrics.at("corner_slow.min_speed") == Approx(93.0));
}

TEST_CASE("session_metrics_from_csv_stream requires its header") {
  std::istringstream ss("Bahrain,FP1,VER,8,330.5\n");
  REQUIRE(session_metrics_from_csv_stream(ss).empty());
}

TEST_CASE("assemble_season attaches records to known events") {
  std::istringstream events("event,round\nBahrain,1\n");
  std::istringstream metrics(
    "event,session,competitor,clean_laps,straight.vmax\n"
    "Bahrain,FP1,VER,8,330\n"
    "Monaco,FP1,VER,8,290\n");
  std::istringstream results(
    "event,competitor,position\n"
    "Bahrain,VER,1\n"
    "Bahrain,VER,2\n"
    "Bahrain,NOR,2\n"
    "Monaco,VER,1\n");

  const auto season = assemble_season({}, {}, {}, events_from_csv_stream(events),
                                      session_metrics_from_csv_stream(metrics),
                                      results_from_csv_stream(results));
  REQUIRE(season.events.size() == 1);
  const auto& ev = season.events[0];
  REQUIRE(ev.sessions.size() == 1);
  REQUIRE(ev.results.size() == 2);
  REQUIRE(ev.results.at("VER") == 1);
  REQUIRE(ev.results.at("NOR") == 2);
}

TEST_CASE("load_season needs its input files") {
  REQUIRE_FALSE(load_season("no/such/season/dir").has_value());
}
