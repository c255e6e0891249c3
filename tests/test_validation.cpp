#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <cmath>
#include <map>
#include <string>
#include <vector>

#include <f1qp/validation.hpp>
#include "season_fixture.hpp"

using Catch::Approx;
using namespace f1qp;

static const EventError* find_event(const ValidationResult& r, const std::string& name) {
  for (const auto& e : r.events) {
    if (e.event == name) return &e;
  }
  return nullptr;
}

static bool has_issue(const std::vector<Issue>& issues, IssueKind kind, const std::string& subject) {
  for (const auto& i : issues) {
    if (i.kind == kind && i.subject == subject) return true;
  }
  return false;
}

TEST_CASE("ranking_mae compares re-ranked positions") {
  const std::map<CompetitorId, int> truth{{"A", 2}, {"B", 1}, {"C", 3}};

  SECTION("perfect ranking") {
    REQUIRE(*ranking_mae({"B", "A", "C"}, truth) == Approx(0.0));
  }
  SECTION("A,B,C against B,A,C is the plain mean 2/3, not 1.0") {
    REQUIRE(*ranking_mae({"A", "B", "C"}, truth) == Approx(2.0 / 3.0));
  }
  SECTION("two swapped of two") {
    REQUIRE(*ranking_mae({"A", "B"}, {{"A", 2}, {"B", 1}}) == Approx(1.0));
  }
  SECTION("only shared competitors count, re-ranked among themselves") {
    REQUIRE(*ranking_mae({"A", "X", "B"}, {{"A", 2}, {"B", 1}, {"Z", 3}}) == Approx(1.0));
  }
  SECTION("no overlap") {
    REQUIRE_FALSE(ranking_mae({"X", "Y"}, truth).has_value());
  }
}

TEST_CASE("issue kinds have stable names") {
  REQUIRE(std::string{issue_kind_name(IssueKind::MissingPriorInput)} == "MissingPriorInput");
  REQUIRE(std::string{issue_kind_name(IssueKind::InsufficientHistory)} == "InsufficientHistory");
  REQUIRE(std::string{issue_kind_name(IssueKind::InvalidGroundTruth)} == "InvalidGroundTruth");
  REQUIRE(std::string{issue_kind_name(IssueKind::DegenerateVariance)} == "DegenerateVariance");
}

TEST_CASE("ground_truth_problem") {
  REQUIRE_FALSE(ground_truth_problem({{"A", 1}, {"B", 2}}).has_value());
  REQUIRE(ground_truth_problem({{"A", 1}, {"B", 1}}).has_value());
  REQUIRE(ground_truth_problem({{"A", 0}}).has_value());
  REQUIRE(ground_truth_problem({}).has_value());
}

TEST_CASE("temporal_folds train on strictly earlier rounds") {
  std::vector<EventData> events(4);
  events[0].event = "b"; events[0].round = 2;
  events[1].event = "a"; events[1].round = 1;
  events[2].event = "c"; events[2].round = 2;
  events[3].event = "d"; events[3].round = 3;

  const auto folds = temporal_folds(events);
  REQUIRE(folds.size() == 4);
  REQUIRE(folds[0].test == 1);
  REQUIRE(folds[0].train.empty());
  REQUIRE(folds[1].test == 0);
  REQUIRE(folds[1].train == std::vector<std::size_t>{1});
  REQUIRE(folds[2].test == 2);
  REQUIRE(folds[2].train == std::vector<std::size_t>{1});
  REQUIRE(folds[3].test == 3);
  REQUIRE(folds[3].train == std::vector<std::size_t>{1, 0, 2});
}

TEST_CASE("predict_event with prior_only reproduces the prior ranking") {
  const auto season = fixture::season();
  const auto cfg = fixture::config();
  const auto priors = build_priors(season.entries, season.standings, season.tiers, cfg.prior);

  const auto pred = predict_event(season.events[0], priors.priors, PriorOnly{}, cfg);
  REQUIRE(pred.ranking == prior_ranking(priors.priors));
  REQUIRE(pred.ranking == std::vector<CompetitorId>{"A", "B", "C", "D"});
  REQUIRE(pred.format == WeekendFormat::Standard);
  REQUIRE(pred.issues.empty());
}

TEST_CASE("predict_event lets session evidence overturn the prior") {
  const auto season = fixture::season();
  const auto cfg = fixture::config();
  const auto priors = build_priors(season.entries, season.standings, season.tiers, cfg.prior);

  const auto pred = predict_event(season.events[0], priors.priors, fixture::straight_line_method(), cfg);
  REQUIRE(pred.ranking == std::vector<CompetitorId>{"D", "C", "B", "A"});
  REQUIRE(pred.history.size() == 8);
  for (const auto& b : pred.beliefs) REQUIRE(b.observations == 2);
}

TEST_CASE("predict_event flags competitors without a prior") {
  auto season = fixture::season();
  const auto cfg = fixture::config();
  season.events[0].sessions.push_back(fixture::row("X", "FP1", 310.0, 80.0));
  const auto priors = build_priors(season.entries, season.standings, season.tiers, cfg.prior);

  const auto pred = predict_event(season.events[0], priors.priors, fixture::straight_line_method(), cfg);
  REQUIRE(has_issue(pred.issues, IssueKind::MissingPriorInput, "X"));
  REQUIRE(pred.ranking.size() == 4);
  REQUIRE(pred.ranking == std::vector<CompetitorId>{"D", "C", "B", "A"});
}

TEST_CASE("run_validation walks forward through the season") {
  const auto season = fixture::season();
  const auto cfg = fixture::config();

  const auto baseline = run_validation(season, PriorOnly{}, cfg);
  REQUIRE(baseline.method == "prior_only");
  REQUIRE(baseline.events.size() == 3);
  REQUIRE(baseline.mae == Approx(2.0));
  REQUIRE(has_issue(baseline.issues, IssueKind::InsufficientHistory, "R1"));
  REQUIRE(find_event(baseline, "R1") == nullptr);

  const auto candidate = run_validation(season, fixture::straight_line_method(), cfg);
  REQUIRE(candidate.events.size() == 3);
  REQUIRE(candidate.mae == Approx(0.0));
  for (const auto& e : candidate.events) {
    // every grid value ranks perfectly; ties go to the smallest multiplier
    REQUIRE(e.trust_scale == Approx(0.25));
  }
  REQUIRE(candidate.events[0].event == "R2");
  REQUIRE(candidate.events[2].event == "R4");
}

TEST_CASE("run_validation never uses later events") {
  const auto cfg = fixture::config();
  const auto method = fixture::straight_line_method();
  const auto season = fixture::season();

  auto altered = season;
  auto& last = altered.events[3];
  for (auto& r : last.sessions) r.metrics["straight.vmax"] = 400.0 - r.metrics["straight.vmax"];
  last.results = {{"A", 1}, {"B", 2}, {"C", 3}, {"D", 4}};

  const auto before = run_validation(season, method, cfg);
  const auto after = run_validation(altered, method, cfg);
  for (const char* name : {"R2", "R3"}) {
    const auto* a = find_event(before, name);
    const auto* b = find_event(after, name);
    REQUIRE(a != nullptr);
    REQUIRE(b != nullptr);
    REQUIRE(a->mae == b->mae);
    REQUIRE(a->trust_scale == b->trust_scale);
  }
}

TEST_CASE("run_validation reports broken ground truth and continues") {
  auto season = fixture::season();
  season.events[2].results = {{"D", 1}, {"C", 2}, {"B", 2}, {"A", 4}};

  const auto r = run_validation(season, fixture::straight_line_method(), fixture::config());
  REQUIRE(r.events.size() == 2);
  REQUIRE(find_event(r, "R3") == nullptr);
  REQUIRE(has_issue(r.issues, IssueKind::InvalidGroundTruth, "R3"));
  REQUIRE(r.mae == Approx(0.0));
}

TEST_CASE("run_validation honours min_history_events") {
  auto cfg = fixture::config();
  cfg.min_history_events = 3;
  const auto r = run_validation(fixture::season(), PriorOnly{}, cfg);
  REQUIRE(r.events.size() == 1);
  REQUIRE(r.events[0].event == "R4");
}

TEST_CASE("compare_methods pairs per-event errors") {
  const auto cmp = compare_methods(fixture::season(), fixture::straight_line_method(), fixture::config());
  REQUIRE(cmp.baseline.mae == Approx(2.0));
  REQUIRE(cmp.candidate.mae == Approx(0.0));
  REQUIRE(cmp.mae_improvement == Approx(2.0));
  REQUIRE(cmp.test.has_value());
  REQUIRE(cmp.test->n == 3);
  REQUIRE(cmp.test->mean_difference == Approx(2.0));
  REQUIRE(std::isinf(cmp.test->t_statistic));
  REQUIRE(cmp.test->t_statistic > 0.0);
  REQUIRE(cmp.test->p_value == Approx(0.0));
}

TEST_CASE("mae_by_format splits standard and sprint weekends") {
  auto season = fixture::season();
  season.events[2] = fixture::event("R3", 3, {"FP1", "Sprint Qualifying"});
  const auto r = run_validation(season, fixture::straight_line_method(), fixture::config());

  REQUIRE(find_event(r, "R3") != nullptr);
  REQUIRE(find_event(r, "R3")->format == WeekendFormat::Sprint);

  const auto by_format = mae_by_format(r);
  REQUIRE(by_format.size() == 2);
  REQUIRE(by_format[0].format == WeekendFormat::Standard);
  REQUIRE(by_format[0].events == 2);
  REQUIRE(by_format[1].format == WeekendFormat::Sprint);
  REQUIRE(by_format[1].events == 1);
  REQUIRE(by_format[1].mae == Approx(0.0));
}

TEST_CASE("run_validation builds its method from the config") {
  const auto season = fixture::season();
  auto cfg = fixture::config();
  cfg.scoring.weights = {{"straight", 1.0}, {"corner_slow", 0.0}};

  cfg.scoring_method = ScoringKind::PriorOnly;
  const auto baseline = run_validation(season, cfg);
  REQUIRE(baseline.method == "prior_only");
  REQUIRE(baseline.mae == Approx(2.0));

  cfg.scoring_method = ScoringKind::ZScoreNormalized;
  const auto candidate = run_validation(season, cfg);
  REQUIRE(candidate.method == "zscore_normalized");
  REQUIRE(candidate.mae == Approx(0.0));

  const auto cmp = compare_methods(season, cfg);
  REQUIRE(cmp.mae_improvement == Approx(2.0));
}
