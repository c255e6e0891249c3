#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <f1qp/validation.hpp>
#include "season_fixture.hpp"

using Catch::Approx;
using namespace f1qp;

TEST_CASE("run_ablation zeroes one category per run") {
  const auto season = fixture::season();
  const auto cfg = fixture::config();
  const auto results = run_ablation(season, fixture::straight_line_method(), cfg);

  REQUIRE(results.size() == 2);
  REQUIRE(results[0].category == "corner_slow");
  REQUIRE(results[1].category == "straight");

  SECTION("an unweighted category changes nothing") {
    REQUIRE(results[0].mae_delta == 0.0);
    REQUIRE(results[0].result.ablation == std::optional<std::string>{"corner_slow"});
  }

  SECTION("dropping the only informative category falls back to the prior") {
    REQUIRE(results[1].result.mae == Approx(2.0));
    REQUIRE(results[1].mae_delta == Approx(2.0));
    REQUIRE(results[1].result.events.size() == 3);
  }
}

TEST_CASE("run_ablation has nothing to do for prior_only") {
  REQUIRE(run_ablation(fixture::season(), PriorOnly{}, fixture::config()).empty());
}
