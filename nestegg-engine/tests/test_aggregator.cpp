#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "aggregator.hpp"
#include "errors.hpp"
#include "fixtures.hpp"

using namespace nestegg;
using namespace nestegg::testing;
using Catch::Matchers::WithinAbs;

namespace {

std::vector<double> one_to(size_t n) {
    std::vector<double> values;
    for (size_t i = n; i >= 1; --i) {
        values.push_back(static_cast<double>(i));
    }
    return values;
}

// Paths whose net worth in every year equals 1000 * (path + 1)
RawMatrix make_ladder(size_t paths, size_t years) {
    RawMatrix m(paths, years, 2025);
    for (size_t p = 0; p < paths; ++p) {
        for (size_t y = 0; y < years; ++y) {
            YearRecord& r = m.at(p, y);
            r.year = 2025 + static_cast<int>(y);
            r.net_worth = 1000.0 * static_cast<double>(p + 1);
            r.assets_depleted = (p % 4 == 0);
        }
    }
    return m;
}

} // anonymous namespace

// ============================================================================
// Nearest-rank rule
// ============================================================================

TEST_CASE("Nearest-rank percentile on 1..10", "[aggregator]") {
    std::vector<double> v = one_to(10);

    REQUIRE(nearest_rank_percentile(v, 10.0) == 1.0);
    REQUIRE(nearest_rank_percentile(v, 50.0) == 5.0);
    REQUIRE(nearest_rank_percentile(v, 90.0) == 9.0);
    REQUIRE(nearest_rank_percentile(v, 1.0) == 1.0);
    REQUIRE(nearest_rank_percentile(v, 99.0) == 10.0);
    REQUIRE(nearest_rank_percentile(v, 11.0) == 2.0);
}

TEST_CASE("Nearest-rank percentile edge cases", "[aggregator]") {
    SECTION("Single path reports its own value at every percentile") {
        std::vector<double> v = {42.0};
        REQUIRE(nearest_rank_percentile(v, 1.0) == 42.0);
        REQUIRE(nearest_rank_percentile(v, 99.0) == 42.0);
    }

    SECTION("Rank never falls below one") {
        std::vector<double> v = one_to(1000);
        REQUIRE(nearest_rank_percentile(v, 0.01) == 1.0);
    }

    SECTION("Empty sample") {
        std::vector<double> v;
        REQUIRE_THROWS_AS(nearest_rank_percentile(v, 50.0), std::invalid_argument);
    }
}

TEST_CASE("Flag percentage", "[aggregator]") {
    REQUIRE(flag_percentage({1.0, 0.0, 0.0, 1.0}) == 50.0);
    REQUIRE(flag_percentage({0.0, 0.0}) == 0.0);
    REQUIRE(flag_percentage({}) == 0.0);
}

// ============================================================================
// Aggregation
// ============================================================================

TEST_CASE("Aggregate reports bands, series and flags", "[aggregator]") {
    Scenario s = make_drawdown_scenario();
    RawMatrix m = make_ladder(20, 3);

    AggregatedResult r = aggregate(m, s, PolicyParams(30000.0, 1, 75), 99);

    REQUIRE(r.years == std::vector<int>({2025, 2026, 2027}));
    REQUIRE(r.net_worth_p10 == std::vector<double>(3, 2000.0));
    REQUIRE(r.net_worth_p50 == std::vector<double>(3, 10000.0));
    REQUIRE(r.net_worth_p90 == std::vector<double>(3, 18000.0));
    REQUIRE(r.metric("net_worth") == std::vector<double>(3, 15000.0));
    REQUIRE(r.metric("assets_depleted") == std::vector<double>(3, 25.0));
    REQUIRE_THROWS_AS(r.metric("no_such_metric"), std::out_of_range);

    SECTION("Echo fields") {
        REQUIRE(r.percentile == 75);
        REQUIRE(r.iterations == 20);
        REQUIRE(r.seed == 99);
        REQUIRE(r.start_year == 2025);
        REQUIRE(r.inflation_rate == 0.02);
        REQUIRE(r.annual_spend_target == 30000.0);
        REQUIRE(r.retirement_age_offset == 1);
        REQUIRE(r.retirement_years == std::vector<int>({1976}));
    }

    SECTION("Children have no retirement year") {
        s.people.push_back(make_child("robin", 2015, 5000.0));
        AggregatedResult with_child = aggregate(m, s, PolicyParams(30000.0, 1, 75), 99);
        REQUIRE(with_child.retirement_years == std::vector<int>({1976}));
    }

    SECTION("Every metric in the table is reported") {
        for (const auto& spec : metric_table()) {
            REQUIRE(r.series.count(spec.name) == 1);
            REQUIRE(r.series.at(spec.name).size() == 3);
        }
    }
}

TEST_CASE("Bands are ordered on a stochastic run", "[aggregator]") {
    Scenario s = make_drawdown_scenario();
    s.assets[1].growth_std = 0.2;
    s.assets[2].growth_mean = 0.04;
    s.assets[2].growth_std = 0.15;
    DrawTable draws = DrawTable::generate(s, 301, 8);
    auto matrix = run_monte_carlo(s, default_policy(s), draws);

    AggregatedResult r = aggregate(*matrix, s, default_policy(s), draws.seed());
    for (size_t y = 0; y < r.years.size(); ++y) {
        REQUIRE(r.net_worth_p10[y] <= r.net_worth_p50[y]);
        REQUIRE(r.net_worth_p50[y] <= r.net_worth_p90[y]);
        REQUIRE(r.metric("net_worth")[y] == r.net_worth_p50[y]);
    }
}

TEST_CASE("Arbitrary percentile series for one metric", "[aggregator]") {
    RawMatrix m = make_ladder(10, 2);
    REQUIRE(percentile_series(m, "net_worth", 30.0) == std::vector<double>(2, 3000.0));
    REQUIRE_THROWS_AS(percentile_series(m, "bogus", 30.0), std::out_of_range);
}

TEST_CASE("Aggregation rejects invalid percentiles", "[aggregator]") {
    Scenario s = make_drawdown_scenario();
    RawMatrix m = make_ladder(5, 2);
    REQUIRE_THROWS_AS(aggregate(m, s, PolicyParams(0.0, 0, 0), 1), ConfigurationError);
    REQUIRE_THROWS_AS(aggregate(m, s, PolicyParams(0.0, 0, 100), 1), ConfigurationError);
}

TEST_CASE("Identical inputs aggregate identically", "[aggregator]") {
    Scenario s = make_drawdown_scenario();
    RawMatrix m = make_ladder(7, 4);
    PolicyParams policy(10000.0, 0, 33);
    REQUIRE(aggregate(m, s, policy, 5) == aggregate(m, s, policy, 5));
    REQUIRE(aggregate(m, s, policy, 5) != aggregate(m, s, policy, 6));
}
