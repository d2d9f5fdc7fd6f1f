#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <limits>
#include "scenario.hpp"
#include "policy.hpp"
#include "year_step.hpp"
#include "errors.hpp"
#include "fixtures.hpp"

using namespace nestegg;
using namespace nestegg::testing;
using Catch::Matchers::WithinRel;

namespace {

std::string validation_field(const Scenario& scenario) {
    try {
        scenario.validate();
    } catch (const ConfigurationError& e) {
        return e.field();
    }
    return "";
}

} // anonymous namespace

// ============================================================================
// Person
// ============================================================================

TEST_CASE("Person age and retirement", "[scenario]") {
    Person p = make_person("alex", 1980, 60);

    REQUIRE(p.age_in_year(2025) == 45);
    REQUIRE(p.retirement_year(0) == 2040);
    REQUIRE_FALSE(p.is_retired_in_year(2039, 0));
    REQUIRE(p.is_retired_in_year(2040, 0));

    SECTION("Offset shifts retirement") {
        REQUIRE(p.retirement_age(3) == 63);
        REQUIRE_FALSE(p.is_retired_in_year(2042, 3));
        REQUIRE(p.is_retired_in_year(2043, 3));
    }

    SECTION("Retirement age never goes negative") {
        REQUIRE(p.retirement_age(-100) == 0);
        REQUIRE(p.is_retired_in_year(1980, -100));
    }

    SECTION("Extreme offsets clamp instead of overflowing") {
        REQUIRE(p.retirement_age(std::numeric_limits<int>::max()) == std::numeric_limits<int>::max());
        REQUIRE(p.retirement_age(std::numeric_limits<int>::min()) == 0);
        REQUIRE(p.retirement_year(std::numeric_limits<int>::max()) == std::numeric_limits<int>::max());
        REQUIRE_FALSE(p.is_retired_in_year(2200, std::numeric_limits<int>::max()));
    }

    SECTION("Children are dependents until they leave home") {
        Person child = make_child("robin", 2010, 5000.0, 18);
        REQUIRE_FALSE(child.is_dependent_in_year(2009));
        REQUIRE(child.is_dependent_in_year(2010));
        REQUIRE(child.is_dependent_in_year(2027));
        REQUIRE_FALSE(child.is_dependent_in_year(2028));
        REQUIRE_FALSE(p.is_dependent_in_year(1990));
    }

    SECTION("Pension access is inclusive of the access age") {
        REQUIRE_FALSE(p.can_access_pension_in_year(2034, 55));
        REQUIRE(p.can_access_pension_in_year(2035, 55));
    }

    SECTION("State pension eligibility") {
        REQUIRE_FALSE(p.is_state_pension_eligible_in_year(2046));
        REQUIRE(p.is_state_pension_eligible_in_year(2047));
    }
}

// ============================================================================
// Income and expense windows
// ============================================================================

TEST_CASE("Income windows are inclusive and amounts compound", "[scenario]") {
    IncomeSource income = make_salary("job", "alex", 10000.0, 0.0, 0.0);
    income.growth_rate = 0.10;
    income.start_year = 2026;
    income.end_year = 2028;

    REQUIRE_FALSE(income.active_in_year(2025));
    REQUIRE(income.active_in_year(2026));
    REQUIRE(income.active_in_year(2028));
    REQUIRE_FALSE(income.active_in_year(2029));

    REQUIRE(income.amount_in_year(2025, 2025) == 10000.0);
    REQUIRE_THAT(income.amount_in_year(2027, 2025), WithinRel(12100.0, 1e-12));
}

TEST_CASE("Expense windows", "[scenario]") {
    Expense e;
    e.monthly_amount = 100.0;
    e.end_year = 2030;

    REQUIRE(e.active_in_year(1900));
    REQUIRE(e.active_in_year(2030));
    REQUIRE_FALSE(e.active_in_year(2031));
}

// ============================================================================
// Growth fallback
// ============================================================================

TEST_CASE("Asset growth falls back to the equity assumption", "[scenario]") {
    Scenario s = make_accumulation_scenario();
    s.assets[1].growth_mean.reset();
    s.assets[1].growth_std.reset();
    s.assets[0].growth_mean.reset();
    s.assets[0].growth_std.reset();
    s.assumptions.equity_return_mean = 0.06;
    s.assumptions.equity_return_std = 0.12;

    REQUIRE(s.asset_growth_mean(1) == 0.06);
    REQUIRE(s.asset_growth_std(1) == 0.12);
    // Cash defaults to zero growth
    REQUIRE(s.asset_growth_mean(0) == 0.0);
    REQUIRE(s.asset_growth_std(0) == 0.0);
    // Explicit values win
    REQUIRE(s.asset_growth_mean(2) == 0.04);
}

TEST_CASE("Scenario years are inclusive", "[scenario]") {
    Scenario s = make_accumulation_scenario();
    REQUIRE(s.num_years() == 5);
    REQUIRE(s.year_at(0) == 2025);
    REQUIRE(s.year_at(4) == 2029);
}

// ============================================================================
// Validation
// ============================================================================

TEST_CASE("Valid fixtures pass validation", "[scenario][validation]") {
    REQUIRE_NOTHROW(make_accumulation_scenario().validate());
    REQUIRE_NOTHROW(make_drawdown_scenario().validate());
}

TEST_CASE("Validation names the offending field", "[scenario][validation]") {
    Scenario s = make_accumulation_scenario();

    SECTION("End year not after start year") {
        s.assumptions.end_year = s.assumptions.start_year;
        REQUIRE(validation_field(s) == "assumptions.end_year");
    }

    SECTION("Negative growth standard deviation") {
        s.assets[2].growth_std = -0.1;
        REQUIRE(validation_field(s) == "assets[2].growth_rate_std");
    }

    SECTION("No people") {
        s.people.clear();
        REQUIRE(validation_field(s) == "people");
    }

    SECTION("Duplicate asset ids") {
        s.assets[1].id = "cash";
        REQUIRE(validation_field(s) == "assets[1].id");
    }

    SECTION("Unknown income owner") {
        s.incomes[0].person_id = "nobody";
        REQUIRE(validation_field(s) == "incomes[0].person_id");
    }

    SECTION("Salary owned by a child") {
        s.people.push_back(make_child("robin", 2015, 5000.0));
        s.incomes[0].person_id = "robin";
        REQUIRE(validation_field(s) == "incomes[0].person_id");
    }

    SECTION("Negative child cost") {
        s.people.push_back(make_child("robin", 2015, -1.0));
        REQUIRE(validation_field(s) == "people[1].annual_cost");
    }

    SECTION("Pension percentage out of range") {
        s.incomes[0].employee_pension_pct = 1.5;
        REQUIRE(validation_field(s) == "incomes[0].employee_pension_pct");
    }

    SECTION("Negative balance") {
        s.assets[1].balance = -1.0;
        REQUIRE(validation_field(s) == "assets[1].balance");
    }

    SECTION("Reversed expense window") {
        Expense e;
        e.start_year = 2030;
        e.end_year = 2029;
        s.expenses.push_back(e);
        REQUIRE(validation_field(s) == "expenses[0].end_year");
    }

    SECTION("Malformed tax table") {
        s.tax_bands.cgt_rate = 2.0;
        REQUIRE(validation_field(s) == "tax.cgt_rate");
    }
}

TEST_CASE("Enum names round-trip case-insensitively", "[scenario]") {
    REQUIRE(asset_type_from_string("pension", "type") == AssetType::Pension);
    REQUIRE(asset_type_from_string("Isa", "type") == AssetType::Isa);
    REQUIRE(to_string(AssetType::Gia) == "GIA");
    REQUIRE(income_kind_from_string("RENTAL", "kind") == IncomeKind::Rental);
    REQUIRE_THROWS_AS(asset_type_from_string("crypto", "type"), ConfigurationError);
}

// ============================================================================
// Policy parameters
// ============================================================================

TEST_CASE("Partial policy overrides merge over the base", "[policy]") {
    PolicyParams base(30000.0, 2, 50);

    PartialPolicyParams overrides;
    REQUIRE(overrides.empty());
    REQUIRE(merge(base, overrides) == base);

    overrides.retirement_age_offset = -1;
    PolicyParams merged = merge(base, overrides);
    REQUIRE(merged.annual_spend_target == 30000.0);
    REQUIRE(merged.retirement_age_offset == -1);
    REQUIRE(merged.percentile == 50);

    SECTION("Percentile bounds") {
        REQUIRE_NOTHROW(PolicyParams(0.0, 0, 1).validate());
        REQUIRE_NOTHROW(PolicyParams(0.0, 0, 99).validate());
        REQUIRE_THROWS_AS(PolicyParams(0.0, 0, 0).validate(), ConfigurationError);
        REQUIRE_THROWS_AS(PolicyParams(0.0, 0, 100).validate(), ConfigurationError);
    }

    SECTION("Retirement offset bounds") {
        REQUIRE_NOTHROW(PolicyParams(0.0, 100, 50).validate());
        REQUIRE_NOTHROW(PolicyParams(0.0, -100, 50).validate());
        REQUIRE_THROWS_AS(PolicyParams(0.0, 101, 50).validate(), ConfigurationError);
        REQUIRE_THROWS_AS(PolicyParams(0.0, -101, 50).validate(), ConfigurationError);

        Scenario s = make_accumulation_scenario();
        try {
            YearStepEngine engine(s, PolicyParams(0.0, std::numeric_limits<int>::max(), 50));
            FAIL("expected ConfigurationError");
        } catch (const ConfigurationError& e) {
            REQUIRE(e.field() == "retirement_age_offset");
        }
    }

    SECTION("Default policy takes the scenario spend target") {
        Scenario s = make_drawdown_scenario();
        REQUIRE(default_policy(s).annual_spend_target == 30000.0);
    }
}
