#ifndef NESTEGG_TEST_FIXTURES_HPP
#define NESTEGG_TEST_FIXTURES_HPP

#include "scenario.hpp"
#include "year_step.hpp"
#include <cmath>
#include <string>

namespace nestegg {
namespace testing {

inline Person make_person(const std::string& id, int birth_year, int retirement_age) {
    Person person;
    person.id = id;
    person.label = id;
    person.birth_year = birth_year;
    person.planned_retirement_age = retirement_age;
    person.state_pension_age = 67;
    return person;
}

inline Person make_child(const std::string& id, int birth_year, double annual_cost,
                         int leaves_household_age = 18) {
    Person child = make_person(id, birth_year, 0);
    child.is_child = true;
    child.annual_cost = annual_cost;
    child.leaves_household_age = leaves_household_age;
    return child;
}

inline Asset make_asset(const std::string& id, AssetType type, double balance,
                        double mean, double std_dev, int priority) {
    Asset asset;
    asset.id = id;
    asset.name = id;
    asset.type = type;
    asset.balance = balance;
    asset.growth_mean = mean;
    asset.growth_std = std_dev;
    asset.withdrawal_priority = priority;
    return asset;
}

inline IncomeSource make_salary(const std::string& id, const std::string& person_id, double gross,
                                double employee_pct, double employer_pct) {
    IncomeSource income;
    income.id = id;
    income.kind = IncomeKind::Salary;
    income.person_id = person_id;
    income.gross_annual = gross;
    income.employee_pension_pct = employee_pct;
    income.employer_pension_pct = employer_pct;
    return income;
}

/**
 * Single earner aged 45 in 2025, salary 60,000 (5% employee, 3% employer
 * pension), ISA 50,000 at 5%, pension 150,000 at 4%, all deterministic.
 * Five years, no expenses.
 */
inline Scenario make_accumulation_scenario() {
    Scenario s;
    s.scenario_id = "accumulation";
    s.people.push_back(make_person("alex", 1980, 60));
    s.incomes.push_back(make_salary("job", "alex", 60000.0, 0.05, 0.03));
    s.assets.push_back(make_asset("cash", AssetType::Cash, 0.0, 0.0, 0.0, 0));
    s.assets.push_back(make_asset("isa", AssetType::Isa, 50000.0, 0.05, 0.0, 1));
    Asset pension = make_asset("pension", AssetType::Pension, 150000.0, 0.04, 0.0, 2);
    pension.person_id = "alex";
    s.assets.push_back(pension);
    s.assumptions.inflation_rate = 0.02;
    s.assumptions.start_year = 2025;
    s.assumptions.end_year = 2029;
    return s;
}

/**
 * Retired at 50 in 2025 with no income: cash 20,000, ISA 50,000 and
 * pension 150,000, all at zero growth. Pension opens at 55 (2030).
 * Ten years.
 */
inline Scenario make_drawdown_scenario() {
    Scenario s;
    s.scenario_id = "drawdown";
    s.people.push_back(make_person("sam", 1975, 0));
    s.assets.push_back(make_asset("cash", AssetType::Cash, 20000.0, 0.0, 0.0, 0));
    s.assets.push_back(make_asset("isa", AssetType::Isa, 50000.0, 0.0, 0.0, 1));
    Asset pension = make_asset("pension", AssetType::Pension, 150000.0, 0.0, 0.0, 2);
    pension.person_id = "sam";
    s.assets.push_back(pension);
    s.assumptions.inflation_rate = 0.02;
    s.assumptions.start_year = 2025;
    s.assumptions.end_year = 2034;
    s.assumptions.annual_spend_target = 30000.0;
    return s;
}

/** Difference between reported end cash and the cash-flow identity */
inline double conservation_error(const YearRecord& r) {
    double expected = r.cash_start + r.salary_net + r.rental_net + r.gift_income +
                      r.state_pension_income + r.withdrawals_net - r.total_outflow -
                      r.isa_contributions - r.gia_contributions + r.cash_return +
                      r.unfunded_shortfall;
    return std::fabs(r.cash_balance - expected);
}

} // namespace testing
} // namespace nestegg

#endif // NESTEGG_TEST_FIXTURES_HPP
