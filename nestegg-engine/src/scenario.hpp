#ifndef NESTEGG_SCENARIO_HPP
#define NESTEGG_SCENARIO_HPP

#include "tax_calculator.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace nestegg {

enum class IncomeKind : uint8_t {
    Salary = 0,
    Rental = 1,
    Gift = 2
};

enum class AssetType : uint8_t {
    Cash = 0,
    Isa = 1,
    Gia = 2,
    Pension = 3
};

std::string to_string(IncomeKind kind);
std::string to_string(AssetType type);

/** Case-insensitive; throws ConfigurationError on unknown names */
IncomeKind income_kind_from_string(const std::string& name, const std::string& field);
AssetType asset_type_from_string(const std::string& name, const std::string& field);

struct Person {
    std::string id;
    std::string label;
    int birth_year;
    int birth_month;
    int birth_day;
    int planned_retirement_age;
    int state_pension_age;

    // Dependent child: never retires, earns or draws a state pension
    bool is_child;
    double annual_cost;           // at start_year prices, inflation linked
    int leaves_household_age;

    Person();

    /** Age attained during the calendar year */
    int age_in_year(int year) const { return year - birth_year; }

    /** Planned retirement age shifted by offset, clamped to [0, INT_MAX] */
    int retirement_age(int offset) const;
    int retirement_year(int offset) const;

    bool is_retired_in_year(int year, int offset) const;
    bool is_state_pension_eligible_in_year(int year) const;
    bool can_access_pension_in_year(int year, int access_age) const;

    /** Child aged at least 0 and below leaves_household_age */
    bool is_dependent_in_year(int year) const;
};

struct IncomeSource {
    std::string id;
    IncomeKind kind;
    std::optional<std::string> person_id;
    double gross_annual;
    double growth_rate;
    double employee_pension_pct;
    double employer_pension_pct;
    std::optional<int> start_year;   // inclusive
    std::optional<int> end_year;     // inclusive

    IncomeSource();

    bool active_in_year(int year) const;

    /** Gross amount for year, compounded from the projection start year */
    double amount_in_year(int year, int projection_start_year) const;
};

struct Asset {
    std::string id;
    std::string name;
    AssetType type;
    double balance;
    double annual_contribution_cap;     // 0 means uncapped
    std::optional<double> growth_mean;  // falls back to the equity assumption
    std::optional<double> growth_std;
    int withdrawal_priority;            // lower is withdrawn first
    bool contributions_stop_at_retirement;
    std::optional<std::string> person_id;
    std::optional<double> cost_basis;   // GIA only, defaults to balance

    Asset();
};

struct Mortgage {
    double balance;
    double annual_interest_rate;
    double monthly_payment;

    Mortgage();
};

struct Expense {
    std::string name;
    double monthly_amount;
    bool inflation_linked;
    std::optional<int> start_year;
    std::optional<int> end_year;

    Expense();

    bool active_in_year(int year) const;
};

struct Assumptions {
    double inflation_rate;
    double equity_return_mean;
    double equity_return_std;
    double isa_annual_limit;
    double state_pension_annual;
    int pension_access_age;
    int start_year;
    int end_year;                  // inclusive
    double annual_spend_target;    // default spend once everyone is retired
    double emergency_fund_months;
    double tax_band_indexation;

    Assumptions();
};

/**
 * @brief Complete household definition for one projection
 *
 * Immutable once handed to a session. validate() rejects everything the
 * engine cannot simulate, so the year loop never re-checks inputs.
 */
struct Scenario {
    std::string scenario_id;
    std::vector<Person> people;
    std::vector<IncomeSource> incomes;
    std::vector<Asset> assets;
    std::optional<Mortgage> mortgage;
    std::vector<Expense> expenses;
    Assumptions assumptions;
    TaxBands tax_bands;

    Scenario();

    size_t num_years() const;
    int year_at(size_t year_index) const { return assumptions.start_year + static_cast<int>(year_index); }

    /** Index of the person with id; throws ConfigurationError if missing */
    size_t person_index(const std::string& id) const;

    /** Owner index, or the first adult when the owner is unspecified */
    size_t owner_index(const std::optional<std::string>& person_id) const;

    /** Expected return for asset, after the equity/cash fallback */
    double asset_growth_mean(size_t asset_index) const;
    double asset_growth_std(size_t asset_index) const;

    /** Throws ConfigurationError on the first invalid field */
    void validate() const;
};

} // namespace nestegg

#endif // NESTEGG_SCENARIO_HPP
