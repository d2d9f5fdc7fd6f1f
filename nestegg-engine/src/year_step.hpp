#ifndef NESTEGG_YEAR_STEP_HPP
#define NESTEGG_YEAR_STEP_HPP

#include "policy.hpp"
#include "scenario.hpp"
#include "tax_calculator.hpp"
#include <cstddef>
#include <vector>

namespace nestegg {

/**
 * @brief Mutable household position carried between years of one path
 *
 * All CASH assets are pooled into cash; balances is indexed by scenario
 * asset and holds zero for CASH entries.
 */
struct HouseholdState {
    double cash;
    std::vector<double> balances;
    std::vector<double> cost_basis;    // tracked for GIA assets only
    double mortgage_balance;
    std::vector<bool> retired;         // per person, always false for children

    HouseholdState();
};

/**
 * @brief Everything that happened to the household in one simulated year
 *
 * Balances are end-of-year, after growth. Withdrawals are gross amounts
 * taken from the asset. Cash conservation holds exactly:
 *
 *   cash_balance = cash_start + salary_net + rental_net + gift_income
 *                + state_pension_income + withdrawals_net - total_outflow
 *                - isa_contributions - gia_contributions + cash_return
 *                + unfunded_shortfall
 */
struct YearRecord {
    int year;

    // Income
    double salary_gross;
    double salary_net;
    double rental_income;
    double rental_net;
    double gift_income;
    double state_pension_income;
    double pension_income;             // net of tax, from drawdown
    double total_income;

    // Tax
    double income_tax;
    double national_insurance;
    double capital_gains_tax;
    double total_tax;

    // Outflows
    double expenses;                   // scheduled expenses and child costs, excluding mortgage
    double mortgage_payment;
    double fun_fund;                   // retirement spend target
    double total_outflow;

    // Contributions
    double employee_pension_contributions;
    double employer_pension_contributions;
    double pension_contributions;
    double isa_contributions;
    double gia_contributions;

    // Withdrawals
    double isa_withdrawals;
    double gia_withdrawals;
    double pension_withdrawals;
    double withdrawals_net;
    double unfunded_shortfall;

    // Growth
    double cash_return;
    double isa_returns;
    double gia_returns;
    double pension_returns;
    double investment_returns;

    // Balances
    double cash_start;
    double cash_balance;
    double isa_balance;
    double gia_balance;
    double pension_balance;
    double total_assets;
    double mortgage_balance;
    double total_liabilities;
    double net_worth;

    // Flags
    bool mortgage_paid_off;
    bool assets_depleted;

    YearRecord();
};

/**
 * @brief Advances a household by one year for a fixed scenario and policy
 *
 * Construction resolves owners, withdrawal and contribution orders, and the
 * indexed tax table for every year, so step() does no validation. One
 * engine is shared read-only by every path of a run.
 */
class YearStepEngine {
public:
    /** Residual shortfall below this is rounding, not depletion */
    static constexpr double SHORTFALL_TOLERANCE = 0.01;

    YearStepEngine(const Scenario& scenario, const PolicyParams& policy);

    HouseholdState initial_state() const;

    /**
     * Apply year year_index to state using one return per scenario asset.
     * Throws NumericError if any output is not finite.
     */
    YearRecord step(HouseholdState& state, size_t year_index, const double* returns) const;

    const Scenario& scenario() const { return scenario_; }
    const PolicyParams& policy() const { return policy_; }

    /** Non-cash assets in withdrawal order: priority, then asset id */
    const std::vector<size_t>& withdrawal_order() const { return withdrawal_order_; }

private:
    void check_finite(const YearRecord& record, const HouseholdState& state) const;

    const Scenario& scenario_;
    PolicyParams policy_;
    std::vector<TaxCalculator> tax_by_year_;
    std::vector<size_t> income_owner_;
    std::vector<size_t> asset_owner_;
    std::vector<size_t> withdrawal_order_;
    std::vector<size_t> isa_order_;
    std::vector<size_t> gia_order_;
    std::vector<size_t> pension_by_person_;   // first pension per person, or npos
    long cash_asset_;                         // first CASH asset, or -1
};

} // namespace nestegg

#endif // NESTEGG_YEAR_STEP_HPP
