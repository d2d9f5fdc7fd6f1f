#include "year_step.hpp"
#include "errors.hpp"
#include "metrics.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace nestegg {

namespace {

constexpr size_t NO_ASSET = std::numeric_limits<size_t>::max();
constexpr double SETTLED_EPSILON = 1e-9;

double grown(double balance, double r) {
    return balance * std::max(0.0, 1.0 + r);
}

/** Twelve monthly amortization steps; returns total paid */
double amortize_year(double& balance, const Mortgage& mortgage) {
    double monthly_rate = mortgage.annual_interest_rate / 12.0;
    double paid = 0.0;
    for (int month = 0; month < 12 && balance > 0.0; ++month) {
        double interest = balance * monthly_rate;
        double payment = std::min(mortgage.monthly_payment, balance + interest);
        balance = balance + interest - payment;
        paid += payment;
    }
    if (balance < 0.0) {
        balance = 0.0;
    }
    return paid;
}

} // anonymous namespace

// ============================================================================
// HouseholdState / YearRecord
// ============================================================================

HouseholdState::HouseholdState()
    : cash(0.0)
    , mortgage_balance(0.0)
{}

YearRecord::YearRecord()
    : year(0)
    , salary_gross(0.0), salary_net(0.0), rental_income(0.0), rental_net(0.0)
    , gift_income(0.0), state_pension_income(0.0), pension_income(0.0), total_income(0.0)
    , income_tax(0.0), national_insurance(0.0), capital_gains_tax(0.0), total_tax(0.0)
    , expenses(0.0), mortgage_payment(0.0), fun_fund(0.0), total_outflow(0.0)
    , employee_pension_contributions(0.0), employer_pension_contributions(0.0)
    , pension_contributions(0.0), isa_contributions(0.0), gia_contributions(0.0)
    , isa_withdrawals(0.0), gia_withdrawals(0.0), pension_withdrawals(0.0)
    , withdrawals_net(0.0), unfunded_shortfall(0.0)
    , cash_return(0.0), isa_returns(0.0), gia_returns(0.0), pension_returns(0.0)
    , investment_returns(0.0)
    , cash_start(0.0), cash_balance(0.0), isa_balance(0.0), gia_balance(0.0)
    , pension_balance(0.0), total_assets(0.0), mortgage_balance(0.0)
    , total_liabilities(0.0), net_worth(0.0)
    , mortgage_paid_off(false), assets_depleted(false)
{}

// ============================================================================
// YearStepEngine
// ============================================================================

YearStepEngine::YearStepEngine(const Scenario& scenario, const PolicyParams& policy)
    : scenario_(scenario)
    , policy_(policy)
    , cash_asset_(-1)
{
    scenario_.validate();
    policy_.validate();

    const size_t years = scenario_.num_years();
    const TaxCalculator base(scenario_.tax_bands);
    tax_by_year_.reserve(years);
    for (size_t k = 0; k < years; ++k) {
        if (scenario_.assumptions.tax_band_indexation == 0.0) {
            tax_by_year_.push_back(base);
        } else {
            double factor = std::pow(1.0 + scenario_.assumptions.tax_band_indexation,
                                     static_cast<double>(k));
            tax_by_year_.push_back(base.indexed(factor));
        }
    }

    for (const auto& income : scenario_.incomes) {
        income_owner_.push_back(scenario_.owner_index(income.person_id));
    }
    for (const auto& asset : scenario_.assets) {
        asset_owner_.push_back(scenario_.owner_index(asset.person_id));
    }

    std::vector<size_t> non_cash;
    for (size_t i = 0; i < scenario_.assets.size(); ++i) {
        if (scenario_.assets[i].type == AssetType::Cash) {
            if (cash_asset_ < 0) {
                cash_asset_ = static_cast<long>(i);
            }
        } else {
            non_cash.push_back(i);
        }
    }

    const auto& assets = scenario_.assets;
    std::stable_sort(non_cash.begin(), non_cash.end(), [&assets](size_t a, size_t b) {
        if (assets[a].withdrawal_priority != assets[b].withdrawal_priority) {
            return assets[a].withdrawal_priority < assets[b].withdrawal_priority;
        }
        return assets[a].id < assets[b].id;
    });
    withdrawal_order_ = non_cash;
    for (size_t i : non_cash) {
        if (assets[i].type == AssetType::Isa) isa_order_.push_back(i);
        if (assets[i].type == AssetType::Gia) gia_order_.push_back(i);
    }

    // Contributions go to the person's own pension (lowest id), else the
    // first household-level pension.
    pension_by_person_.assign(scenario_.people.size(), NO_ASSET);
    size_t household_pension = NO_ASSET;
    for (size_t i = 0; i < assets.size(); ++i) {
        if (assets[i].type != AssetType::Pension) continue;
        if (assets[i].person_id) {
            size_t& slot = pension_by_person_[asset_owner_[i]];
            if (slot == NO_ASSET || assets[i].id < assets[slot].id) {
                slot = i;
            }
        } else if (household_pension == NO_ASSET || assets[i].id < assets[household_pension].id) {
            household_pension = i;
        }
    }
    for (auto& slot : pension_by_person_) {
        if (slot == NO_ASSET) {
            slot = household_pension;
        }
    }
}

HouseholdState YearStepEngine::initial_state() const {
    HouseholdState state;
    state.balances.assign(scenario_.assets.size(), 0.0);
    state.cost_basis.assign(scenario_.assets.size(), 0.0);
    for (size_t i = 0; i < scenario_.assets.size(); ++i) {
        const Asset& asset = scenario_.assets[i];
        if (asset.type == AssetType::Cash) {
            state.cash += asset.balance;
            continue;
        }
        state.balances[i] = asset.balance;
        if (asset.type == AssetType::Gia) {
            state.cost_basis[i] = asset.cost_basis ? *asset.cost_basis : asset.balance;
        }
    }
    state.mortgage_balance = scenario_.mortgage ? scenario_.mortgage->balance : 0.0;
    state.retired.assign(scenario_.people.size(), false);
    return state;
}

YearRecord YearStepEngine::step(HouseholdState& state, size_t year_index,
                                const double* returns) const {
    const Assumptions& assumptions = scenario_.assumptions;
    const TaxCalculator& tax = tax_by_year_.at(year_index);
    const size_t n_people = scenario_.people.size();
    const int year = scenario_.year_at(year_index);
    const double inflation_factor = std::pow(1.0 + assumptions.inflation_rate,
                                             static_cast<double>(year_index));

    YearRecord rec;
    rec.year = year;
    rec.cash_start = state.cash;

    // 1. Retirement status; children never count, and a household of
    // children only is never retired
    bool all_retired = true;
    bool has_adults = false;
    for (size_t p = 0; p < n_people; ++p) {
        const Person& person = scenario_.people[p];
        if (person.is_child) {
            state.retired[p] = false;
            continue;
        }
        has_adults = true;
        state.retired[p] = person.is_retired_in_year(year, policy_.retirement_age_offset);
        all_retired = all_retired && state.retired[p];
    }
    all_retired = all_retired && has_adults;

    // 2-3. Salary, then rental and gifts, taxed per person in that order
    std::vector<double> gross(n_people, 0.0);
    std::vector<double> employee(n_people, 0.0);
    std::vector<double> employer(n_people, 0.0);
    std::vector<double> taxable(n_people, 0.0);

    for (size_t i = 0; i < scenario_.incomes.size(); ++i) {
        const IncomeSource& income = scenario_.incomes[i];
        if (income.kind != IncomeKind::Salary) continue;
        size_t p = income_owner_[i];
        if (state.retired[p] || !income.active_in_year(year)) continue;
        double amount = income.amount_in_year(year, assumptions.start_year);
        gross[p] += amount;
        if (pension_by_person_[p] != NO_ASSET) {
            employee[p] += amount * income.employee_pension_pct;
            employer[p] += amount * income.employer_pension_pct;
        }
    }

    for (size_t p = 0; p < n_people; ++p) {
        if (gross[p] <= 0.0) continue;
        SalaryTax salary = tax.salary(gross[p], employee[p]);
        rec.salary_gross += salary.gross;
        rec.salary_net += salary.net;
        rec.income_tax += salary.income_tax;
        rec.national_insurance += salary.national_insurance;
        taxable[p] = salary.taxable;

        double contribution = salary.pension_deduction + employer[p];
        state.balances[pension_by_person_[p]] += contribution;
        rec.employee_pension_contributions += salary.pension_deduction;
        rec.employer_pension_contributions += employer[p];
    }
    rec.pension_contributions = rec.employee_pension_contributions + rec.employer_pension_contributions;

    for (size_t i = 0; i < scenario_.incomes.size(); ++i) {
        const IncomeSource& income = scenario_.incomes[i];
        if (income.kind == IncomeKind::Salary || !income.active_in_year(year)) continue;
        double amount = income.amount_in_year(year, assumptions.start_year);
        if (income.kind == IncomeKind::Rental) {
            size_t p = income_owner_[i];
            double rental_tax = tax.marginal_income_tax(taxable[p], amount);
            taxable[p] += amount;
            rec.rental_income += amount;
            rec.rental_net += amount - rental_tax;
            rec.income_tax += rental_tax;
        } else {
            rec.gift_income += amount;
        }
    }

    // 4. State pension, untaxed here but stacked under any drawdown
    for (size_t p = 0; p < n_people; ++p) {
        const Person& person = scenario_.people[p];
        if (person.is_child || !person.is_state_pension_eligible_in_year(year)) continue;
        double amount = assumptions.state_pension_annual * inflation_factor;
        rec.state_pension_income += amount;
        taxable[p] += amount;
    }

    // 5-6. Outflows
    if (scenario_.mortgage) {
        rec.mortgage_payment = amortize_year(state.mortgage_balance, *scenario_.mortgage);
    }
    for (const auto& expense : scenario_.expenses) {
        if (!expense.active_in_year(year)) continue;
        double annual = expense.monthly_amount * 12.0;
        rec.expenses += expense.inflation_linked ? annual * inflation_factor : annual;
    }
    for (const auto& person : scenario_.people) {
        if (person.is_dependent_in_year(year)) {
            rec.expenses += person.annual_cost * inflation_factor;
        }
    }
    rec.fun_fund = all_retired ? policy_.annual_spend_target : 0.0;
    rec.total_outflow = rec.expenses + rec.mortgage_payment + rec.fun_fund;

    // 7. Net flow lands in cash
    double cash = state.cash + rec.salary_net + rec.rental_net + rec.gift_income +
                  rec.state_pension_income - rec.total_outflow;

    // 8. Withdrawal waterfall
    if (cash < 0.0) {
        double cgt_allowance = tax.bands().cgt_annual_allowance;
        for (size_t i : withdrawal_order_) {
            if (cash >= -SETTLED_EPSILON) break;
            double balance = state.balances[i];
            if (balance <= 0.0) continue;
            double shortfall = -cash;
            const Asset& asset = scenario_.assets[i];

            if (asset.type == AssetType::Isa) {
                double amount = std::min(balance, shortfall);
                state.balances[i] = (amount >= balance) ? 0.0 : balance - amount;
                rec.isa_withdrawals += amount;
                rec.withdrawals_net += amount;
                cash += amount;
            } else if (asset.type == AssetType::Gia) {
                GiaWithdrawalTax sale = tax.gia_withdrawal_for_net(
                    shortfall, balance, state.cost_basis[i], cgt_allowance);
                double sold_fraction = sale.gross / balance;
                state.balances[i] = (sale.gross >= balance) ? 0.0 : balance - sale.gross;
                state.cost_basis[i] *= (1.0 - sold_fraction);
                cgt_allowance -= sale.allowance_used;
                rec.gia_withdrawals += sale.gross;
                rec.capital_gains_tax += sale.tax;
                rec.withdrawals_net += sale.net;
                cash += sale.net;
            } else if (asset.type == AssetType::Pension) {
                size_t p = asset_owner_[i];
                if (!scenario_.people[p].can_access_pension_in_year(year, assumptions.pension_access_age)) {
                    continue;
                }
                DrawdownTax drawdown = tax.pension_drawdown_for_net(shortfall, taxable[p], balance);
                state.balances[i] = (drawdown.gross >= balance) ? 0.0 : balance - drawdown.gross;
                taxable[p] += drawdown.taxable;
                rec.pension_withdrawals += drawdown.gross;
                rec.income_tax += drawdown.tax;
                rec.pension_income += drawdown.net;
                rec.withdrawals_net += drawdown.net;
                cash += drawdown.net;
            }
        }
        if (cash < 0.0) {
            rec.unfunded_shortfall = -cash;
            cash = 0.0;
        }
    }

    // 9. Surplus sweep above the emergency fund: ISAs, then GIAs
    double emergency_target = assumptions.emergency_fund_months * rec.total_outflow / 12.0;
    if (cash > emergency_target) {
        double surplus = cash - emergency_target;
        double isa_allowance = assumptions.isa_annual_limit;

        auto eligible = [&](size_t i) {
            const Asset& asset = scenario_.assets[i];
            if (!asset.contributions_stop_at_retirement) return true;
            return asset.person_id ? !state.retired[asset_owner_[i]] : !all_retired;
        };

        for (size_t i : isa_order_) {
            if (surplus <= 0.0 || isa_allowance <= 0.0) break;
            if (!eligible(i)) continue;
            double cap = scenario_.assets[i].annual_contribution_cap;
            double room = cap > 0.0 ? std::min(cap, isa_allowance) : isa_allowance;
            double amount = std::min(surplus, room);
            state.balances[i] += amount;
            isa_allowance -= amount;
            surplus -= amount;
            rec.isa_contributions += amount;
        }
        for (size_t i : gia_order_) {
            if (surplus <= 0.0) break;
            if (!eligible(i)) continue;
            double cap = scenario_.assets[i].annual_contribution_cap;
            double amount = cap > 0.0 ? std::min(surplus, cap) : surplus;
            state.balances[i] += amount;
            state.cost_basis[i] += amount;
            surplus -= amount;
            rec.gia_contributions += amount;
        }
        cash -= rec.isa_contributions + rec.gia_contributions;
    }

    // 10. Growth
    if (cash_asset_ >= 0) {
        double grown_cash = grown(cash, returns[cash_asset_]);
        rec.cash_return = grown_cash - cash;
        cash = grown_cash;
    }
    for (size_t i = 0; i < scenario_.assets.size(); ++i) {
        AssetType type = scenario_.assets[i].type;
        if (type == AssetType::Cash) continue;
        double before = state.balances[i];
        state.balances[i] = grown(before, returns[i]);
        double gain = state.balances[i] - before;
        if (type == AssetType::Isa) {
            rec.isa_returns += gain;
            rec.isa_balance += state.balances[i];
        } else if (type == AssetType::Gia) {
            rec.gia_returns += gain;
            rec.gia_balance += state.balances[i];
        } else {
            rec.pension_returns += gain;
            rec.pension_balance += state.balances[i];
        }
    }
    state.cash = cash;

    // 11. Totals and flags
    rec.investment_returns = rec.isa_returns + rec.gia_returns + rec.pension_returns + rec.cash_return;
    rec.total_income = rec.salary_net + rec.rental_net + rec.gift_income +
                       rec.state_pension_income + rec.pension_income;
    rec.total_tax = rec.income_tax + rec.national_insurance + rec.capital_gains_tax;
    rec.cash_balance = state.cash;
    rec.total_assets = rec.cash_balance + rec.isa_balance + rec.gia_balance + rec.pension_balance;
    rec.mortgage_balance = state.mortgage_balance;
    rec.total_liabilities = rec.mortgage_balance;
    rec.net_worth = rec.total_assets - rec.total_liabilities;
    rec.mortgage_paid_off = rec.mortgage_balance <= 0.0;
    rec.assets_depleted = rec.unfunded_shortfall > SHORTFALL_TOLERANCE;

    check_finite(rec, state);
    return rec;
}

void YearStepEngine::check_finite(const YearRecord& record, const HouseholdState& state) const {
    for (const auto& metric : metric_table()) {
        if (!std::isfinite(metric.extract(record))) {
            throw NumericError(NumericError::UNKNOWN_PATH, record.year, metric.name);
        }
    }
    for (size_t i = 0; i < state.balances.size(); ++i) {
        if (!std::isfinite(state.balances[i]) || !std::isfinite(state.cost_basis[i])) {
            throw NumericError(NumericError::UNKNOWN_PATH, record.year,
                               "assets[" + std::to_string(i) + "].balance");
        }
    }
}

} // namespace nestegg
