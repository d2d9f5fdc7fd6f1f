#include "metrics.hpp"
#include <stdexcept>

namespace nestegg {

#define NESTEGG_CONTINUOUS(field) \
    MetricSpec{#field, MetricKind::Continuous, [](const YearRecord& r) { return r.field; }}

#define NESTEGG_FLAG(field) \
    MetricSpec{#field, MetricKind::Flag, [](const YearRecord& r) { return r.field ? 1.0 : 0.0; }}

const std::vector<MetricSpec>& metric_table() {
    static const std::vector<MetricSpec> table = {
        NESTEGG_CONTINUOUS(salary_gross),
        NESTEGG_CONTINUOUS(salary_net),
        NESTEGG_CONTINUOUS(rental_income),
        NESTEGG_CONTINUOUS(rental_net),
        NESTEGG_CONTINUOUS(gift_income),
        NESTEGG_CONTINUOUS(state_pension_income),
        NESTEGG_CONTINUOUS(pension_income),
        NESTEGG_CONTINUOUS(total_income),
        NESTEGG_CONTINUOUS(income_tax),
        NESTEGG_CONTINUOUS(national_insurance),
        NESTEGG_CONTINUOUS(capital_gains_tax),
        NESTEGG_CONTINUOUS(total_tax),
        NESTEGG_CONTINUOUS(expenses),
        NESTEGG_CONTINUOUS(mortgage_payment),
        NESTEGG_CONTINUOUS(fun_fund),
        NESTEGG_CONTINUOUS(total_outflow),
        NESTEGG_CONTINUOUS(employee_pension_contributions),
        NESTEGG_CONTINUOUS(employer_pension_contributions),
        NESTEGG_CONTINUOUS(pension_contributions),
        NESTEGG_CONTINUOUS(isa_contributions),
        NESTEGG_CONTINUOUS(gia_contributions),
        NESTEGG_CONTINUOUS(isa_withdrawals),
        NESTEGG_CONTINUOUS(gia_withdrawals),
        NESTEGG_CONTINUOUS(pension_withdrawals),
        NESTEGG_CONTINUOUS(withdrawals_net),
        NESTEGG_CONTINUOUS(unfunded_shortfall),
        NESTEGG_CONTINUOUS(cash_return),
        NESTEGG_CONTINUOUS(isa_returns),
        NESTEGG_CONTINUOUS(gia_returns),
        NESTEGG_CONTINUOUS(pension_returns),
        NESTEGG_CONTINUOUS(investment_returns),
        NESTEGG_CONTINUOUS(cash_start),
        NESTEGG_CONTINUOUS(cash_balance),
        NESTEGG_CONTINUOUS(isa_balance),
        NESTEGG_CONTINUOUS(gia_balance),
        NESTEGG_CONTINUOUS(pension_balance),
        NESTEGG_CONTINUOUS(total_assets),
        NESTEGG_CONTINUOUS(mortgage_balance),
        NESTEGG_CONTINUOUS(total_liabilities),
        NESTEGG_CONTINUOUS(net_worth),
        NESTEGG_FLAG(mortgage_paid_off),
        NESTEGG_FLAG(assets_depleted),
    };
    return table;
}

#undef NESTEGG_CONTINUOUS
#undef NESTEGG_FLAG

const MetricSpec& find_metric(const std::string& name) {
    for (const auto& metric : metric_table()) {
        if (name == metric.name) {
            return metric;
        }
    }
    throw std::out_of_range("Unknown metric: " + name);
}

} // namespace nestegg
