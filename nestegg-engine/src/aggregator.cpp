#include "aggregator.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace nestegg {

AggregatedResult::AggregatedResult()
    : percentile(50)
    , start_year(0)
    , inflation_rate(0.0)
    , iterations(0)
    , seed(0)
    , annual_spend_target(0.0)
    , retirement_age_offset(0)
{}

const std::vector<double>& AggregatedResult::metric(const std::string& name) const {
    auto it = series.find(name);
    if (it == series.end()) {
        throw std::out_of_range("Unknown metric: " + name);
    }
    return it->second;
}

bool AggregatedResult::operator==(const AggregatedResult& other) const {
    return years == other.years &&
           percentile == other.percentile &&
           series == other.series &&
           net_worth_p10 == other.net_worth_p10 &&
           net_worth_p50 == other.net_worth_p50 &&
           net_worth_p90 == other.net_worth_p90 &&
           start_year == other.start_year &&
           inflation_rate == other.inflation_rate &&
           retirement_years == other.retirement_years &&
           iterations == other.iterations &&
           seed == other.seed &&
           annual_spend_target == other.annual_spend_target &&
           retirement_age_offset == other.retirement_age_offset;
}

double nearest_rank_percentile(std::vector<double>& values, double percentile) {
    if (values.empty()) {
        throw std::invalid_argument("Cannot take a percentile of an empty sample");
    }
    const size_t n = values.size();
    double exact = percentile * static_cast<double>(n) / 100.0;
    size_t rank = static_cast<size_t>(std::ceil(exact));
    rank = std::min(std::max<size_t>(rank, 1), n);
    auto nth = values.begin() + static_cast<std::ptrdiff_t>(rank - 1);
    std::nth_element(values.begin(), nth, values.end());
    return *nth;
}

double flag_percentage(const std::vector<double>& values) {
    if (values.empty()) {
        return 0.0;
    }
    size_t set = 0;
    for (double v : values) {
        if (v != 0.0) {
            ++set;
        }
    }
    return 100.0 * static_cast<double>(set) / static_cast<double>(values.size());
}

std::vector<double> percentile_series(const RawMatrix& matrix, const std::string& metric,
                                      double percentile) {
    const MetricSpec& spec = find_metric(metric);
    std::vector<double> out(matrix.num_years());
    for (size_t y = 0; y < matrix.num_years(); ++y) {
        std::vector<double> column = matrix.column(y, spec);
        out[y] = nearest_rank_percentile(column, percentile);
    }
    return out;
}

AggregatedResult aggregate(const RawMatrix& matrix, const Scenario& scenario,
                           const PolicyParams& policy, uint64_t seed) {
    policy.validate();
    if (matrix.num_paths() == 0) {
        throw ConfigurationError("iterations", "must be at least 1");
    }

    AggregatedResult result;
    const size_t years = matrix.num_years();
    const double pct = static_cast<double>(policy.percentile);

    result.percentile = policy.percentile;
    result.start_year = matrix.start_year();
    result.inflation_rate = scenario.assumptions.inflation_rate;
    result.iterations = matrix.num_paths();
    result.seed = seed;
    result.annual_spend_target = policy.annual_spend_target;
    result.retirement_age_offset = policy.retirement_age_offset;
    for (const auto& person : scenario.people) {
        if (person.is_child) continue;
        result.retirement_years.push_back(person.retirement_year(policy.retirement_age_offset));
    }

    result.years.resize(years);
    for (size_t y = 0; y < years; ++y) {
        result.years[y] = matrix.start_year() + static_cast<int>(y);
    }

    const MetricSpec& net_worth = find_metric("net_worth");
    result.net_worth_p10.resize(years);
    result.net_worth_p50.resize(years);
    result.net_worth_p90.resize(years);

    for (const auto& spec : metric_table()) {
        std::vector<double>& out = result.series[spec.name];
        out.resize(years);
        for (size_t y = 0; y < years; ++y) {
            std::vector<double> column = matrix.column(y, spec);
            if (spec.kind == MetricKind::Flag) {
                out[y] = flag_percentage(column);
                continue;
            }
            if (&spec == &net_worth) {
                result.net_worth_p10[y] = nearest_rank_percentile(column, 10.0);
                result.net_worth_p50[y] = nearest_rank_percentile(column, 50.0);
                result.net_worth_p90[y] = nearest_rank_percentile(column, 90.0);
            }
            out[y] = nearest_rank_percentile(column, pct);
        }
    }

    return result;
}

} // namespace nestegg
