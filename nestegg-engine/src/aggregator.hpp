#ifndef NESTEGG_AGGREGATOR_HPP
#define NESTEGG_AGGREGATOR_HPP

#include "monte_carlo.hpp"
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace nestegg {

/**
 * @brief Per-year summary of a Monte Carlo run
 *
 * Continuous metrics are reported at the selected percentile; flags are
 * reported as the percentage of paths (0-100) where the flag is set.
 * Net worth additionally carries fixed p10/p50/p90 bands.
 */
struct AggregatedResult {
    std::vector<int> years;
    int percentile;
    std::map<std::string, std::vector<double>> series;
    std::vector<double> net_worth_p10;
    std::vector<double> net_worth_p50;
    std::vector<double> net_worth_p90;

    // Echo of the inputs that produced this result
    int start_year;
    double inflation_rate;
    std::vector<int> retirement_years;   // per adult, after the offset
    size_t iterations;
    uint64_t seed;
    double annual_spend_target;
    int retirement_age_offset;

    AggregatedResult();

    const std::vector<double>& metric(const std::string& name) const;

    bool operator==(const AggregatedResult& other) const;
    bool operator!=(const AggregatedResult& other) const { return !(*this == other); }
};

/**
 * Nearest-rank percentile: rank = ceil(p/100 * N), value is the rank-th
 * smallest (rank clamped to at least 1). Reorders values in place.
 * Throws std::invalid_argument on an empty sample.
 */
double nearest_rank_percentile(std::vector<double>& values, double percentile);

/** Percentage of non-zero entries, 0-100 */
double flag_percentage(const std::vector<double>& values);

/** One metric's per-year series at an arbitrary percentile */
std::vector<double> percentile_series(const RawMatrix& matrix, const std::string& metric,
                                      double percentile);

AggregatedResult aggregate(const RawMatrix& matrix, const Scenario& scenario,
                           const PolicyParams& policy, uint64_t seed);

} // namespace nestegg

#endif // NESTEGG_AGGREGATOR_HPP
