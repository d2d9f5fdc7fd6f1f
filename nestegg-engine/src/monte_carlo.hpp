#ifndef NESTEGG_MONTE_CARLO_HPP
#define NESTEGG_MONTE_CARLO_HPP

#include "draw_table.hpp"
#include "metrics.hpp"
#include "policy.hpp"
#include "scenario.hpp"
#include "year_step.hpp"
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace nestegg {

/**
 * @brief Raw per-path output of one run: paths x years YearRecords
 */
class RawMatrix {
public:
    RawMatrix(size_t num_paths, size_t num_years, int start_year);

    YearRecord& at(size_t path, size_t year);
    const YearRecord& at(size_t path, size_t year) const;

    /** Contiguous row of num_years() records for path */
    YearRecord* path_row(size_t path) { return records_.data() + path * num_years_; }
    const YearRecord* path_row(size_t path) const { return records_.data() + path * num_years_; }

    /** Values of metric in year across all paths */
    std::vector<double> column(size_t year, const MetricSpec& metric) const;

    size_t num_paths() const { return num_paths_; }
    size_t num_years() const { return num_years_; }
    int start_year() const { return start_year_; }

    double execution_time_ms;

private:
    size_t num_paths_;
    size_t num_years_;
    int start_year_;
    std::vector<YearRecord> records_;
};

struct MonteCarloConfig {
    int num_threads;                       // 0 = OpenMP default
    std::string run_id;                    // reported in RecalcSuperseded
    std::function<bool()> is_cancelled;    // polled before each path

    MonteCarloConfig();
};

/**
 * Simulate every path of draws under (scenario, policy).
 *
 * Paths run in parallel when built with OpenMP; results are independent of
 * thread count and scheduling. A failure on any path fails the whole run:
 * the error from the lowest failing path index is rethrown. Throws
 * RecalcSuperseded if is_cancelled() turns true mid-run.
 */
std::shared_ptr<RawMatrix> run_monte_carlo(
    const Scenario& scenario,
    const PolicyParams& policy,
    const DrawTable& draws,
    const MonteCarloConfig& config = MonteCarloConfig());

} // namespace nestegg

#endif // NESTEGG_MONTE_CARLO_HPP
