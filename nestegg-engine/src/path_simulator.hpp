#ifndef NESTEGG_PATH_SIMULATOR_HPP
#define NESTEGG_PATH_SIMULATOR_HPP

#include "draw_table.hpp"
#include "year_step.hpp"
#include <vector>

namespace nestegg {

/**
 * @brief Runs one Monte Carlo path end to end
 *
 * Owns nothing but the year-step engine; the scenario must outlive the
 * simulator. run() is const and touches only the caller's output buffer,
 * so any number of paths may run concurrently on one simulator.
 */
class PathSimulator {
public:
    PathSimulator(const Scenario& scenario, const PolicyParams& policy);

    /** Year series for path, one record per scenario year */
    std::vector<YearRecord> run(const DrawTable& draws, size_t path) const;

    /** Writes num_years() records to out; NumericError carries the path index */
    void run_into(const DrawTable& draws, size_t path, YearRecord* out) const;

    size_t num_years() const { return engine_.scenario().num_years(); }
    const YearStepEngine& engine() const { return engine_; }

private:
    YearStepEngine engine_;
};

} // namespace nestegg

#endif // NESTEGG_PATH_SIMULATOR_HPP
