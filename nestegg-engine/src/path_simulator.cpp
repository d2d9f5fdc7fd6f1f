#include "path_simulator.hpp"
#include "errors.hpp"

namespace nestegg {

PathSimulator::PathSimulator(const Scenario& scenario, const PolicyParams& policy)
    : engine_(scenario, policy)
{}

std::vector<YearRecord> PathSimulator::run(const DrawTable& draws, size_t path) const {
    std::vector<YearRecord> records(num_years());
    run_into(draws, path, records.data());
    return records;
}

void PathSimulator::run_into(const DrawTable& draws, size_t path, YearRecord* out) const {
    const size_t years = num_years();
    if (draws.num_years() != years || draws.num_assets() != engine_.scenario().assets.size()) {
        throw ConfigurationError("draws", "draw table shape does not match the scenario");
    }

    HouseholdState state = engine_.initial_state();
    for (size_t y = 0; y < years; ++y) {
        try {
            out[y] = engine_.step(state, y, draws.year_draws(path, y));
        } catch (const NumericError& e) {
            throw NumericError(path, e.year(), e.field());
        }
    }
}

} // namespace nestegg
