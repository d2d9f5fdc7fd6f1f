#include "monte_carlo.hpp"
#include "errors.hpp"
#include "path_simulator.hpp"
#include <atomic>
#include <chrono>
#include <exception>
#include <limits>
#include <stdexcept>

#ifdef HAVE_OPENMP
#include <omp.h>
#endif

namespace nestegg {

// ============================================================================
// RawMatrix
// ============================================================================

RawMatrix::RawMatrix(size_t num_paths, size_t num_years, int start_year)
    : execution_time_ms(0.0)
    , num_paths_(num_paths)
    , num_years_(num_years)
    , start_year_(start_year)
    , records_(num_paths * num_years)
{}

YearRecord& RawMatrix::at(size_t path, size_t year) {
    if (path >= num_paths_ || year >= num_years_) {
        throw std::out_of_range("RawMatrix index out of range");
    }
    return records_[path * num_years_ + year];
}

const YearRecord& RawMatrix::at(size_t path, size_t year) const {
    if (path >= num_paths_ || year >= num_years_) {
        throw std::out_of_range("RawMatrix index out of range");
    }
    return records_[path * num_years_ + year];
}

std::vector<double> RawMatrix::column(size_t year, const MetricSpec& metric) const {
    if (year >= num_years_) {
        throw std::out_of_range("RawMatrix year out of range");
    }
    std::vector<double> values(num_paths_);
    for (size_t p = 0; p < num_paths_; ++p) {
        values[p] = metric.extract(records_[p * num_years_ + year]);
    }
    return values;
}

MonteCarloConfig::MonteCarloConfig()
    : num_threads(0)
{}

// ============================================================================
// Monte Carlo run
// ============================================================================

std::shared_ptr<RawMatrix> run_monte_carlo(
    const Scenario& scenario,
    const PolicyParams& policy,
    const DrawTable& draws,
    const MonteCarloConfig& config)
{
    auto start_time = std::chrono::high_resolution_clock::now();

    PathSimulator simulator(scenario, policy);
    auto matrix = std::make_shared<RawMatrix>(draws.num_paths(), simulator.num_years(),
                                              scenario.assumptions.start_year);

    const long long num_paths = static_cast<long long>(draws.num_paths());
    std::atomic<bool> cancelled(false);
    size_t failed_path = std::numeric_limits<size_t>::max();
    std::exception_ptr failure;

#ifdef HAVE_OPENMP
    int threads = config.num_threads > 0 ? config.num_threads : omp_get_max_threads();
    #pragma omp parallel for schedule(dynamic, 16) num_threads(threads)
#endif
    for (long long p = 0; p < num_paths; ++p) {
        if (cancelled.load(std::memory_order_relaxed)) {
            continue;
        }
        if (config.is_cancelled && config.is_cancelled()) {
            cancelled.store(true, std::memory_order_relaxed);
            continue;
        }
        size_t path = static_cast<size_t>(p);
        try {
            simulator.run_into(draws, path, matrix->path_row(path));
        } catch (const std::exception&) {
#ifdef HAVE_OPENMP
            #pragma omp critical(nestegg_path_failure)
#endif
            {
                if (path < failed_path) {
                    failed_path = path;
                    failure = std::current_exception();
                }
            }
        }
    }

    if (failure) {
        std::rethrow_exception(failure);
    }
    if (cancelled.load()) {
        throw RecalcSuperseded(config.run_id);
    }

    auto end_time = std::chrono::high_resolution_clock::now();
    matrix->execution_time_ms = std::chrono::duration<double, std::milli>(
        end_time - start_time).count();
    return matrix;
}

} // namespace nestegg
