#include "draw_table.hpp"
#include "errors.hpp"
#include "scenario.hpp"
#include <cmath>
#include <random>
#include <stdexcept>
#include <string>

#ifdef HAVE_OPENMP
#include <omp.h>
#endif

namespace nestegg {

AssetGrowth::AssetGrowth() : mean(0.0), std_dev(0.0) {}

AssetGrowth::AssetGrowth(double m, double sd) : mean(m), std_dev(sd) {}

uint64_t DrawTable::path_seed(uint64_t seed, size_t path) {
    uint64_t z = seed ^ (0x9E3779B97F4A7C15ULL * (static_cast<uint64_t>(path) + 1));
    z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
    z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
    return z ^ (z >> 31);
}

DrawTable::DrawTable(size_t num_paths, size_t num_years,
                     const std::vector<AssetGrowth>& growth, uint64_t seed)
    : num_paths_(num_paths)
    , num_years_(num_years)
    , num_assets_(growth.size())
    , seed_(seed)
{
    if (num_paths == 0) {
        throw ConfigurationError("iterations", "must be at least 1");
    }
    if (num_years == 0) {
        throw ConfigurationError("assumptions.end_year", "projection has no years");
    }
    for (size_t a = 0; a < growth.size(); ++a) {
        std::string field = "assets[" + std::to_string(a) + "]";
        if (!std::isfinite(growth[a].mean)) {
            throw ConfigurationError(field + ".growth_rate_mean", "must be finite");
        }
        if (!std::isfinite(growth[a].std_dev) || growth[a].std_dev < 0.0) {
            throw ConfigurationError(field + ".growth_rate_std", "must be a finite non-negative number");
        }
    }

    draws_.resize(num_paths_ * num_years_ * num_assets_);
    if (num_assets_ == 0) {
        return;
    }

    const size_t per_path = num_years_ * num_assets_;
    const long long total_paths = static_cast<long long>(num_paths_);

#ifdef HAVE_OPENMP
    #pragma omp parallel for schedule(static)
#endif
    for (long long p = 0; p < total_paths; ++p) {
        std::mt19937_64 rng(path_seed(seed_, static_cast<size_t>(p)));
        std::normal_distribution<double> normal(0.0, 1.0);
        double* out = draws_.data() + static_cast<size_t>(p) * per_path;

        for (size_t y = 0; y < num_years_; ++y) {
            for (size_t a = 0; a < num_assets_; ++a) {
                // One variate per asset, zero-volatility assets included
                double z = normal(rng);
                out[y * num_assets_ + a] = growth[a].mean + growth[a].std_dev * z;
            }
        }
    }
}

DrawTable DrawTable::generate(const Scenario& scenario, size_t num_paths, uint64_t seed) {
    std::vector<AssetGrowth> growth;
    growth.reserve(scenario.assets.size());
    for (size_t a = 0; a < scenario.assets.size(); ++a) {
        growth.emplace_back(scenario.asset_growth_mean(a), scenario.asset_growth_std(a));
    }
    return DrawTable(num_paths, scenario.num_years(), growth, seed);
}

double DrawTable::draw(size_t path, size_t year, size_t asset) const {
    if (path >= num_paths_ || year >= num_years_ || asset >= num_assets_) {
        throw std::out_of_range("Draw index out of range");
    }
    return draws_[(path * num_years_ + year) * num_assets_ + asset];
}

const double* DrawTable::year_draws(size_t path, size_t year) const {
    if (path >= num_paths_ || year >= num_years_) {
        throw std::out_of_range("Draw index out of range");
    }
    return draws_.data() + (path * num_years_ + year) * num_assets_;
}

} // namespace nestegg
