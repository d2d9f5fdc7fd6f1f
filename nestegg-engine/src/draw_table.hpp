#ifndef NESTEGG_DRAW_TABLE_HPP
#define NESTEGG_DRAW_TABLE_HPP

#include <cstddef>
#include <cstdint>
#include <vector>

namespace nestegg {

struct Scenario;

/** Normal return distribution for one asset */
struct AssetGrowth {
    double mean;
    double std_dev;

    AssetGrowth();
    AssetGrowth(double m, double sd);
};

/**
 * @brief Pre-generated annual return draws, one per (path, year, asset)
 *
 * Generated once per session and never mutated, so a session can share it
 * across recalculations and worker threads without locking. Path p draws
 * from its own mt19937_64 seeded from (seed, p): the table is identical
 * for a given seed regardless of thread count.
 *
 * Layout is row-major: index = (path * years + year) * assets + asset.
 */
class DrawTable {
public:
    DrawTable(size_t num_paths, size_t num_years,
              const std::vector<AssetGrowth>& growth, uint64_t seed);

    /** One draw per scenario asset, in scenario order */
    static DrawTable generate(const Scenario& scenario, size_t num_paths, uint64_t seed);

    double draw(size_t path, size_t year, size_t asset) const;

    /** Returns for every asset in one (path, year) cell */
    const double* year_draws(size_t path, size_t year) const;

    size_t num_paths() const { return num_paths_; }
    size_t num_years() const { return num_years_; }
    size_t num_assets() const { return num_assets_; }
    uint64_t seed() const { return seed_; }

    size_t memory_footprint() const {
        return sizeof(DrawTable) + draws_.capacity() * sizeof(double);
    }

    /** Per-path stream seed, mixed with splitmix64 */
    static uint64_t path_seed(uint64_t seed, size_t path);

private:
    size_t num_paths_;
    size_t num_years_;
    size_t num_assets_;
    uint64_t seed_;
    std::vector<double> draws_;
};

} // namespace nestegg

#endif // NESTEGG_DRAW_TABLE_HPP
