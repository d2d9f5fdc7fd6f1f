#ifndef NESTEGG_METRICS_HPP
#define NESTEGG_METRICS_HPP

#include "year_step.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace nestegg {

enum class MetricKind : uint8_t {
    Continuous = 0,   // reported at a percentile across paths
    Flag = 1          // reported as the percentage of paths where true
};

/**
 * @brief One reportable YearRecord field
 *
 * The table is the single place that enumerates record fields: the
 * aggregator, the finite-value check and the JSON writer all iterate it.
 */
struct MetricSpec {
    const char* name;
    MetricKind kind;
    double (*extract)(const YearRecord&);
};

const std::vector<MetricSpec>& metric_table();

/** Throws std::out_of_range for unknown names */
const MetricSpec& find_metric(const std::string& name);

} // namespace nestegg

#endif // NESTEGG_METRICS_HPP
