#ifndef NESTEGG_IO_JSON_WRITER_HPP
#define NESTEGG_IO_JSON_WRITER_HPP

#include <ostream>
#include <string>
#include "../aggregator.hpp"

namespace nestegg {
namespace io {

// Write AggregatedResult to JSON: echo fields, years, net worth bands,
// then every metric series in metric-table order
void write_aggregated_result_json(std::ostream& os, const AggregatedResult& result,
                                  bool pretty_print = true);

// Write AggregatedResult to JSON file
void write_aggregated_result_json(const std::string& filepath, const AggregatedResult& result,
                                  bool pretty_print = true);

} // namespace io
} // namespace nestegg

#endif // NESTEGG_IO_JSON_WRITER_HPP
