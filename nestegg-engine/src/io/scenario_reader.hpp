#ifndef NESTEGG_IO_SCENARIO_READER_HPP
#define NESTEGG_IO_SCENARIO_READER_HPP

#include <istream>
#include <string>
#include "../scenario.hpp"

namespace nestegg {
namespace io {

// Parse a scenario document. Every section except "people" is optional;
// missing fields take the Assumptions/TaxBands defaults. Malformed input
// raises ConfigurationError naming the field, e.g. "assets[1].balance".
// The returned scenario has been validated.
Scenario parse_scenario_json(const std::string& json_string);

Scenario load_scenario_json(std::istream& is);

Scenario load_scenario_json(const std::string& filepath);

} // namespace io
} // namespace nestegg

#endif // NESTEGG_IO_SCENARIO_READER_HPP
