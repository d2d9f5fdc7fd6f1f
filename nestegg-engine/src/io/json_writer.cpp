#include "json_writer.hpp"
#include <fstream>
#include <iomanip>
#include <stdexcept>

namespace nestegg {
namespace io {

namespace {

template <typename T>
void write_array(std::ostream& os, const std::vector<T>& values, bool pretty_print,
                 const std::string& indent) {
    const std::string newline = pretty_print ? "\n" : "";
    const std::string space = pretty_print ? " " : "";

    os << "[";
    if (!values.empty() && pretty_print) {
        os << newline << indent;
    }
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) {
            os << ",";
            if (pretty_print && i % 10 == 0) {
                os << newline << indent;
            } else {
                os << space;
            }
        }
        os << values[i];
    }
    if (!values.empty() && pretty_print) {
        os << newline << indent.substr(0, indent.size() >= 2 ? indent.size() - 2 : 0);
    }
    os << "]";
}

} // anonymous namespace

void write_aggregated_result_json(std::ostream& os, const AggregatedResult& result,
                                  bool pretty_print) {
    const std::string indent = pretty_print ? "  " : "";
    const std::string newline = pretty_print ? "\n" : "";
    const std::string space = pretty_print ? " " : "";

    os << std::fixed << std::setprecision(2);

    os << "{" << newline;

    // Inputs
    os << indent << "\"percentile\":" << space << result.percentile << "," << newline;
    os << indent << "\"iterations\":" << space << result.iterations << "," << newline;
    os << indent << "\"seed\":" << space << result.seed << "," << newline;
    os << indent << "\"start_year\":" << space << result.start_year << "," << newline;
    os << indent << "\"annual_spend_target\":" << space << result.annual_spend_target << "," << newline;
    os << indent << "\"retirement_age_offset\":" << space << result.retirement_age_offset << "," << newline;
    os << indent << "\"inflation_rate\":" << space << std::setprecision(6)
       << result.inflation_rate << "," << newline;
    os << std::setprecision(2);
    os << indent << "\"retirement_years\":" << space;
    write_array(os, result.retirement_years, pretty_print, indent + indent);
    os << "," << newline;

    os << indent << "\"years\":" << space;
    write_array(os, result.years, pretty_print, indent + indent);
    os << "," << newline;

    // Fixed bands
    os << indent << "\"net_worth_bands\":" << space << "{" << newline;
    os << indent << indent << "\"p10\":" << space;
    write_array(os, result.net_worth_p10, pretty_print, indent + indent + indent);
    os << "," << newline;
    os << indent << indent << "\"p50\":" << space;
    write_array(os, result.net_worth_p50, pretty_print, indent + indent + indent);
    os << "," << newline;
    os << indent << indent << "\"p90\":" << space;
    write_array(os, result.net_worth_p90, pretty_print, indent + indent + indent);
    os << newline;
    os << indent << "}," << newline;

    // Series at the selected percentile; flags are percentages of paths
    os << indent << "\"series\":" << space << "{" << newline;
    bool first = true;
    for (const auto& spec : metric_table()) {
        auto it = result.series.find(spec.name);
        if (it == result.series.end()) {
            continue;
        }
        if (!first) {
            os << "," << newline;
        }
        first = false;
        os << indent << indent << "\"" << spec.name << "\":" << space;
        write_array(os, it->second, pretty_print, indent + indent + indent);
    }
    os << newline << indent << "}" << newline;

    os << "}" << newline;
}

void write_aggregated_result_json(const std::string& filepath, const AggregatedResult& result,
                                  bool pretty_print) {
    std::ofstream file(filepath);
    if (!file) {
        throw std::runtime_error("Failed to open output file: " + filepath);
    }
    write_aggregated_result_json(file, result, pretty_print);
}

} // namespace io
} // namespace nestegg
