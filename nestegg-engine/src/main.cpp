#include <iostream>
#include <fstream>
#include <string>
#include <cstdlib>
#include "scenario.hpp"
#include "policy.hpp"
#include "draw_table.hpp"
#include "monte_carlo.hpp"
#include "aggregator.hpp"
#include "errors.hpp"
#include "io/scenario_reader.hpp"
#include "io/json_writer.hpp"

namespace {

struct CLIArgs {
    std::string scenario_path;
    size_t iterations = 2000;
    uint64_t seed = 42;
    std::string output_path;
    bool help = false;
    bool compact = false;
    int threads = 0;
    // Policy overrides; unset values come from the scenario
    bool has_spend_target = false;
    double spend_target = 0.0;
    int retirement_offset = 0;
    int percentile = 50;
};

void print_usage(const char* program_name) {
    std::cerr << "NestEgg Engine v1.0.0\n\n";
    std::cerr << "Usage: " << program_name << " --scenario <path> [options]\n\n";
    std::cerr << "Input options:\n";
    std::cerr << "  --scenario <path>           JSON scenario file (people, incomes, assets, ...)\n\n";
    std::cerr << "Simulation options:\n";
    std::cerr << "  --iterations <count>        Number of Monte Carlo paths (default: 2000)\n";
    std::cerr << "  --seed <value>              Random seed for reproducibility (default: 42)\n";
    std::cerr << "  --threads <count>           Worker threads, 0 = all cores (default: 0)\n\n";
    std::cerr << "Policy options:\n";
    std::cerr << "  --spend-target <amount>     Annual spend once everyone is retired\n";
    std::cerr << "                              (default: assumptions.annual_spend_target)\n";
    std::cerr << "  --retirement-offset <years> Shift every planned retirement age (default: 0)\n";
    std::cerr << "  --percentile <1-99>         Reported percentile (default: 50)\n\n";
    std::cerr << "Output options:\n";
    std::cerr << "  --output <path>             JSON output file (default: stdout)\n";
    std::cerr << "  --compact                   Write JSON without whitespace\n\n";
    std::cerr << "Other options:\n";
    std::cerr << "  --help                      Show this help message\n\n";
    std::cerr << "Example:\n";
    std::cerr << "  " << program_name << " --scenario household.json \\\n";
    std::cerr << "      --iterations 2000 --seed 7 --retirement-offset 2 \\\n";
    std::cerr << "      --output results.json\n";
}

bool file_exists(const std::string& path) {
    std::ifstream f(path);
    return f.good();
}

bool parse_args(int argc, char* argv[], CLIArgs& args) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            args.help = true;
            return true;
        } else if (arg == "--scenario" && i + 1 < argc) {
            args.scenario_path = argv[++i];
        } else if (arg == "--iterations" && i + 1 < argc) {
            args.iterations = static_cast<size_t>(std::stoul(argv[++i]));
        } else if (arg == "--seed" && i + 1 < argc) {
            args.seed = std::stoull(argv[++i]);
        } else if (arg == "--threads" && i + 1 < argc) {
            args.threads = std::stoi(argv[++i]);
        } else if (arg == "--spend-target" && i + 1 < argc) {
            args.spend_target = std::stod(argv[++i]);
            args.has_spend_target = true;
        } else if (arg == "--retirement-offset" && i + 1 < argc) {
            args.retirement_offset = std::stoi(argv[++i]);
        } else if (arg == "--percentile" && i + 1 < argc) {
            args.percentile = std::stoi(argv[++i]);
        } else if (arg == "--output" && i + 1 < argc) {
            args.output_path = argv[++i];
        } else if (arg == "--compact") {
            args.compact = true;
        } else {
            std::cerr << "Error: Unknown option or missing argument: " << arg << "\n\n";
            return false;
        }
    }
    return true;
}

bool validate_args(const CLIArgs& args) {
    bool valid = true;

    if (args.scenario_path.empty()) {
        std::cerr << "Error: --scenario is required\n";
        valid = false;
    } else if (!file_exists(args.scenario_path)) {
        std::cerr << "Error: Scenario file not found: " << args.scenario_path << "\n";
        valid = false;
    }

    if (args.iterations == 0) {
        std::cerr << "Error: --iterations must be greater than 0\n";
        valid = false;
    }

    if (args.threads < 0) {
        std::cerr << "Error: --threads must be non-negative\n";
        valid = false;
    }

    if (args.has_spend_target && args.spend_target < 0) {
        std::cerr << "Error: --spend-target must be non-negative\n";
        valid = false;
    }

    if (args.percentile < 1 || args.percentile > 99) {
        std::cerr << "Error: --percentile must be between 1 and 99\n";
        valid = false;
    }

    return valid;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    CLIArgs args;

    try {
        if (!parse_args(argc, argv, args)) {
            print_usage(argv[0]);
            return 1;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: Invalid numeric argument: " << e.what() << "\n";
        return 1;
    }

    if (args.help || argc == 1) {
        print_usage(argv[0]);
        return 0;
    }

    if (!validate_args(args)) {
        std::cerr << "\nUse --help for usage information.\n";
        return 1;
    }

    std::cerr << "NestEgg Engine v1.0.0\n";
    std::cerr << "Configuration:\n";
    std::cerr << "  Scenario:    " << args.scenario_path << "\n";
    std::cerr << "  Iterations:  " << args.iterations << "\n";
    std::cerr << "  Seed:        " << args.seed << "\n";
    std::cerr << "  Percentile:  " << args.percentile << "\n\n";

    try {
        std::cerr << "Loading scenario from " << args.scenario_path << "..." << std::flush;
        nestegg::Scenario scenario = nestegg::io::load_scenario_json(args.scenario_path);
        std::cerr << " " << scenario.people.size() << " people, "
                  << scenario.assets.size() << " assets, "
                  << scenario.num_years() << " years\n";

        nestegg::PolicyParams policy = nestegg::default_policy(scenario);
        if (args.has_spend_target) {
            policy.annual_spend_target = args.spend_target;
        }
        policy.retirement_age_offset = args.retirement_offset;
        policy.percentile = args.percentile;
        policy.validate();

        std::cerr << "Generating draws (" << args.iterations << " paths)..." << std::flush;
        nestegg::DrawTable draws = nestegg::DrawTable::generate(scenario, args.iterations, args.seed);
        std::cerr << " done (" << draws.memory_footprint() / 1024 << " KiB)\n";

        nestegg::MonteCarloConfig config;
        config.num_threads = args.threads;
        std::cerr << "Simulating...\n";
        auto matrix = nestegg::run_monte_carlo(scenario, policy, draws, config);

        nestegg::AggregatedResult result = nestegg::aggregate(*matrix, scenario, policy, args.seed);

        const auto& depleted = result.metric("assets_depleted");
        std::cerr << "\nResults:\n";
        std::cerr << "  Final net worth P10: " << result.net_worth_p10.back() << "\n";
        std::cerr << "  Final net worth P50: " << result.net_worth_p50.back() << "\n";
        std::cerr << "  Final net worth P90: " << result.net_worth_p90.back() << "\n";
        std::cerr << "  Depleted in final year: " << depleted.back() << "% of paths\n";
        std::cerr << "  Execution: " << matrix->execution_time_ms << " ms\n";

        if (args.output_path.empty()) {
            nestegg::io::write_aggregated_result_json(std::cout, result, !args.compact);
        } else {
            nestegg::io::write_aggregated_result_json(args.output_path, result, !args.compact);
            std::cerr << "\nOutput written to: " << args.output_path << "\n";
        }

        return 0;
    } catch (const nestegg::ConfigurationError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
