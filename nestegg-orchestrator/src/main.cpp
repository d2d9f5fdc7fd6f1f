#include <iostream>
#include <fstream>
#include <string>
#include "config_parser.hpp"
#include "session_store.hpp"
#include "logger.hpp"
#include "errors.hpp"
#include "io/scenario_reader.hpp"
#include "io/json_writer.hpp"

using namespace nestegg;
using namespace nestegg::orchestrator;

namespace {

struct CLIArgs {
    std::string config_path;
    std::string scenario_path;
    size_t iterations = 2000;
    uint64_t seed = 42;
    std::string output_path;
    std::string recalc_output_path;
    bool help = false;
    bool has_spend_target = false;
    double spend_target = 0.0;
    int retirement_offset = 0;
    int percentile = 50;
    PartialPolicyParams recalc;
};

void print_usage(const char* program_name) {
    std::cerr << "NestEgg Session Runner v1.0.0\n\n";
    std::cerr << "Creates a cached Monte Carlo session, then optionally recalculates it\n";
    std::cerr << "with new policy parameters over the same draws.\n\n";
    std::cerr << "Usage: " << program_name << " --scenario <path> [options]\n\n";
    std::cerr << "Options:\n";
    std::cerr << "  --config <path>                    Service config JSON (logging, sessions)\n";
    std::cerr << "  --scenario <path>                  JSON scenario file\n";
    std::cerr << "  --iterations <count>               Monte Carlo paths (default: 2000)\n";
    std::cerr << "  --seed <value>                     Random seed (default: 42)\n";
    std::cerr << "  --spend-target <amount>            Initial annual spend target\n";
    std::cerr << "  --retirement-offset <years>        Initial retirement age offset (default: 0)\n";
    std::cerr << "  --percentile <1-99>                Initial reported percentile (default: 50)\n";
    std::cerr << "  --recalc-spend-target <amount>     Recalculate with this spend target\n";
    std::cerr << "  --recalc-retirement-offset <years> Recalculate with this offset\n";
    std::cerr << "  --recalc-percentile <1-99>         Recalculate with this percentile\n";
    std::cerr << "  --output <path>                    Initial result JSON (default: stdout)\n";
    std::cerr << "  --recalc-output <path>             Recalculated result JSON (default: stdout)\n";
    std::cerr << "  --help                             Show this help message\n\n";
    std::cerr << "Example:\n";
    std::cerr << "  " << program_name << " --scenario household.json --config service.json \\\n";
    std::cerr << "      --recalc-retirement-offset 3 --recalc-output later.json\n";
}

bool parse_args(int argc, char* argv[], CLIArgs& args) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            args.help = true;
            return true;
        } else if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--scenario" && i + 1 < argc) {
            args.scenario_path = argv[++i];
        } else if (arg == "--iterations" && i + 1 < argc) {
            args.iterations = static_cast<size_t>(std::stoul(argv[++i]));
        } else if (arg == "--seed" && i + 1 < argc) {
            args.seed = std::stoull(argv[++i]);
        } else if (arg == "--spend-target" && i + 1 < argc) {
            args.spend_target = std::stod(argv[++i]);
            args.has_spend_target = true;
        } else if (arg == "--retirement-offset" && i + 1 < argc) {
            args.retirement_offset = std::stoi(argv[++i]);
        } else if (arg == "--percentile" && i + 1 < argc) {
            args.percentile = std::stoi(argv[++i]);
        } else if (arg == "--recalc-spend-target" && i + 1 < argc) {
            args.recalc.annual_spend_target = std::stod(argv[++i]);
        } else if (arg == "--recalc-retirement-offset" && i + 1 < argc) {
            args.recalc.retirement_age_offset = std::stoi(argv[++i]);
        } else if (arg == "--recalc-percentile" && i + 1 < argc) {
            args.recalc.percentile = std::stoi(argv[++i]);
        } else if (arg == "--output" && i + 1 < argc) {
            args.output_path = argv[++i];
        } else if (arg == "--recalc-output" && i + 1 < argc) {
            args.recalc_output_path = argv[++i];
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
    }

    if (args.iterations == 0) {
        std::cerr << "Error: --iterations must be greater than 0\n";
        valid = false;
    }

    if (args.percentile < 1 || args.percentile > 99) {
        std::cerr << "Error: --percentile must be between 1 and 99\n";
        valid = false;
    }

    if (args.recalc.percentile && (*args.recalc.percentile < 1 || *args.recalc.percentile > 99)) {
        std::cerr << "Error: --recalc-percentile must be between 1 and 99\n";
        valid = false;
    }

    return valid;
}

void write_result(const AggregatedResult& result, const std::string& path) {
    if (path.empty()) {
        io::write_aggregated_result_json(std::cout, result, true);
    } else {
        io::write_aggregated_result_json(path, result, true);
        std::cerr << "Output written to: " << path << "\n";
    }
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

    try {
        ServiceConfig service;
        if (!args.config_path.empty()) {
            service = parse_service_config_from_file(args.config_path);
        }
        Logger::get_instance().configure(service.logging);

        Scenario scenario = io::load_scenario_json(args.scenario_path);

        PolicyParams policy = default_policy(scenario);
        if (args.has_spend_target) {
            policy.annual_spend_target = args.spend_target;
        }
        policy.retirement_age_offset = args.retirement_offset;
        policy.percentile = args.percentile;

        SessionStore store(service.sessions);
        SessionHandle handle = store.create_session(scenario, args.iterations, args.seed, policy);
        std::cerr << "Session " << handle.session_id << " created ("
                  << args.iterations << " paths x " << scenario.num_years() << " years)\n";
        write_result(handle.result, args.output_path);

        if (!args.recalc.empty()) {
            AggregatedResult updated = store.recalc(handle.session_id, args.recalc);
            std::cerr << "Session " << handle.session_id << " recalculated\n";
            write_result(updated, args.recalc_output_path);
        }

        Logger::get_instance().flush();
        return 0;
    } catch (const ConfigParseError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    } catch (const ConfigurationError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
