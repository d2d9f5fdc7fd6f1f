#include "config_parser.hpp"
#include "errors.hpp"
#include <nlohmann/json.hpp>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace nestegg {
namespace orchestrator {

std::string expand_environment_variables(const std::string& value) {
    std::string result = value;
    size_t pos = 0;

    while ((pos = result.find('$', pos)) != std::string::npos) {
        size_t start = pos;
        pos++;

        bool braces = false;
        if (pos < result.size() && result[pos] == '{') {
            braces = true;
            pos++;
        }

        size_t name_start = pos;
        while (pos < result.size() &&
               (std::isalnum(static_cast<unsigned char>(result[pos])) || result[pos] == '_')) {
            pos++;
        }
        std::string var_name = result.substr(name_start, pos - name_start);

        if (braces) {
            if (pos >= result.size() || result[pos] != '}') {
                throw ConfigParseError("Unterminated variable reference in: " + value);
            }
            pos++;
        }

        // A lone '$' is kept as-is
        if (var_name.empty()) {
            pos = start + 1;
            continue;
        }

        const char* env_value = std::getenv(var_name.c_str());
        std::string replacement = env_value ? env_value : "";

        result.replace(start, pos - start, replacement);
        pos = start + replacement.size();
    }

    return result;
}

std::string resolve_relative_path(const std::string& path, const std::string& config_file_path) {
    fs::path p(path);

    if (p.is_absolute()) {
        return path;
    }

    fs::path config_dir = fs::path(config_file_path).parent_path();
    return (config_dir / p).string();
}

namespace {

void parse_logging(const json& j, LoggerConfig& config) {
    if (!j.is_object()) {
        throw ConfigParseError("'logging' must be an object");
    }

    if (j.contains("level")) {
        std::string level = j["level"].get<std::string>();
        if (level != "DEBUG" && level != "INFO" && level != "WARN" && level != "ERROR") {
            throw ConfigParseError("Unknown log level: " + level);
        }
        config.min_level = string_to_level(level);
    }
    if (j.contains("json")) {
        config.enable_json = j["json"].get<bool>();
    }
    if (j.contains("console")) {
        config.enable_console = j["console"].get<bool>();
    }
    if (j.contains("file")) {
        config.log_file_path = expand_environment_variables(j["file"].get<std::string>());
        config.enable_file = !config.log_file_path.empty();
    }
}

void parse_sessions(const json& j, SessionStoreConfig& config) {
    if (!j.is_object()) {
        throw ConfigParseError("'sessions' must be an object");
    }

    if (j.contains("idle_ttl_seconds")) {
        config.idle_ttl = std::chrono::seconds(j["idle_ttl_seconds"].get<long long>());
    }
    if (j.contains("max_sessions")) {
        long long max_sessions = j["max_sessions"].get<long long>();
        if (max_sessions < 0) {
            throw ConfigurationError("sessions.max_sessions", "must be at least 1");
        }
        config.max_sessions = static_cast<size_t>(max_sessions);
    }
    if (j.contains("num_threads")) {
        config.num_threads = j["num_threads"].get<int>();
    }
}

} // anonymous namespace

ServiceConfig parse_service_config_from_string(const std::string& json_string) {
    ServiceConfig config;

    try {
        json j = json::parse(json_string);

        if (!j.is_object()) {
            throw ConfigParseError("Service config must be a JSON object");
        }
        if (j.contains("logging")) {
            parse_logging(j["logging"], config.logging);
        }
        if (j.contains("sessions")) {
            parse_sessions(j["sessions"], config.sessions);
        }

    } catch (const json::parse_error& e) {
        throw ConfigParseError(std::string("JSON parse error: ") + e.what());
    } catch (const json::type_error& e) {
        throw ConfigParseError(std::string("JSON type error: ") + e.what());
    }

    config.sessions.validate();

    return config;
}

ServiceConfig parse_service_config_from_file(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw ConfigParseError("Failed to open config file: " + file_path);
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();

    ServiceConfig config = parse_service_config_from_string(buffer.str());

    if (config.logging.enable_file) {
        config.logging.log_file_path = resolve_relative_path(config.logging.log_file_path, file_path);
    }

    return config;
}

} // namespace orchestrator
} // namespace nestegg
