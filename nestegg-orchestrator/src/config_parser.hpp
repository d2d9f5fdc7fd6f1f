#ifndef NESTEGG_ORCHESTRATOR_CONFIG_PARSER_HPP
#define NESTEGG_ORCHESTRATOR_CONFIG_PARSER_HPP

#include "logger.hpp"
#include "session_store.hpp"
#include <stdexcept>
#include <string>

namespace nestegg {
namespace orchestrator {

/**
 * @brief Exception thrown when service config parsing fails
 */
class ConfigParseError : public std::runtime_error {
public:
    explicit ConfigParseError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Settings for the session service
 *
 * Example:
 *   {
 *     "logging":  { "level": "DEBUG", "json": true, "console": false, "file": "${LOG_DIR}/nestegg.log" },
 *     "sessions": { "idle_ttl_seconds": 600, "max_sessions": 4, "num_threads": 8 }
 *   }
 */
struct ServiceConfig {
    LoggerConfig logging;
    SessionStoreConfig sessions;
};

/**
 * @brief Parses a service configuration from a JSON file
 *
 * Relative log file paths are resolved against the config file's directory.
 *
 * @throws ConfigParseError if the file cannot be read or JSON is invalid
 * @throws ConfigurationError if a value is out of range
 */
ServiceConfig parse_service_config_from_file(const std::string& file_path);

/**
 * @brief Parses a service configuration from a JSON string
 *
 * @throws ConfigParseError if JSON is invalid
 * @throws ConfigurationError if a value is out of range
 */
ServiceConfig parse_service_config_from_string(const std::string& json_string);

/**
 * @brief Expands environment variable references in a string
 *
 * Supports syntax: ${VAR_NAME} or $VAR_NAME. Unset variables expand to "".
 */
std::string expand_environment_variables(const std::string& value);

/**
 * @brief Resolves a path relative to the directory containing config_file_path
 *
 * Absolute paths are returned unchanged.
 */
std::string resolve_relative_path(const std::string& path, const std::string& config_file_path);

} // namespace orchestrator
} // namespace nestegg

#endif // NESTEGG_ORCHESTRATOR_CONFIG_PARSER_HPP
