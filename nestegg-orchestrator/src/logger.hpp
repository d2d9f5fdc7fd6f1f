/**
 * @file logger.hpp
 * @brief Structured logging for the session service with JSON output
 *
 * The Logger emits one line per event with:
 * - Multiple log levels (DEBUG, INFO, WARN, ERROR)
 * - JSON-formatted or plain-text output
 * - Session context (session id, scenario id, operation)
 * - Run timings (draw, simulate, aggregate) and matrix dimensions
 *
 * The logger holds no session state; sessions live in a SessionStore.
 */

#ifndef NESTEGG_LOGGER_HPP
#define NESTEGG_LOGGER_HPP

#include <cstddef>
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace nestegg {

/**
 * @brief Log severity levels
 */
enum class LogLevel {
    DEBUG,   ///< Per-run timing breakdowns
    INFO,    ///< Session created, recalc complete
    WARN,    ///< Superseded recalcs, expiry, eviction
    ERROR    ///< Failures surfaced to the caller
};

inline std::string level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Parse log level from string, INFO when unrecognised
 */
inline LogLevel string_to_level(const std::string& level_str) {
    if (level_str == "DEBUG") return LogLevel::DEBUG;
    if (level_str == "INFO") return LogLevel::INFO;
    if (level_str == "WARN") return LogLevel::WARN;
    if (level_str == "ERROR") return LogLevel::ERROR;
    return LogLevel::INFO;
}

/**
 * @brief Which session and operation an event belongs to
 */
struct LogContext {
    std::string session_id;
    std::string scenario_id;
    std::string operation;           ///< create_session, recalc, purge, ...

    LogContext() = default;

    LogContext(const std::string& session, const std::string& scenario, const std::string& op)
        : session_id(session), scenario_id(scenario), operation(op) {}
};

/**
 * @brief Timings and sizes of one Monte Carlo run
 */
struct RunMetrics {
    double execution_time_ms;        ///< Wall time of the whole call
    double draw_time_ms;             ///< Draw table generation (0 on recalc)
    double simulate_time_ms;         ///< Path simulation
    double aggregate_time_ms;        ///< Percentile reduction
    size_t paths;
    size_t years;
    size_t draw_table_bytes;

    RunMetrics()
        : execution_time_ms(0.0), draw_time_ms(0.0), simulate_time_ms(0.0),
          aggregate_time_ms(0.0), paths(0), years(0), draw_table_bytes(0) {}
};

/**
 * @brief Logger configuration
 */
struct LoggerConfig {
    LogLevel min_level;              ///< Minimum log level to output
    bool enable_console;             ///< Log to stderr
    bool enable_file;                ///< Log to file
    std::string log_file_path;
    bool enable_json;                ///< JSON lines vs. plain text

    LoggerConfig()
        : min_level(LogLevel::INFO),
          enable_console(true),
          enable_file(false),
          log_file_path("nestegg.log"),
          enable_json(true) {}
};

/**
 * @brief Structured logger with JSON output
 *
 * Usage Example:
 *   @code
 *   LoggerConfig config;
 *   config.min_level = LogLevel::DEBUG;
 *   Logger::get_instance().configure(config);
 *
 *   LogContext ctx(session_id, scenario.scenario_id, "recalc");
 *   RunMetrics metrics;
 *   metrics.paths = 2000;
 *   Logger::get_instance().log_recalc_complete(ctx, params, metrics);
 *   @endcode
 */
class Logger {
public:
    static Logger& get_instance();

    void configure(const LoggerConfig& config);

    /**
     * @brief Log a new session: draw table generated and first run aggregated
     *
     * @param ctx Session context
     * @param iterations Path count
     * @param seed RNG seed
     * @param metrics Run metrics including draw generation time
     */
    void log_session_created(
        const LogContext& ctx,
        size_t iterations,
        unsigned long long seed,
        const RunMetrics& metrics
    );

    /**
     * @brief Log a completed recalculation
     *
     * @param ctx Session context
     * @param params Merged policy parameters, rendered as key/value pairs
     * @param metrics Run metrics (draw_time_ms is always 0)
     */
    void log_recalc_complete(
        const LogContext& ctx,
        const std::map<std::string, std::string>& params,
        const RunMetrics& metrics
    );

    /**
     * @brief Log a lifecycle event: superseded, expired, evicted or invalidated
     */
    void log_session_event(
        const LogContext& ctx,
        const std::string& event,
        const std::string& detail = ""
    );

    void log_error(
        const LogContext& ctx,
        const std::string& error_message,
        const std::string& field = ""
    );

    void log_warning(
        const LogContext& ctx,
        const std::string& warning_message
    );

    void flush();

    void set_min_level(LogLevel level);
    LogLevel get_min_level() const;

private:
    Logger();
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    LoggerConfig config_;
    std::unique_ptr<std::ofstream> file_stream_;
    mutable std::mutex mutex_;

    void log(LogLevel level, const std::string& message, const std::map<std::string, std::string>& fields);
    void add_context(std::map<std::string, std::string>& fields, const LogContext& ctx) const;
    void add_metrics(std::map<std::string, std::string>& fields, const RunMetrics& metrics) const;
    std::string get_timestamp() const;
    std::string format_json(const std::map<std::string, std::string>& fields) const;
    std::string escape_json_string(const std::string& str) const;
    void write_output(const std::string& output);
};

} // namespace nestegg

#endif // NESTEGG_LOGGER_HPP
