/**
 * @file test_logger.cpp
 * @brief Unit tests for Logger
 */

#include <catch2/catch_test_macros.hpp>
#include "../src/logger.hpp"
#include <filesystem>
#include <fstream>
#include <map>
#include <string>
#include <vector>

using namespace nestegg;

namespace {

// Flat string-valued JSON object, as emitted by Logger; handles \" escapes
std::map<std::string, std::string> parse_json_log(const std::string& line) {
    std::map<std::string, std::string> result;

    auto read_string = [&line](size_t& pos) {
        std::string out;
        pos = line.find('"', pos) + 1;
        while (pos < line.size() && line[pos] != '"') {
            if (line[pos] == '\\' && pos + 1 < line.size()) {
                char next = line[pos + 1];
                out += next == 'n' ? '\n' : next;
                pos += 2;
            } else {
                out += line[pos++];
            }
        }
        pos++;
        return out;
    };

    size_t pos = 1;
    while (line.find('"', pos) != std::string::npos) {
        std::string key = read_string(pos);
        std::string value = read_string(pos);
        result[key] = value;
    }
    return result;
}

std::vector<std::string> configure_and_capture(const LoggerConfig& base, const std::string& path,
                                               void (*emit)(Logger&)) {
    std::filesystem::remove(path);

    LoggerConfig config = base;
    config.enable_console = false;
    config.enable_file = true;
    config.log_file_path = path;

    Logger& logger = Logger::get_instance();
    logger.configure(config);
    emit(logger);
    logger.flush();

    // Release the file before reading and removing it
    LoggerConfig quiet;
    quiet.enable_console = false;
    logger.configure(quiet);

    std::vector<std::string> lines;
    std::ifstream file(path);
    std::string line;
    while (std::getline(file, line)) {
        lines.push_back(line);
    }
    file.close();
    std::filesystem::remove(path);
    return lines;
}

LoggerConfig debug_json() {
    LoggerConfig config;
    config.min_level = LogLevel::DEBUG;
    return config;
}

} // anonymous namespace

TEST_CASE("Logger Configuration", "[logger]") {
    SECTION("Default configuration") {
        LoggerConfig config;

        REQUIRE(config.min_level == LogLevel::INFO);
        REQUIRE(config.enable_console == true);
        REQUIRE(config.enable_file == false);
        REQUIRE(config.enable_json == true);
        REQUIRE(config.log_file_path == "nestegg.log");
    }

    SECTION("Level round trip") {
        REQUIRE(string_to_level(level_to_string(LogLevel::WARN)) == LogLevel::WARN);
        REQUIRE(string_to_level("verbose") == LogLevel::INFO);
    }

    SECTION("Min level is applied") {
        Logger& logger = Logger::get_instance();
        LoggerConfig config;
        config.min_level = LogLevel::WARN;
        config.enable_console = false;
        logger.configure(config);
        REQUIRE(logger.get_min_level() == LogLevel::WARN);

        logger.set_min_level(LogLevel::DEBUG);
        REQUIRE(logger.get_min_level() == LogLevel::DEBUG);
    }
}

TEST_CASE("Logger session_created event", "[logger]") {
    auto lines = configure_and_capture(debug_json(), "test_session_created.log", [](Logger& logger) {
        RunMetrics metrics;
        metrics.execution_time_ms = 120.0;
        metrics.draw_time_ms = 20.0;
        metrics.simulate_time_ms = 90.0;
        metrics.aggregate_time_ms = 10.0;
        metrics.paths = 2000;
        metrics.years = 60;
        metrics.draw_table_bytes = 2 * 1024 * 1024;
        logger.log_session_created(LogContext("abc123", "household", "create_session"), 2000, 42, metrics);
    });

    REQUIRE(lines.size() == 1);
    auto fields = parse_json_log(lines[0]);

    REQUIRE(fields["event"] == "session_created");
    REQUIRE(fields["level"] == "INFO");
    REQUIRE(fields["message"] == "Session created");
    REQUIRE(fields["session_id"] == "abc123");
    REQUIRE(fields["scenario_id"] == "household");
    REQUIRE(fields["operation"] == "create_session");
    REQUIRE(fields["iterations"] == "2000");
    REQUIRE(fields["seed"] == "42");
    REQUIRE(fields["paths"] == "2000");
    REQUIRE(fields["years"] == "60");
    REQUIRE(fields["draw_table_mb"] == "2.000000");
    REQUIRE(fields.count("timestamp") == 1);
    REQUIRE(std::stod(fields["path_years_per_sec"]) > 0.0);
}

TEST_CASE("Logger recalc_complete event carries the parameters", "[logger]") {
    auto lines = configure_and_capture(debug_json(), "test_recalc.log", [](Logger& logger) {
        std::map<std::string, std::string> params;
        params["annual_spend_target"] = "30000";
        params["retirement_age_offset"] = "2";
        RunMetrics metrics;
        metrics.paths = 10;
        metrics.years = 5;
        logger.log_recalc_complete(LogContext("s1", "household", "recalc"), params, metrics);
    });

    REQUIRE(lines.size() == 1);
    auto fields = parse_json_log(lines[0]);
    REQUIRE(fields["event"] == "recalc_complete");
    REQUIRE(fields["params.annual_spend_target"] == "30000");
    REQUIRE(fields["params.retirement_age_offset"] == "2");
    REQUIRE(fields["draw_time_ms"] == "0.000000");
    REQUIRE(fields["path_years_per_sec"] == "0.000000");
}

TEST_CASE("Logger lifecycle events and levels", "[logger]") {
    SECTION("Supersession is DEBUG, expiry is WARN") {
        auto lines = configure_and_capture(debug_json(), "test_lifecycle.log", [](Logger& logger) {
            LogContext ctx("s1", "household", "recalc");
            logger.log_session_event(ctx, "recalc_superseded", "before start");
            logger.log_session_event(ctx, "session_expired");
        });

        REQUIRE(lines.size() == 2);
        auto superseded = parse_json_log(lines[0]);
        REQUIRE(superseded["level"] == "DEBUG");
        REQUIRE(superseded["event"] == "recalc_superseded");
        REQUIRE(superseded["detail"] == "before start");
        REQUIRE(superseded["message"] == "Session superseded");

        auto expired = parse_json_log(lines[1]);
        REQUIRE(expired["level"] == "WARN");
        REQUIRE(expired["message"] == "Session expired");
        REQUIRE(expired.count("detail") == 0);
    }

    SECTION("Events below the minimum level are dropped") {
        LoggerConfig config;
        config.min_level = LogLevel::WARN;
        auto lines = configure_and_capture(config, "test_filter.log", [](Logger& logger) {
            LogContext ctx("s1", "household", "recalc");
            logger.log_recalc_complete(ctx, {}, RunMetrics());
            logger.log_session_event(ctx, "recalc_superseded");
            logger.log_warning(ctx, "slow recalc");
            logger.log_error(ctx, "boom");
        });

        REQUIRE(lines.size() == 2);
        REQUIRE(parse_json_log(lines[0])["event"] == "warning");
        REQUIRE(parse_json_log(lines[1])["event"] == "error");
    }
}

TEST_CASE("Logger error event", "[logger]") {
    auto lines = configure_and_capture(debug_json(), "test_error.log", [](Logger& logger) {
        logger.log_error(LogContext("", "household", "create_session"),
                         "Configuration error: assets[2].growth_rate_std: must be non-negative",
                         "assets[2].growth_rate_std");
    });

    REQUIRE(lines.size() == 1);
    auto fields = parse_json_log(lines[0]);
    REQUIRE(fields["level"] == "ERROR");
    REQUIRE(fields["field"] == "assets[2].growth_rate_std");
    REQUIRE(fields.count("session_id") == 0);
    REQUIRE(fields["scenario_id"] == "household");
}

TEST_CASE("Logger escapes JSON strings", "[logger]") {
    auto lines = configure_and_capture(debug_json(), "test_escape.log", [](Logger& logger) {
        logger.log_warning(LogContext("s1", "", ""), "quote \" and\nnewline");
    });

    REQUIRE(lines.size() == 1);
    REQUIRE(lines[0].find("quote \\\" and\\nnewline") != std::string::npos);
    auto fields = parse_json_log(lines[0]);
    REQUIRE(fields["warning"] == "quote \" and\nnewline");
}

TEST_CASE("Logger plain text format", "[logger]") {
    LoggerConfig config = debug_json();
    config.enable_json = false;
    auto lines = configure_and_capture(config, "test_plain.log", [](Logger& logger) {
        logger.log_session_event(LogContext("s9", "household", "invalidate"), "session_invalidated");
    });

    REQUIRE(lines.size() == 1);
    REQUIRE(lines[0].find("[WARN] Session invalidated {") != std::string::npos);
    REQUIRE(lines[0].find("event=session_invalidated") != std::string::npos);
    REQUIRE(lines[0].find("session_id=s9") != std::string::npos);
}
