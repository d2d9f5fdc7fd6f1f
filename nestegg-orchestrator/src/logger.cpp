/**
 * @file logger.cpp
 * @brief Implementation of structured logger
 */

#include "logger.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace nestegg {

Logger& Logger::get_instance() {
    static Logger instance;
    return instance;
}

Logger::Logger() {
    config_ = LoggerConfig();
}

Logger::~Logger() {
    flush();
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->close();
    }
}

void Logger::configure(const LoggerConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;
    file_stream_.reset();

    if (config_.enable_file) {
        file_stream_ = std::make_unique<std::ofstream>(config_.log_file_path, std::ios::app);
        if (!file_stream_->is_open()) {
            std::cerr << "Warning: Failed to open log file: " << config_.log_file_path << std::endl;
        }
    }
}

void Logger::set_min_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_.min_level = level;
}

LogLevel Logger::get_min_level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_.min_level;
}

void Logger::add_context(std::map<std::string, std::string>& fields, const LogContext& ctx) const {
    if (!ctx.session_id.empty()) {
        fields["session_id"] = ctx.session_id;
    }
    if (!ctx.scenario_id.empty()) {
        fields["scenario_id"] = ctx.scenario_id;
    }
    if (!ctx.operation.empty()) {
        fields["operation"] = ctx.operation;
    }
}

void Logger::add_metrics(std::map<std::string, std::string>& fields, const RunMetrics& metrics) const {
    fields["execution_time_ms"] = std::to_string(metrics.execution_time_ms);
    fields["draw_time_ms"] = std::to_string(metrics.draw_time_ms);
    fields["simulate_time_ms"] = std::to_string(metrics.simulate_time_ms);
    fields["aggregate_time_ms"] = std::to_string(metrics.aggregate_time_ms);
    fields["paths"] = std::to_string(metrics.paths);
    fields["years"] = std::to_string(metrics.years);
    fields["draw_table_mb"] = std::to_string(metrics.draw_table_bytes / (1024.0 * 1024.0));
    fields["path_years_per_sec"] = std::to_string(
        metrics.simulate_time_ms > 0
            ? (metrics.paths * metrics.years * 1000.0 / metrics.simulate_time_ms) : 0
    );
}

void Logger::log_session_created(
    const LogContext& ctx,
    size_t iterations,
    unsigned long long seed,
    const RunMetrics& metrics
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "session_created";
    add_context(fields, ctx);
    fields["iterations"] = std::to_string(iterations);
    fields["seed"] = std::to_string(seed);
    add_metrics(fields, metrics);

    log(LogLevel::INFO, "Session created", fields);
}

void Logger::log_recalc_complete(
    const LogContext& ctx,
    const std::map<std::string, std::string>& params,
    const RunMetrics& metrics
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "recalc_complete";
    add_context(fields, ctx);
    for (const auto& [key, value] : params) {
        fields["params." + key] = value;
    }
    add_metrics(fields, metrics);

    log(LogLevel::INFO, "Recalculation complete", fields);
}

void Logger::log_session_event(
    const LogContext& ctx,
    const std::string& event,
    const std::string& detail
) {
    std::map<std::string, std::string> fields;
    fields["event"] = event;
    add_context(fields, ctx);
    if (!detail.empty()) {
        fields["detail"] = detail;
    }

    LogLevel level = event == "recalc_superseded" ? LogLevel::DEBUG : LogLevel::WARN;
    log(level, "Session " + event.substr(event.find('_') + 1), fields);
}

void Logger::log_error(
    const LogContext& ctx,
    const std::string& error_message,
    const std::string& field
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "error";
    add_context(fields, ctx);
    fields["error_message"] = error_message;

    if (!field.empty()) {
        fields["field"] = field;
    }

    log(LogLevel::ERROR, "Session error", fields);
}

void Logger::log_warning(
    const LogContext& ctx,
    const std::string& warning_message
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "warning";
    add_context(fields, ctx);
    fields["warning"] = warning_message;

    log(LogLevel::WARN, warning_message, fields);
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (config_.enable_console) {
        std::cerr.flush();
    }
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->flush();
    }
}

void Logger::log(
    LogLevel level,
    const std::string& message,
    const std::map<std::string, std::string>& fields
) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level < config_.min_level) {
        return;
    }

    std::string output;

    if (config_.enable_json) {
        std::map<std::string, std::string> json_fields = fields;
        json_fields["timestamp"] = get_timestamp();
        json_fields["level"] = level_to_string(level);
        json_fields["message"] = message;
        output = format_json(json_fields);
    } else {
        std::ostringstream oss;
        oss << get_timestamp() << " [" << level_to_string(level) << "] " << message;

        if (!fields.empty()) {
            oss << " {";
            bool first = true;
            for (const auto& [key, value] : fields) {
                if (!first) oss << ", ";
                oss << key << "=" << value;
                first = false;
            }
            oss << "}";
        }

        output = oss.str();
    }

    write_output(output);
}

std::string Logger::get_timestamp() const {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()
    ) % 1000;

    std::tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &time_t_now);
#else
    localtime_r(&time_t_now, &tm_buf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count();

    return oss.str();
}

std::string Logger::format_json(const std::map<std::string, std::string>& fields) const {
    std::ostringstream oss;
    oss << "{";

    bool first = true;
    for (const auto& [key, value] : fields) {
        if (!first) oss << ",";
        oss << "\"" << escape_json_string(key) << "\":\"" << escape_json_string(value) << "\"";
        first = false;
    }

    oss << "}";
    return oss.str();
}

std::string Logger::escape_json_string(const std::string& str) const {
    std::ostringstream oss;
    for (char c : str) {
        switch (c) {
            case '"':  oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (c >= 0 && c < 32) {
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(c)
                        << std::dec;
                } else {
                    oss << c;
                }
        }
    }
    return oss.str();
}

void Logger::write_output(const std::string& output) {
    if (config_.enable_console) {
        std::cerr << output << std::endl;
    }

    if (config_.enable_file && file_stream_ && file_stream_->is_open()) {
        *file_stream_ << output << std::endl;
    }
}

} // namespace nestegg
