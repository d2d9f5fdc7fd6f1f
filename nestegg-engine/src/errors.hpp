#ifndef NESTEGG_ERRORS_HPP
#define NESTEGG_ERRORS_HPP

#include <cstddef>
#include <limits>
#include <stdexcept>
#include <string>

namespace nestegg {

/**
 * @brief Base exception for all simulation engine errors
 */
class EngineError : public std::runtime_error {
public:
    explicit EngineError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Raised when a scenario, tax table or policy is malformed
 *
 * Detected once, before any simulation runs. field() names the offending
 * input, e.g. "assets[2].growth_rate_std".
 */
class ConfigurationError : public EngineError {
public:
    ConfigurationError(const std::string& field, const std::string& message)
        : EngineError("Configuration error: " + field + ": " + message),
          field_(field) {}

    const std::string& field() const { return field_; }

private:
    std::string field_;
};

/**
 * @brief Raised when a NaN or infinite value appears mid-simulation
 *
 * Fatal for the whole run: a non-finite value means a configuration or
 * engine defect, never a valid random outcome.
 */
class NumericError : public EngineError {
public:
    static constexpr size_t UNKNOWN_PATH = std::numeric_limits<size_t>::max();

    NumericError(size_t path, int year, const std::string& field)
        : EngineError(build_message(path, year, field)),
          path_(path), year_(year), field_(field) {}

    size_t path() const { return path_; }
    int year() const { return year_; }
    const std::string& field() const { return field_; }

private:
    static std::string build_message(size_t path, int year, const std::string& field) {
        std::string msg = "Numeric error: non-finite " + field + " in year " + std::to_string(year);
        if (path != UNKNOWN_PATH) {
            msg += " on path " + std::to_string(path);
        }
        return msg;
    }

    size_t path_;
    int year_;
    std::string field_;
};

/**
 * @brief Raised when a session id is unknown or has expired
 */
class SessionNotFound : public EngineError {
public:
    explicit SessionNotFound(const std::string& session_id)
        : EngineError("Session not found (expired?): " + session_id),
          session_id_(session_id) {}

    const std::string& session_id() const { return session_id_; }

private:
    std::string session_id_;
};

/**
 * @brief Raised when a recalculation is overtaken by a newer one for the same session
 */
class RecalcSuperseded : public EngineError {
public:
    explicit RecalcSuperseded(const std::string& session_id)
        : EngineError("Recalculation superseded by a newer request: " + session_id),
          session_id_(session_id) {}

    const std::string& session_id() const { return session_id_; }

private:
    std::string session_id_;
};

} // namespace nestegg

#endif // NESTEGG_ERRORS_HPP
