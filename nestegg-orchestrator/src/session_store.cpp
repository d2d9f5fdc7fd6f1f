/**
 * @file session_store.cpp
 * @brief Implementation of the session store
 */

#include "session_store.hpp"
#include "errors.hpp"
#include <atomic>
#include <iomanip>
#include <random>
#include <sstream>

namespace nestegg {
namespace orchestrator {

// ============================================================================
// Session
// ============================================================================

struct SessionStore::Session {
    std::string id;
    std::shared_ptr<const Scenario> scenario;
    std::shared_ptr<const DrawTable> draws;
    uint64_t seed;

    // Guarded by the store mutex
    SessionClock::time_point last_access;
    PolicyParams requested_params;

    // Newest recalc ticket; a run whose ticket differs is stale
    std::atomic<uint64_t> latest_ticket;

    // Serializes runs; guards everything below
    std::mutex run_mutex;
    PolicyParams last_params;
    std::shared_ptr<const RawMatrix> matrix;
    AggregatedResult last_result;

    Session() : seed(0), latest_ticket(0) {}
};

// ============================================================================
// SessionStoreConfig Implementation
// ============================================================================

SessionStoreConfig::SessionStoreConfig()
    : idle_ttl(std::chrono::minutes(30)),
      max_sessions(16),
      num_threads(0),
      clock([] { return SessionClock::now(); }) {}

void SessionStoreConfig::validate() const {
    if (idle_ttl.count() <= 0) {
        throw ConfigurationError("sessions.idle_ttl_seconds", "must be positive");
    }
    if (max_sessions == 0) {
        throw ConfigurationError("sessions.max_sessions", "must be at least 1");
    }
    if (num_threads < 0) {
        throw ConfigurationError("sessions.num_threads", "must be non-negative");
    }
    if (!clock) {
        throw ConfigurationError("sessions.clock", "must be set");
    }
}

// ============================================================================
// Helpers
// ============================================================================

namespace {

double elapsed_ms(std::chrono::high_resolution_clock::time_point since) {
    return std::chrono::duration<double, std::milli>(
        std::chrono::high_resolution_clock::now() - since).count();
}

std::map<std::string, std::string> describe(const PolicyParams& params) {
    std::map<std::string, std::string> fields;
    fields["annual_spend_target"] = std::to_string(params.annual_spend_target);
    fields["retirement_age_offset"] = std::to_string(params.retirement_age_offset);
    fields["percentile"] = std::to_string(params.percentile);
    return fields;
}

} // anonymous namespace

// ============================================================================
// SessionStore Implementation
// ============================================================================

SessionStore::SessionStore(const SessionStoreConfig& config)
    : config_(config) {
    config_.validate();
}

SessionHandle SessionStore::create_session(
    const Scenario& scenario,
    size_t iterations,
    uint64_t seed,
    const PolicyParams& policy
) {
    Logger& logger = Logger::get_instance();
    LogContext ctx("", scenario.scenario_id, "create_session");
    auto start_time = std::chrono::high_resolution_clock::now();

    auto session = std::make_shared<Session>();
    RunMetrics metrics;

    try {
        scenario.validate();
        policy.validate();

        session->scenario = std::make_shared<const Scenario>(scenario);
        session->seed = seed;

        auto draw_start = std::chrono::high_resolution_clock::now();
        session->draws = std::make_shared<const DrawTable>(
            DrawTable::generate(*session->scenario, iterations, seed));
        metrics.draw_time_ms = elapsed_ms(draw_start);

        MonteCarloConfig mc_config;
        mc_config.num_threads = config_.num_threads;
        mc_config.run_id = "create_session";

        auto simulate_start = std::chrono::high_resolution_clock::now();
        session->matrix = run_monte_carlo(*session->scenario, policy, *session->draws, mc_config);
        metrics.simulate_time_ms = elapsed_ms(simulate_start);

        auto aggregate_start = std::chrono::high_resolution_clock::now();
        session->last_result = aggregate(*session->matrix, *session->scenario, policy, seed);
        metrics.aggregate_time_ms = elapsed_ms(aggregate_start);
    } catch (const ConfigurationError& e) {
        logger.log_error(ctx, e.what(), e.field());
        throw;
    } catch (const std::exception& e) {
        logger.log_error(ctx, e.what());
        throw;
    }

    session->last_params = policy;
    session->requested_params = policy;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        SessionClock::time_point now = config_.clock();
        purge_expired_locked(now);

        session->id = generate_session_id_locked();
        session->last_access = now;

        while (sessions_.size() >= config_.max_sessions) {
            evict_lru_locked();
        }
        sessions_[session->id] = session;
        update_lru_locked(session->id);
    }

    metrics.paths = session->draws->num_paths();
    metrics.years = session->draws->num_years();
    metrics.draw_table_bytes = session->draws->memory_footprint();
    metrics.execution_time_ms = elapsed_ms(start_time);

    ctx.session_id = session->id;
    logger.log_session_created(ctx, iterations, seed, metrics);

    SessionHandle handle;
    handle.session_id = session->id;
    handle.result = session->last_result;
    return handle;
}

AggregatedResult SessionStore::recalc(
    const std::string& session_id,
    const PartialPolicyParams& overrides
) {
    Logger& logger = Logger::get_instance();
    LogContext ctx(session_id, "", "recalc");
    auto start_time = std::chrono::high_resolution_clock::now();

    std::shared_ptr<Session> session;
    PolicyParams params;
    uint64_t ticket = 0;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        SessionClock::time_point now = config_.clock();
        purge_expired_locked(now);

        try {
            session = find_locked(session_id, "recalc");
        } catch (const SessionNotFound& e) {
            logger.log_error(ctx, e.what());
            throw;
        }
        ctx.scenario_id = session->scenario->scenario_id;

        params = merge(session->requested_params, overrides);
        try {
            params.validate();
        } catch (const ConfigurationError& e) {
            logger.log_error(ctx, e.what(), e.field());
            throw;
        }

        session->requested_params = params;
        session->last_access = now;
        update_lru_locked(session_id);

        // Taking the ticket under the store mutex orders tickets by arrival
        ticket = ++session->latest_ticket;
    }

    std::lock_guard<std::mutex> run_lock(session->run_mutex);

    if (session->latest_ticket.load() != ticket) {
        logger.log_session_event(ctx, "recalc_superseded", "before start");
        throw RecalcSuperseded(session_id);
    }

    RunMetrics metrics;
    std::shared_ptr<RawMatrix> matrix;
    AggregatedResult result;

    try {
        MonteCarloConfig mc_config;
        mc_config.num_threads = config_.num_threads;
        mc_config.run_id = session_id;
        Session* raw = session.get();
        mc_config.is_cancelled = [raw, ticket] {
            return raw->latest_ticket.load(std::memory_order_relaxed) != ticket;
        };

        auto simulate_start = std::chrono::high_resolution_clock::now();
        matrix = run_monte_carlo(*session->scenario, params, *session->draws, mc_config);
        metrics.simulate_time_ms = elapsed_ms(simulate_start);

        auto aggregate_start = std::chrono::high_resolution_clock::now();
        result = aggregate(*matrix, *session->scenario, params, session->seed);
        metrics.aggregate_time_ms = elapsed_ms(aggregate_start);
    } catch (const RecalcSuperseded&) {
        logger.log_session_event(ctx, "recalc_superseded", "during simulation");
        throw;
    } catch (const std::exception& e) {
        logger.log_error(ctx, e.what());
        throw;
    }

    session->last_params = params;
    session->matrix = matrix;
    session->last_result = result;

    metrics.paths = session->draws->num_paths();
    metrics.years = session->draws->num_years();
    metrics.draw_table_bytes = session->draws->memory_footprint();
    metrics.execution_time_ms = elapsed_ms(start_time);
    logger.log_recalc_complete(ctx, describe(params), metrics);

    return result;
}

bool SessionStore::invalidate(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    purge_expired_locked(config_.clock());

    if (sessions_.find(session_id) == sessions_.end()) {
        return false;
    }

    LogContext ctx(session_id, sessions_[session_id]->scenario->scenario_id, "invalidate");
    remove_locked(session_id);
    Logger::get_instance().log_session_event(ctx, "session_invalidated");
    return true;
}

size_t SessionStore::invalidate_scenario(const std::string& scenario_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    purge_expired_locked(config_.clock());

    std::vector<std::string> doomed;
    for (const auto& [id, session] : sessions_) {
        if (session->scenario->scenario_id == scenario_id) {
            doomed.push_back(id);
        }
    }

    for (const std::string& id : doomed) {
        remove_locked(id);
        Logger::get_instance().log_session_event(
            LogContext(id, scenario_id, "invalidate_scenario"), "session_invalidated", "scenario edited");
    }
    return doomed.size();
}

size_t SessionStore::purge_expired() {
    std::lock_guard<std::mutex> lock(mutex_);
    return purge_expired_locked(config_.clock());
}

bool SessionStore::contains(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    return it != sessions_.end() &&
           config_.clock() - it->second->last_access <= config_.idle_ttl;
}

size_t SessionStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

PolicyParams SessionStore::last_params(const std::string& session_id) const {
    std::shared_ptr<Session> session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        session = find_locked(session_id, "last_params");
    }
    std::lock_guard<std::mutex> run_lock(session->run_mutex);
    return session->last_params;
}

AggregatedResult SessionStore::last_result(const std::string& session_id) const {
    std::shared_ptr<Session> session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        session = find_locked(session_id, "last_result");
    }
    std::lock_guard<std::mutex> run_lock(session->run_mutex);
    return session->last_result;
}

std::shared_ptr<const RawMatrix> SessionStore::raw_matrix(const std::string& session_id) const {
    std::shared_ptr<Session> session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        session = find_locked(session_id, "raw_matrix");
    }
    std::lock_guard<std::mutex> run_lock(session->run_mutex);
    return session->matrix;
}

std::shared_ptr<const DrawTable> SessionStore::draw_table(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return find_locked(session_id, "draw_table")->draws;
}

std::shared_ptr<SessionStore::Session> SessionStore::find_locked(
    const std::string& session_id,
    const std::string& operation
) const {
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        throw SessionNotFound(session_id);
    }
    // Expired but not yet purged by a mutating call
    if (config_.clock() - it->second->last_access > config_.idle_ttl) {
        Logger::get_instance().log_session_event(
            LogContext(session_id, it->second->scenario->scenario_id, operation), "session_expired", "found stale");
        throw SessionNotFound(session_id);
    }
    return it->second;
}

size_t SessionStore::purge_expired_locked(SessionClock::time_point now) {
    std::vector<std::string> expired;
    for (const auto& [id, session] : sessions_) {
        if (now - session->last_access > config_.idle_ttl) {
            expired.push_back(id);
        }
    }

    for (const std::string& id : expired) {
        LogContext ctx(id, sessions_[id]->scenario->scenario_id, "purge");
        remove_locked(id);
        Logger::get_instance().log_session_event(ctx, "session_expired");
    }
    return expired.size();
}

void SessionStore::evict_lru_locked() {
    if (lru_list_.empty()) {
        return;
    }
    std::string victim = lru_list_.back();
    LogContext ctx(victim, sessions_[victim]->scenario->scenario_id, "create_session");
    remove_locked(victim);
    Logger::get_instance().log_session_event(ctx, "session_evicted", "max_sessions reached");
}

void SessionStore::update_lru_locked(const std::string& session_id) {
    auto it = lru_map_.find(session_id);
    if (it != lru_map_.end()) {
        lru_list_.erase(it->second);
    }
    lru_list_.push_front(session_id);
    lru_map_[session_id] = lru_list_.begin();
}

void SessionStore::remove_locked(const std::string& session_id) {
    auto it = lru_map_.find(session_id);
    if (it != lru_map_.end()) {
        lru_list_.erase(it->second);
        lru_map_.erase(it);
    }
    sessions_.erase(session_id);
}

std::string SessionStore::generate_session_id_locked() const {
    static thread_local std::mt19937_64 rng(std::random_device{}());

    std::string id;
    do {
        std::ostringstream oss;
        oss << std::hex << std::setfill('0')
            << std::setw(16) << rng()
            << std::setw(16) << rng();
        id = oss.str();
    } while (sessions_.count(id) > 0);
    return id;
}

} // namespace orchestrator
} // namespace nestegg
