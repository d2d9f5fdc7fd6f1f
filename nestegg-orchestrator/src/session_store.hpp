/**
 * @file session_store.hpp
 * @brief Cached Monte Carlo sessions supporting cheap policy recalculation
 *
 * A session owns one scenario snapshot, its draw table (generated once), the
 * last committed policy parameters and the raw per-path matrix. recalc()
 * re-runs path simulation and aggregation over the cached draws; it never
 * samples again.
 *
 * Concurrency:
 * - Store bookkeeping (lookup, LRU, expiry) is guarded by one store mutex.
 * - Each session serializes its own runs. Every recalc takes a ticket; a run
 *   whose ticket is no longer the newest is cancelled and throws
 *   RecalcSuperseded, so two recalcs never share one result.
 * - Runs on different sessions proceed in parallel.
 */

#ifndef NESTEGG_SESSION_STORE_HPP
#define NESTEGG_SESSION_STORE_HPP

#include "aggregator.hpp"
#include "draw_table.hpp"
#include "logger.hpp"
#include "monte_carlo.hpp"
#include "policy.hpp"
#include "scenario.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace nestegg {
namespace orchestrator {

using SessionClock = std::chrono::steady_clock;

/**
 * @brief Session store limits
 */
struct SessionStoreConfig {
    std::chrono::seconds idle_ttl;                      ///< Expiry after last access (default 30 min)
    size_t max_sessions;                                ///< LRU eviction beyond this (default 16)
    int num_threads;                                    ///< Monte Carlo threads, 0 = OpenMP default
    std::function<SessionClock::time_point()> clock;    ///< Injectable for tests

    SessionStoreConfig();

    /** Throws ConfigurationError */
    void validate() const;
};

/**
 * @brief Returned by create_session
 */
struct SessionHandle {
    std::string session_id;
    AggregatedResult result;
};

/**
 * @brief Explicit owner of all live sessions
 *
 * Not a singleton: callers construct one and pass it where needed.
 *
 * Usage Example:
 *   @code
 *   SessionStore store;
 *   SessionHandle handle = store.create_session(scenario, 2000, 42, default_policy(scenario));
 *
 *   PartialPolicyParams overrides;
 *   overrides.retirement_age_offset = 2;
 *   AggregatedResult later = store.recalc(handle.session_id, overrides);
 *   @endcode
 */
class SessionStore {
public:
    explicit SessionStore(const SessionStoreConfig& config = SessionStoreConfig());

    SessionStore(const SessionStore&) = delete;
    SessionStore& operator=(const SessionStore&) = delete;

    /**
     * @brief Generate draws, run every path and aggregate
     *
     * @throws ConfigurationError for an invalid scenario, policy or iteration count
     * @throws NumericError if any path produces a non-finite value
     */
    SessionHandle create_session(
        const Scenario& scenario,
        size_t iterations,
        uint64_t seed,
        const PolicyParams& policy
    );

    /**
     * @brief Re-run the session over its cached draws with merged parameters
     *
     * Overrides are merged over the parameters of the most recent request
     * for this session, so successive partial edits accumulate even when an
     * earlier request is superseded.
     *
     * @throws SessionNotFound if the id is unknown or expired
     * @throws RecalcSuperseded if a newer recalc for the session arrived first
     * @throws ConfigurationError if the merged parameters are invalid
     */
    AggregatedResult recalc(const std::string& session_id, const PartialPolicyParams& overrides);

    /** Drop one session. Returns false if it was not present. */
    bool invalidate(const std::string& session_id);

    /** Drop every session built from scenario_id. Returns the number dropped. */
    size_t invalidate_scenario(const std::string& scenario_id);

    /** Drop sessions idle for longer than the TTL. Returns the number dropped. */
    size_t purge_expired();

    bool contains(const std::string& session_id) const;
    size_t size() const;

    /** Parameters of the last completed run */
    PolicyParams last_params(const std::string& session_id) const;

    /** Result of the last completed run */
    AggregatedResult last_result(const std::string& session_id) const;

    std::shared_ptr<const RawMatrix> raw_matrix(const std::string& session_id) const;
    std::shared_ptr<const DrawTable> draw_table(const std::string& session_id) const;

    const SessionStoreConfig& config() const { return config_; }

private:
    struct Session;

    SessionStoreConfig config_;
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<Session>> sessions_;

    // LRU tracking, most recent at the front
    std::list<std::string> lru_list_;
    std::map<std::string, std::list<std::string>::iterator> lru_map_;

    // Callers hold mutex_
    std::shared_ptr<Session> find_locked(const std::string& session_id, const std::string& operation) const;
    size_t purge_expired_locked(SessionClock::time_point now);
    void evict_lru_locked();
    void update_lru_locked(const std::string& session_id);
    void remove_locked(const std::string& session_id);
    std::string generate_session_id_locked() const;
};

} // namespace orchestrator
} // namespace nestegg

#endif // NESTEGG_SESSION_STORE_HPP
