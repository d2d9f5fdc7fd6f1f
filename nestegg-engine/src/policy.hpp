#ifndef NESTEGG_POLICY_HPP
#define NESTEGG_POLICY_HPP

#include <optional>

namespace nestegg {

struct Scenario;

/**
 * @brief User-adjustable levers applied on top of a fixed scenario
 */
struct PolicyParams {
    static constexpr int MAX_RETIREMENT_AGE_OFFSET = 100;

    double annual_spend_target;   // nominal, applies once every adult is retired
    int retirement_age_offset;    // years added to each planned retirement age, |offset| <= 100
    int percentile;               // reported percentile, 1-99

    PolicyParams();
    PolicyParams(double spend, int offset, int pct);

    /** Throws ConfigurationError */
    void validate() const;

    bool operator==(const PolicyParams& other) const;
    bool operator!=(const PolicyParams& other) const { return !(*this == other); }
};

/** Overrides for a recalc; unset fields keep the session's last values */
struct PartialPolicyParams {
    std::optional<double> annual_spend_target;
    std::optional<int> retirement_age_offset;
    std::optional<int> percentile;

    bool empty() const {
        return !annual_spend_target && !retirement_age_offset && !percentile;
    }
};

PolicyParams merge(const PolicyParams& base, const PartialPolicyParams& overrides);

/** Spend target from the scenario's assumptions, no offset, median */
PolicyParams default_policy(const Scenario& scenario);

} // namespace nestegg

#endif // NESTEGG_POLICY_HPP
