#include "policy.hpp"
#include "errors.hpp"
#include "scenario.hpp"
#include <cmath>
#include <string>

namespace nestegg {

PolicyParams::PolicyParams()
    : annual_spend_target(0.0)
    , retirement_age_offset(0)
    , percentile(50)
{}

PolicyParams::PolicyParams(double spend, int offset, int pct)
    : annual_spend_target(spend)
    , retirement_age_offset(offset)
    , percentile(pct)
{}

void PolicyParams::validate() const {
    if (!std::isfinite(annual_spend_target) || annual_spend_target < 0.0) {
        throw ConfigurationError("annual_spend_target", "must be a finite non-negative amount");
    }
    if (retirement_age_offset < -MAX_RETIREMENT_AGE_OFFSET ||
        retirement_age_offset > MAX_RETIREMENT_AGE_OFFSET) {
        throw ConfigurationError("retirement_age_offset",
                                 "must be between -" + std::to_string(MAX_RETIREMENT_AGE_OFFSET) +
                                 " and " + std::to_string(MAX_RETIREMENT_AGE_OFFSET));
    }
    if (percentile < 1 || percentile > 99) {
        throw ConfigurationError("percentile", "must be between 1 and 99");
    }
}

bool PolicyParams::operator==(const PolicyParams& other) const {
    return annual_spend_target == other.annual_spend_target &&
           retirement_age_offset == other.retirement_age_offset &&
           percentile == other.percentile;
}

PolicyParams merge(const PolicyParams& base, const PartialPolicyParams& overrides) {
    PolicyParams merged = base;
    if (overrides.annual_spend_target) {
        merged.annual_spend_target = *overrides.annual_spend_target;
    }
    if (overrides.retirement_age_offset) {
        merged.retirement_age_offset = *overrides.retirement_age_offset;
    }
    if (overrides.percentile) {
        merged.percentile = *overrides.percentile;
    }
    return merged;
}

PolicyParams default_policy(const Scenario& scenario) {
    return PolicyParams(scenario.assumptions.annual_spend_target, 0, 50);
}

} // namespace nestegg
