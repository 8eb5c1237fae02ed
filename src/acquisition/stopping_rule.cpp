#include "acquisition/stopping_rule.hpp"
#include <cmath>
#include <stdexcept>

namespace ActivePref {
namespace Acquisition {

void StopConfig::validate() const {
    if (!(epsilon >= 0.0) || !std::isfinite(epsilon)) {
        throw std::invalid_argument("Stopping epsilon must be finite and non-negative");
    }
    if (max_queries == 0) {
        throw std::invalid_argument("max_queries must be at least 1");
    }
}

std::string to_string(StopReason reason) {
    switch (reason) {
        case StopReason::Continue: return "continue";
        case StopReason::BelowEpsilon: return "below_epsilon";
        case StopReason::MaxQueries: return "max_queries";
    }
    return "unknown";
}

StoppingRule::StoppingRule(StopConfig config, Core::Criterion criterion)
    : config_(config), criterion_(criterion) {
    config_.validate();
}

StopDecision StoppingRule::evaluate(double best_score, size_t queries_asked) const {
    StopDecision decision;
    if (queries_asked >= config_.max_queries) {
        decision.should_stop = true;
        decision.reason = StopReason::MaxQueries;
        return decision;
    }

    bool below = criterion_ == Core::Criterion::Information
                     ? best_score < config_.epsilon
                     : best_score <= config_.epsilon;
    if (below) {
        decision.should_stop = true;
        decision.reason = StopReason::BelowEpsilon;
    }
    return decision;
}

} // namespace Acquisition
} // namespace ActivePref
