#pragma once

#include "core/types.hpp"
#include <string>

namespace ActivePref {
namespace Acquisition {

struct StopConfig {
    double epsilon = 0.0;
    size_t max_queries = 100;   // Safety bound for every criterion

    void validate() const;
};

enum class StopReason {
    Continue,
    BelowEpsilon,
    MaxQueries
};

std::string to_string(StopReason reason);

struct StopDecision {
    bool should_stop = false;
    StopReason reason = StopReason::Continue;
};

/**
 * Decides whether another query is worth asking.
 *
 * Information criterion stops when the best score drops strictly below
 * epsilon, so epsilon = 0 never stops on score alone. Volume and random stop
 * when the score is at or below epsilon.
 */
class StoppingRule {
public:
    StoppingRule(StopConfig config, Core::Criterion criterion);

    const StopConfig& config() const { return config_; }

    // @param best_score Score of the query about to be asked
    // @param queries_asked Queries answered so far
    StopDecision evaluate(double best_score, size_t queries_asked) const;

private:
    StopConfig config_;
    Core::Criterion criterion_;
};

} // namespace Acquisition
} // namespace ActivePref
