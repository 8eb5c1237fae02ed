#pragma once

#include "core/types.hpp"
#include <cstdint>
#include <vector>

namespace ActivePref {
namespace Analysis {

class Evaluation {
public:
    /**
     * Fraction of perturbed rewards that pass every test
     *
     * Rewards are drawn from N(true_reward, noise * I) and normalized; a
     * reward passes when it satisfies every half-space constraint. "About
     * equal" answers are ignored.
     * @param noise Variance of the perturbation
     */
    static double pass_rate(const Core::WeightVector& true_reward,
                            const std::vector<Core::PreferenceConstraint>& constraints,
                            double noise,
                            size_t n_rewards,
                            uint64_t seed);

    // Cosine similarity between estimate and truth
    static double alignment(const Core::WeightVector& estimate, const Core::WeightVector& true_reward);

    // Fraction of half-space constraints the reward satisfies
    static double agreement(const Core::WeightVector& reward,
                            const std::vector<Core::PreferenceConstraint>& constraints);
};

} // namespace Analysis
} // namespace ActivePref
