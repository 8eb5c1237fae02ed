#pragma once

#include "core/types.hpp"
#include "model/preference_model.hpp"
#include "sampling/belief.hpp"
#include "utils/logger.hpp"
#include <cstdint>
#include <random>
#include <string>
#include <vector>

namespace ActivePref {
namespace Sampling {

struct SamplerConfig {
    size_t burn_in = 1000;                      // Steps discarded before the first kept state
    size_t thin = 50;                           // Keep every thin-th state after burn-in
    double step_size = 0.1;                     // Std-dev of the Gaussian perturbation
    size_t num_chains = 1;                      // Independent chains, run in parallel
    size_t max_consecutive_rejections = 20000;  // Longer runs are reported as degenerate
    size_t max_init_attempts = 100000;          // Prior draws tried when no start state is known

    void validate() const;
};

struct SamplerStats {
    size_t proposals = 0;
    size_t accepted = 0;
    size_t chains = 0;
    size_t chains_seeded_from_previous = 0;

    double acceptance_rate() const {
        return proposals > 0 ? static_cast<double>(accepted) / proposals : 0.0;
    }
};

/**
 * Metropolis-Hastings sampler over the unit sphere.
 *
 * The prior is uniform on the sphere and the random-walk proposal
 * (perturb, then re-normalize) is symmetric, so a proposal is accepted
 * with probability min(1, likelihood ratio). Rejected proposals repeat the
 * current state, so every call returns exactly the requested number of
 * samples.
 *
 * Output depends only on (constraints, model, count, seed, previous belief):
 * chain c draws from its own stream derived from the seed and results are
 * concatenated in chain order.
 */
class PosteriorSampler {
public:
    explicit PosteriorSampler(SamplerConfig config = {});

    const SamplerConfig& config() const { return config_; }

    /**
     * Draw directions uniformly on the unit sphere
     * @param dimension Feature dimension D
     * @param num_samples M
     * @param seed Random seed
     */
    Belief sample_prior(size_t dimension, size_t num_samples, uint64_t seed) const;

    /**
     * Draw posterior samples given all recorded constraints
     * @param constraints Preference history (may be empty)
     * @param model Likelihood used for every constraint
     * @param dimension Feature dimension D
     * @param num_samples M, returned exactly
     * @param seed Random seed
     * @param previous Belief used to seed the chains, may be null
     * @throws Core::DegenerateChainError if no consistent start state exists
     *         or a chain stops accepting proposals
     */
    Belief sample(const std::vector<Core::PreferenceConstraint>& constraints,
                  const Model::PreferenceModel& model,
                  size_t dimension,
                  size_t num_samples,
                  uint64_t seed,
                  const Belief* previous = nullptr);

    const SamplerStats& last_stats() const { return last_stats_; }

private:
    struct ChainResult {
        std::vector<Core::WeightVector> samples;
        size_t proposals = 0;
        size_t accepted = 0;
        bool seeded_from_previous = false;
        bool failed = false;
        std::string error;
    };

    Core::WeightVector random_direction(size_t dimension, std::mt19937_64& rng) const;
    Core::WeightVector propose(const Core::WeightVector& current, std::mt19937_64& rng) const;

    void run_chain(const std::vector<Core::PreferenceConstraint>& constraints,
                   const Model::PreferenceModel& model,
                   Core::WeightVector start,
                   size_t count,
                   std::mt19937_64& rng,
                   ChainResult& result) const;

    SamplerConfig config_;
    SamplerStats last_stats_;
    Utils::ModuleLogger logger_;
};

} // namespace Sampling
} // namespace ActivePref
